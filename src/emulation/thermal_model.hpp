/**
 * @file thermal_model.hpp
 * @brief Тепловая RC-модель кристалла
 *
 * Однозвенная RC-цепь: температура стремится к P * R_th с постоянной
 * времени tau = R_th * C_th. Обновления приходят нерегулярно, поэтому
 * большой интервал разбивается на шаги не длиннее max_step.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

namespace asicemu::emulation {

/**
 * @brief Снимок состояния тепловой модели
 */
struct ThermalState {
    /// @brief Температура кристалла (°C)
    double junction_temp{constants::DEFAULT_INITIAL_TEMP_C};

    /// @brief Момент последнего обновления
    TimePoint last_update{};

    /// @brief Тепловое сопротивление (K/W)
    double r_thermal{constants::DEFAULT_R_THERMAL};

    /// @brief Теплоёмкость (J/K)
    double c_thermal{constants::DEFAULT_C_THERMAL};
};

/**
 * @brief Тепловая модель
 *
 * Не потокобезопасна: владелец (оркестратор) сериализует доступ.
 * Ни один метод не бросает исключений.
 */
class ThermalModel {
public:
    /**
     * @brief Создать модель
     *
     * @param config Параметры модели
     * @param now Момент, с которого отсчитывается первый интервал
     */
    ThermalModel(const ThermalConfig& config, TimePoint now);

    /**
     * @brief Интегрировать до момента now при входной мощности power_watts
     *
     * Отрицательная или нечисловая мощность считается нулевой.
     * Если now не позже последнего обновления, вызов ничего не делает.
     */
    void update(double power_watts, TimePoint now) noexcept;

    /**
     * @brief Прогреть модель при запуске
     *
     * Сдвигает last_update на now и делает один шаг max_step
     * при заданной мощности.
     */
    void prime(double power_watts, TimePoint now) noexcept;

    /**
     * @brief Показание датчика: температура плюс равномерный шум
     */
    [[nodiscard]] double read(Rng& rng) const;

    /**
     * @brief Показание датчика по снимку состояния
     *
     * Используется сборщиком телеметрии вне блокировки оркестратора.
     */
    [[nodiscard]] static double sample(const ThermalState& state,
                                       const ThermalConfig& config,
                                       Rng& rng);

    /// @brief Текущая температура без шума
    [[nodiscard]] double junction_temp() const noexcept { return state_.junction_temp; }

    /// @brief Копия состояния
    [[nodiscard]] ThermalState state() const noexcept { return state_; }

    /// @brief Параметры модели
    [[nodiscard]] const ThermalConfig& config() const noexcept { return config_; }

private:
    void step(double target, double dt_seconds, double tau) noexcept;
    [[nodiscard]] double clamp_temp(double temp) const noexcept;

    ThermalConfig config_;
    ThermalState state_;
};

} // namespace asicemu::emulation
