/**
 * @file fault_injector.hpp
 * @brief Стохастическая модель отказов хеш-плат
 *
 * Воспроизводит две характерные особенности реального L7:
 * - редкие аппаратные ошибки nonce (по умолчанию 0.005%);
 * - периодически "молчащая" хеш-плата, которая не отдаёт результаты.
 *
 * Генератор случайных чисел передаётся вызывающим кодом.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace asicemu::emulation {

/**
 * @brief Состояние модели отказов
 */
struct FaultProfile {
    /// @brief Вероятность ошибки nonce [0, 1]
    double nonce_error_rate{constants::DEFAULT_NONCE_ERROR_RATE};

    /// @brief Исходная вероятность ошибки nonce (база для деградации)
    double base_nonce_error_rate{constants::DEFAULT_NONCE_ERROR_RATE};

    /// @brief Текущая "молчащая" плата
    std::optional<std::size_t> silent_unit;

    /// @brief Начало текущего окна тишины
    TimePoint silence_started_at{};

    /// @brief Длительность окна тишины
    std::chrono::seconds silence_period{constants::DEFAULT_SILENCE_PERIOD_S};

    /// @brief Отказавшие вентиляторы (бит i - вентилятор i), показывают 0 RPM
    uint32_t failed_fans{0};

    /// @brief Биты регистра, выставленные вручную (fault_bits)
    uint32_t injected_faults{0};

    [[nodiscard]] bool fan_failed(std::size_t fan_id) const noexcept {
        return fan_id < 32 && (failed_fans & (1u << fan_id)) != 0;
    }
};

/**
 * @brief Причина отбрасывания результата
 */
enum class DropReason {
    None,
    NonceError,     ///< Аппаратная ошибка nonce
    SilentUnit,     ///< Плата в окне тишины
    InvalidUnit     ///< Номер платы вне диапазона
};

/**
 * @brief Решение по результату вычисления
 */
struct Decision {
    enum class Kind { Accept, Dropped };

    Kind kind{Kind::Accept};

    /// @brief Принятое значение (только для Accept)
    uint64_t value{0};

    DropReason reason{DropReason::None};

    [[nodiscard]] bool accepted() const noexcept { return kind == Kind::Accept; }

    [[nodiscard]] static Decision accept(uint64_t v) noexcept {
        return {Kind::Accept, v, DropReason::None};
    }

    [[nodiscard]] static Decision drop(DropReason r) noexcept {
        return {Kind::Dropped, 0, r};
    }
};

// =============================================================================
// Регистр отказов (Antminer)
// =============================================================================

namespace fault_bits {
    inline constexpr uint32_t HASH_BOARD_ABSENT = 0x01;
    inline constexpr uint32_t VOLTAGE_LOW = 0x02;
    inline constexpr uint32_t TEMP_OVER_85C = 0x04;
    inline constexpr uint32_t FAN_FAILURE = 0x08;
}

/**
 * @brief Собрать регистр отказов
 *
 * @param temp_c Температура кристалла
 * @param fan_rpm Обороты вентиляторов
 * @param silent_unit Текущая "молчащая" плата
 * @param voltage_mv Активное напряжение
 * @param voltage_floor_mv Порог VOLTAGE_LOW
 */
[[nodiscard]] uint32_t fault_register(double temp_c,
                                      std::span<const uint32_t> fan_rpm,
                                      const std::optional<std::size_t>& silent_unit,
                                      uint32_t voltage_mv,
                                      uint32_t voltage_floor_mv) noexcept;

/**
 * @brief Error rate с учётом деградации
 *
 * base * (1 + uptime_h * uptime_factor) * (1 + max(0, temp - optimum) * thermal_factor),
 * где base = profile.base_nonce_error_rate. Результат ограничен диапазоном [0, 1]
 * и зависит только от аргументов.
 */
[[nodiscard]] double degraded_error_rate(const FaultProfile& profile,
                                         Seconds uptime,
                                         double temp_c,
                                         const FaultConfig& config) noexcept;

// =============================================================================
// FaultInjector
// =============================================================================

/**
 * @brief Инжектор отказов
 *
 * Не потокобезопасен: доступ сериализует оркестратор.
 */
class FaultInjector {
public:
    /**
     * @brief Создать инжектор
     *
     * @param config Параметры модели
     * @param now Начало первого окна тишины
     */
    FaultInjector(const FaultConfig& config, TimePoint now);

    /**
     * @brief Решить, принимать ли результат платы
     *
     * Сначала при необходимости сдвигается окно тишины, затем
     * разыгрывается ошибка nonce, затем проверяется "молчащая" плата.
     * Некорректный номер платы даёт Dropped без изменения ротации.
     */
    [[nodiscard]] Decision evaluate(std::size_t unit_count,
                                    std::size_t unit_id,
                                    uint64_t value,
                                    TimePoint now,
                                    Rng& rng);

    /**
     * @brief Сдвинуть окно тишины, если период истёк
     *
     * @return true если "молчащая" плата сменилась
     */
    bool rotate_if_due(std::size_t unit_count, TimePoint now) noexcept;

    /**
     * @brief Поднять error rate до значения с учётом деградации
     *
     * Значение никогда не уменьшается. Повторный вызов с теми же
     * uptime и температурой ничего не меняет.
     */
    void apply_degradation(Seconds uptime, double temp_c) noexcept;

    // =========================================================================
    // Ручное внесение отказов
    // =========================================================================

    /**
     * @brief Отказ вентилятора: он молча показывает 0 RPM
     *
     * @return InvalidArgument если fan_id >= fan_count
     */
    [[nodiscard]] Result<void> inject_fan_failure(std::size_t fan_id, std::size_t fan_count);

    /**
     * @brief Вернуть вентилятор в работу
     */
    [[nodiscard]] Result<void> clear_fan_failure(std::size_t fan_id, std::size_t fan_count);

    /**
     * @brief Выставить биты регистра отказов
     *
     * Действуют до clear_fault() поверх вычисленных битов.
     */
    void inject_fault(uint32_t bits) noexcept { profile_.injected_faults |= bits; }

    /**
     * @brief Снять выставленные вручную биты
     *
     * Вычисляемые биты (температура, вентиляторы, плата, напряжение)
     * пересчитываются в каждом снимке и этим не снимаются.
     */
    void clear_fault(uint32_t bits) noexcept { profile_.injected_faults &= ~bits; }

    /// @brief Копия состояния
    [[nodiscard]] FaultProfile profile() const noexcept { return profile_; }

    /// @brief Параметры модели
    [[nodiscard]] const FaultConfig& config() const noexcept { return config_; }

private:
    FaultConfig config_;
    FaultProfile profile_;
};

} // namespace asicemu::emulation
