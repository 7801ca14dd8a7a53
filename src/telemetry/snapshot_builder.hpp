/**
 * @file snapshot_builder.hpp
 * @brief Сборка снимка телеметрии
 *
 * Чистая функция от состояния моделей: кроме накопительных счётчиков,
 * которые передаются явно на вход и на выход, ничего не изменяет.
 *
 * Агрегаты (MHS av в SUMMARY) вычисляются из значений плат, а не
 * генерируются независимо, поэтому документ внутренне согласован.
 */

#pragma once

#include "status_snapshot.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"

namespace asicemu::telemetry {

/**
 * @brief Результат сборки
 */
struct BuildResult {
    StatusSnapshot snapshot;
    CumulativeCounters counters;
};

/**
 * @brief Сборщик снимков телеметрии
 */
class SnapshotBuilder {
public:
    SnapshotBuilder(const TelemetryConfig& telemetry,
                    const ThermalConfig& thermal,
                    const ShareTimingConfig& share_timing);

    /**
     * @brief Построить снимок
     *
     * @param thermal Состояние тепловой модели
     * @param fault Состояние модели отказов
     * @param domain Активный профиль питания
     * @param previous Счётчики предыдущего снимка
     * @param now Момент снимка
     * @param elapsed Время с запуска эмулятора
     * @param rng Генератор для разброса между платами
     */
    [[nodiscard]] BuildResult build(const emulation::ThermalState& thermal,
                                    const emulation::FaultProfile& fault,
                                    const emulation::DomainConfig& domain,
                                    const CumulativeCounters& previous,
                                    TimePoint now,
                                    Seconds elapsed,
                                    Rng& rng) const;

    /**
     * @brief Обороты вентилятора
     *
     * fan% / 100 * (4200 + max(0, T - 65) * 20) ± 50, в пределах [0, max_rpm].
     * Выключенный вентилятор (0%) даёт 0.
     */
    [[nodiscard]] static uint32_t fan_rpm(uint32_t fan_percent,
                                          double temp_c,
                                          uint32_t max_rpm,
                                          Rng& rng);

private:
    [[nodiscard]] CumulativeCounters advance_counters(const CumulativeCounters& previous,
                                                      const std::vector<double>& rates,
                                                      const emulation::FaultProfile& fault,
                                                      TimePoint now,
                                                      Rng& rng) const;

    TelemetryConfig telemetry_;
    ThermalConfig thermal_;
    ShareTimingConfig share_timing_;
};

} // namespace asicemu::telemetry
