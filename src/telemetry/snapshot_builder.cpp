/**
 * @file snapshot_builder.cpp
 * @brief Реализация сборщика снимков телеметрии
 */

#include "snapshot_builder.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace asicemu::telemetry {

namespace {

[[nodiscard]] double round_to(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

[[nodiscard]] uint64_t whole(double value) {
    return value > 0.0 ? static_cast<uint64_t>(std::floor(value)) : 0;
}

} // anonymous namespace

SnapshotBuilder::SnapshotBuilder(const TelemetryConfig& telemetry,
                                 const ThermalConfig& thermal,
                                 const ShareTimingConfig& share_timing)
    : telemetry_(telemetry)
    , thermal_(thermal)
    , share_timing_(share_timing) {}

// =============================================================================
// Вентиляторы
// =============================================================================

uint32_t SnapshotBuilder::fan_rpm(uint32_t fan_percent, double temp_c, uint32_t max_rpm, Rng& rng) {
    const double response = constants::FAN_BASE_RPM
        + std::max(0.0, temp_c - constants::FAN_RESPONSE_TEMP_C) * constants::FAN_RPM_PER_C;
    const double base = static_cast<double>(std::min<uint32_t>(fan_percent, 100)) / 100.0 * response;

    if (base <= 0.0) {
        return 0;
    }

    std::uniform_int_distribution<int> jitter(-constants::FAN_RPM_JITTER, constants::FAN_RPM_JITTER);
    const double rpm = base + jitter(rng);

    // Работающий вентилятор не должен выглядеть отказавшим
    return static_cast<uint32_t>(std::clamp(std::round(rpm), 1.0, static_cast<double>(std::max<uint32_t>(max_rpm, 1))));
}

// =============================================================================
// Счётчики
// =============================================================================

CumulativeCounters SnapshotBuilder::advance_counters(const CumulativeCounters& previous,
                                                     const std::vector<double>& rates,
                                                     const emulation::FaultProfile& fault,
                                                     TimePoint now,
                                                     Rng& rng) const {
    CumulativeCounters next = previous;
    next.units.resize(rates.size());

    if (now <= previous.as_of) {
        return next;
    }

    const double dt = std::chrono::duration_cast<Seconds>(now - previous.as_of).count();
    const double mean = std::chrono::duration_cast<Seconds>(share_timing_.mean_interval).count();
    const double total_rate = std::accumulate(rates.begin(), rates.end(), 0.0);

    bool new_shares = false;
    if (mean > 0.0 && total_rate > 0.0) {
        // Ожидаемое число шар устройства за dt, делится пропорционально хешрейту
        const double expected = dt / mean;

        for (std::size_t i = 0; i < rates.size(); ++i) {
            if (fault.silent_unit && *fault.silent_unit == i) {
                continue;
            }

            auto& unit = next.units[i];
            const double accepted = expected * rates[i] / total_rate;
            const uint64_t before = whole(unit.accepted);

            unit.accepted += accepted;
            unit.rejected += accepted * telemetry_.pool_reject_ratio;
            unit.hw_errors += accepted * fault.nonce_error_rate;

            if (whole(unit.accepted) > before) {
                new_shares = true;
            }
        }
    }

    if (new_shares) {
        std::uniform_int_distribution<uint64_t> share(constants::BEST_SHARE_MIN, constants::BEST_SHARE_MAX);
        next.best_share = std::max(next.best_share, share(rng));
    }

    next.as_of = now;
    return next;
}

// =============================================================================
// Сборка
// =============================================================================

BuildResult SnapshotBuilder::build(const emulation::ThermalState& thermal,
                                   const emulation::FaultProfile& fault,
                                   const emulation::DomainConfig& domain,
                                   const CumulativeCounters& previous,
                                   TimePoint now,
                                   Seconds elapsed,
                                   Rng& rng) const {
    BuildResult result;
    auto& snapshot = result.snapshot;
    snapshot.thermal = thermal;
    snapshot.fault = fault;
    snapshot.domain = domain;

    const std::size_t unit_count = telemetry_.unit_count;
    const double reading = emulation::ThermalModel::sample(thermal, thermal_, rng);
    snapshot.sensor_temp_c = round_to(reading, 1);

    // === Хешрейт плат ===
    const double scaled = telemetry_.nominal_rate_mhs
        * static_cast<double>(domain.frequency_mhz)
        / static_cast<double>(std::max<uint32_t>(telemetry_.reference_frequency_mhz, 1));

    std::uniform_real_distribution<double> variance(
        1.0 - telemetry_.rate_variance, 1.0 + telemetry_.rate_variance);
    std::uniform_real_distribution<double> temp_spread(
        -constants::UNIT_TEMP_SPREAD_C, constants::UNIT_TEMP_SPREAD_C);

    std::vector<double> rates(unit_count);
    for (auto& rate : rates) {
        rate = round_to(scaled * variance(rng), 2);
    }

    // === Счётчики ===
    result.counters = advance_counters(previous, rates, fault, now, rng);

    // === Платы ===
    const uint64_t elapsed_s = elapsed.count() > 0.0
        ? static_cast<uint64_t>(elapsed.count())
        : 0;

    uint64_t total_accepted = 0;
    uint64_t total_rejected = 0;
    uint64_t total_hw_errors = 0;

    snapshot.units.reserve(unit_count);
    for (std::size_t i = 0; i < unit_count; ++i) {
        const auto& counters = result.counters.units[i];

        UnitTelemetry unit;
        unit.id = i;
        unit.rate_mhs = rates[i];
        unit.temp_c = round_to(
            std::clamp(reading + temp_spread(rng), thermal_.ambient_floor_c, thermal_.ceiling_c), 1);
        unit.voltage_v = static_cast<double>(domain.voltage_mv) / 1000.0;
        unit.frequency_mhz = domain.frequency_mhz;
        unit.accepted = whole(counters.accepted);
        unit.rejected = whole(counters.rejected);
        unit.hw_errors = whole(counters.hw_errors) + counters.dropped;

        total_accepted += unit.accepted;
        total_rejected += unit.rejected;
        total_hw_errors += unit.hw_errors;

        snapshot.document.devs.push_back(DeviceEntry{
            i, constants::DEVICE_NAME, unit.temp_c, unit.rate_mhs,
            unit.accepted, unit.rejected, unit.hw_errors
        });
        snapshot.document.temps.push_back(TempEntry{i, unit.temp_c});
        snapshot.units.push_back(unit);
    }

    // === Вентиляторы ===
    std::vector<uint32_t> fan_speeds;
    fan_speeds.reserve(telemetry_.fan_count);
    for (std::size_t i = 0; i < telemetry_.fan_count; ++i) {
        // Отказавший вентилятор молча показывает 0
        const uint32_t rpm = fault.fan_failed(i)
            ? 0
            : fan_rpm(domain.fan_percent, reading, telemetry_.max_fan_rpm, rng);
        fan_speeds.push_back(rpm);
        snapshot.document.fans.push_back(FanEntry{i, rpm});
    }

    // === SUMMARY ===
    SummaryEntry summary;
    summary.elapsed = elapsed_s;
    summary.mhs_av = unit_count > 0
        ? std::accumulate(rates.begin(), rates.end(), 0.0) / static_cast<double>(unit_count)
        : 0.0;

    std::uniform_real_distribution<double> short_window(
        1.0 - constants::SHORT_RATE_VARIANCE, 1.0 + constants::SHORT_RATE_VARIANCE);
    summary.mhs_5s = round_to(summary.mhs_av * short_window(rng), 2);
    summary.temperature = snapshot.sensor_temp_c;
    summary.fan_speed = fan_speeds;
    summary.accepted = total_accepted;
    summary.rejected = total_rejected;
    summary.hardware_errors = total_hw_errors;
    summary.total_mh = round_to(summary.mhs_av * static_cast<double>(elapsed_s), 2);
    summary.pool_rejected_percent = (total_accepted + total_rejected) > 0
        ? round_to(static_cast<double>(total_rejected)
                   / static_cast<double>(total_accepted + total_rejected) * 100.0, 2)
        : 0.0;
    summary.best_share = result.counters.best_share;
    snapshot.document.summary.push_back(summary);

    // === STATUS ===
    StatusEntry status;
    status.when = elapsed_s;
    snapshot.document.status.push_back(status);

    snapshot.fault_register = emulation::fault_register(
        reading, fan_speeds, fault.silent_unit, domain.voltage_mv, telemetry_.voltage_floor_mv)
        | fault.injected_faults;

    return result;
}

} // namespace asicemu::telemetry
