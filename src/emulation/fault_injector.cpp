/**
 * @file fault_injector.cpp
 * @brief Реализация модели отказов
 */

#include "fault_injector.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace asicemu::emulation {

// =============================================================================
// Свободные функции
// =============================================================================

uint32_t fault_register(double temp_c,
                        std::span<const uint32_t> fan_rpm,
                        const std::optional<std::size_t>& silent_unit,
                        uint32_t voltage_mv,
                        uint32_t voltage_floor_mv) noexcept {
    uint32_t reg = 0;

    if (silent_unit.has_value()) {
        reg |= fault_bits::HASH_BOARD_ABSENT;
    }
    if (voltage_mv < voltage_floor_mv) {
        reg |= fault_bits::VOLTAGE_LOW;
    }
    if (temp_c > constants::FAULT_TEMP_THRESHOLD_C) {
        reg |= fault_bits::TEMP_OVER_85C;
    }
    if (std::any_of(fan_rpm.begin(), fan_rpm.end(), [](uint32_t rpm) { return rpm == 0; })) {
        reg |= fault_bits::FAN_FAILURE;
    }

    return reg;
}

double degraded_error_rate(const FaultProfile& profile,
                           Seconds uptime,
                           double temp_c,
                           const FaultConfig& config) noexcept {
    const double uptime_h = std::max(0.0, uptime.count()) / 3600.0;
    const double overheat = std::isfinite(temp_c)
        ? std::max(0.0, temp_c - config.thermal_optimum_c)
        : 0.0;

    const double rate = profile.base_nonce_error_rate
        * (1.0 + uptime_h * config.uptime_factor_per_hour)
        * (1.0 + overheat * config.thermal_factor_per_c);

    if (!std::isfinite(rate)) {
        return 1.0;
    }
    return std::clamp(rate, 0.0, 1.0);
}

// =============================================================================
// FaultInjector
// =============================================================================

FaultInjector::FaultInjector(const FaultConfig& config, TimePoint now)
    : config_(config) {
    profile_.nonce_error_rate = std::clamp(config_.nonce_error_rate, 0.0, 1.0);
    profile_.base_nonce_error_rate = profile_.nonce_error_rate;
    profile_.silent_unit = config_.initial_silent_unit;
    profile_.silence_started_at = now;
    profile_.silence_period = config_.silence_period;
}

bool FaultInjector::rotate_if_due(std::size_t unit_count, TimePoint now) noexcept {
    if (unit_count == 0) {
        return false;
    }
    if (now - profile_.silence_started_at < profile_.silence_period) {
        return false;
    }

    profile_.silent_unit = profile_.silent_unit
        ? (*profile_.silent_unit + 1) % unit_count
        : 0;
    profile_.silence_started_at = now;
    return true;
}

Decision FaultInjector::evaluate(std::size_t unit_count,
                                 std::size_t unit_id,
                                 uint64_t value,
                                 TimePoint now,
                                 Rng& rng) {
    if (unit_count == 0 || unit_id >= unit_count) {
        return Decision::drop(DropReason::InvalidUnit);
    }

    rotate_if_due(unit_count, now);

    if (profile_.nonce_error_rate > 0.0) {
        std::bernoulli_distribution nonce_error(profile_.nonce_error_rate);
        if (nonce_error(rng)) {
            return Decision::drop(DropReason::NonceError);
        }
    }

    if (profile_.silent_unit && *profile_.silent_unit == unit_id) {
        return Decision::drop(DropReason::SilentUnit);
    }

    return Decision::accept(value);
}

Result<void> FaultInjector::inject_fan_failure(std::size_t fan_id, std::size_t fan_count) {
    if (fan_id >= fan_count || fan_id >= constants::MAX_FAN_COUNT) {
        return Err<void>(ErrorCode::InvalidArgument,
            std::format("Нет вентилятора {} (всего {})", fan_id, fan_count));
    }
    profile_.failed_fans |= (1u << fan_id);
    return {};
}

Result<void> FaultInjector::clear_fan_failure(std::size_t fan_id, std::size_t fan_count) {
    if (fan_id >= fan_count || fan_id >= constants::MAX_FAN_COUNT) {
        return Err<void>(ErrorCode::InvalidArgument,
            std::format("Нет вентилятора {} (всего {})", fan_id, fan_count));
    }
    profile_.failed_fans &= ~(1u << fan_id);
    return {};
}

void FaultInjector::apply_degradation(Seconds uptime, double temp_c) noexcept {
    if (!config_.degradation_enabled) {
        return;
    }
    profile_.nonce_error_rate = std::max(
        profile_.nonce_error_rate,
        degraded_error_rate(profile_, uptime, temp_c, config_)
    );
}

} // namespace asicemu::emulation
