/**
 * @file thermal_model.cpp
 * @brief Реализация тепловой RC-модели
 */

#include "thermal_model.hpp"

#include <algorithm>
#include <cmath>

namespace asicemu::emulation {

namespace {

/// После стольких постоянных времени остаток экспоненты пренебрежимо мал
constexpr double SETTLE_TAU_MULTIPLE = 10.0;

[[nodiscard]] double sanitize_power(double power_watts) noexcept {
    if (!std::isfinite(power_watts) || power_watts < 0.0) {
        return 0.0;
    }
    return power_watts;
}

} // anonymous namespace

ThermalModel::ThermalModel(const ThermalConfig& config, TimePoint now)
    : config_(config) {
    state_.last_update = now;
    state_.r_thermal = config_.r_thermal;
    state_.c_thermal = config_.c_thermal;
    state_.junction_temp = clamp_temp(config_.initial_temp_c);
}

void ThermalModel::update(double power_watts, TimePoint now) noexcept {
    if (now <= state_.last_update) {
        return;
    }

    const double power = sanitize_power(power_watts);
    const double target = power * config_.r_thermal;
    const double tau = config_.r_thermal * config_.c_thermal;

    double remaining = std::chrono::duration_cast<Seconds>(now - state_.last_update).count();
    const double max_step = std::chrono::duration_cast<Seconds>(config_.max_step).count();

    // Очень длинный разрыв: модель уже в равновесии
    if (tau > 0.0 && remaining >= SETTLE_TAU_MULTIPLE * tau) {
        state_.junction_temp = clamp_temp(target);
        state_.last_update = now;
        return;
    }

    while (remaining > 0.0) {
        const double dt = max_step > 0.0 ? std::min(remaining, max_step) : remaining;
        step(target, dt, tau);
        remaining -= dt;
    }

    state_.last_update = now;
}

void ThermalModel::prime(double power_watts, TimePoint now) noexcept {
    const double power = sanitize_power(power_watts);
    const double tau = config_.r_thermal * config_.c_thermal;
    const double dt = std::chrono::duration_cast<Seconds>(config_.max_step).count();

    step(power * config_.r_thermal, dt, tau);
    state_.last_update = std::max(state_.last_update, now);
}

double ThermalModel::read(Rng& rng) const {
    return sample(state_, config_, rng);
}

double ThermalModel::sample(const ThermalState& state, const ThermalConfig& config, Rng& rng) {
    double reading = state.junction_temp;
    if (config.noise_c > 0.0) {
        std::uniform_real_distribution<double> noise(-config.noise_c, config.noise_c);
        reading += noise(rng);
    }
    return std::clamp(reading, config.ambient_floor_c, config.ceiling_c);
}

void ThermalModel::step(double target, double dt_seconds, double tau) noexcept {
    // Один шаг Эйлера не перескакивает цель
    const double factor = tau > 0.0 ? std::clamp(dt_seconds / tau, 0.0, 1.0) : 1.0;
    state_.junction_temp = clamp_temp(
        state_.junction_temp + (target - state_.junction_temp) * factor
    );
}

double ThermalModel::clamp_temp(double temp) const noexcept {
    if (!std::isfinite(temp)) {
        return config_.ambient_floor_c;
    }
    return std::clamp(temp, config_.ambient_floor_c, config_.ceiling_c);
}

} // namespace asicemu::emulation
