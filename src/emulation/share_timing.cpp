/**
 * @file share_timing.cpp
 * @brief Реализация контроллера тайминга шар
 */

#include "share_timing.hpp"

#include <algorithm>

namespace asicemu::emulation {

ShareTimingController::ShareTimingController(const ShareTimingConfig& config, uint64_t seed)
    : rng_(seed) {
    state_.mean_interval = config.mean_interval;
    state_.jitter_stddev = config.jitter_stddev;
    state_.floor_interval = config.floor_interval;
}

bool ShareTimingController::should_submit(TimePoint now) {
    const Seconds elapsed = std::chrono::duration_cast<Seconds>(now - state_.last_submission);
    if (elapsed >= draw_target()) {
        state_.last_submission = now;
        return true;
    }
    return false;
}

Seconds ShareTimingController::draw_target() {
    const double mean = std::chrono::duration_cast<Seconds>(state_.mean_interval).count();
    const double stddev = std::chrono::duration_cast<Seconds>(state_.jitter_stddev).count();
    const double floor = std::chrono::duration_cast<Seconds>(state_.floor_interval).count();

    double target = mean;
    if (stddev > 0.0) {
        std::normal_distribution<double> jitter(mean, stddev);
        target = jitter(rng_);
    }

    return Seconds{std::max(floor, target)};
}

} // namespace asicemu::emulation
