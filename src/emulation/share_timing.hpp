/**
 * @file share_timing.hpp
 * @brief Контроллер тайминга отправки шар
 *
 * Подгоняет интервалы между шарами под распределение реального
 * устройства: нормальное распределение с нижней границей.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

namespace asicemu::emulation {

/**
 * @brief Состояние контроллера тайминга
 */
struct ShareTimingState {
    TimePoint last_submission{};
    std::chrono::milliseconds mean_interval{constants::DEFAULT_SHARE_MEAN_MS};
    std::chrono::milliseconds jitter_stddev{constants::DEFAULT_SHARE_STDDEV_MS};
    std::chrono::milliseconds floor_interval{constants::DEFAULT_SHARE_FLOOR_MS};
};

/**
 * @brief Контроллер тайминга шар
 *
 * Два последовательных true никогда не ближе floor_interval.
 * Первый вызов после создания может разрешить отправку сразу.
 */
class ShareTimingController {
public:
    ShareTimingController(const ShareTimingConfig& config, uint64_t seed);

    /**
     * @brief Можно ли отправить шару в момент now
     *
     * При true запоминает now как момент последней отправки.
     */
    [[nodiscard]] bool should_submit(TimePoint now);

    /// @brief Копия состояния
    [[nodiscard]] ShareTimingState state() const noexcept { return state_; }

private:
    [[nodiscard]] Seconds draw_target();

    ShareTimingState state_;
    Rng rng_;
};

} // namespace asicemu::emulation
