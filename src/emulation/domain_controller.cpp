/**
 * @file domain_controller.cpp
 * @brief Реализация контроллера доменов питания
 */

#include "domain_controller.hpp"

#include "../monitoring/alerter.hpp"

#include <format>
#include <iostream>

namespace asicemu::emulation {

DomainController::DomainController(ProfileTable profiles, DomainProfile initial)
    : profiles_(std::move(profiles)) {
    auto it = profiles_.find(initial);
    if (it != profiles_.end()) {
        active_ = std::make_shared<const DomainConfig>(it->second);
    } else {
        active_ = std::make_shared<const DomainConfig>();
    }
}

DomainController::~DomainController() {
    stop_forwarding();
}

// =============================================================================
// Проверка возможностей
// =============================================================================

Result<void> DomainController::probe(const hw::ChannelProber& prober) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (probed_) {
            return probe_result_;
        }
    }

    // Запуск утилит вне блокировки
    Result<std::unique_ptr<hw::NativeControlChannel>> found =
        Err<std::unique_ptr<hw::NativeControlChannel>>(ErrorCode::ProbeToolMissing);
    if (prober) {
        found = prober();
    }

    Result<void> result;
    std::string vendor_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (probed_) {
            return probe_result_;
        }
        probed_ = true;

        if (found && *found && !stopping_) {
            channel_ = std::shared_ptr<hw::NativeControlChannel>(std::move(*found));
            vendor_name = std::string(channel_->vendor());
            probe_result_ = Result<void>{};
            forward_thread_ = std::thread([this]() { forward_loop(); });
        } else if (found && *found) {
            probe_result_ = Err<void>(ErrorCode::InvalidState, "Контроллер остановлен");
        } else if (found) {
            probe_result_ = Err<void>(ErrorCode::ProbeToolMissing);
        } else {
            probe_result_ = std::unexpected(found.error());
        }
        result = probe_result_;
    }

    // Сообщаем один раз, после снятия блокировки
    if (result) {
        monitoring::Alerter::instance().alert_native_channel_found(vendor_name);
    } else {
        monitoring::Alerter::instance().alert_probe_failed(result.error());
    }
    return result;
}

bool DomainController::has_native_channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ != nullptr;
}

std::string DomainController::vendor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ ? std::string(channel_->vendor()) : std::string("UNKNOWN");
}

// =============================================================================
// Выбор профиля
// =============================================================================

Result<DomainConfig> DomainController::select(std::string_view profile_name) {
    auto profile = profile_from_string(profile_name);
    if (!profile) {
        return Err<DomainConfig>(
            ErrorCode::ConfigUnknownProfile,
            std::format("Неизвестный профиль: {}", profile_name)
        );
    }

    auto it = profiles_.find(*profile);
    if (it == profiles_.end()) {
        return Err<DomainConfig>(
            ErrorCode::ConfigUnknownProfile,
            std::format("Профиль отсутствует в таблице: {}", profile_name)
        );
    }

    auto next = std::make_shared<const DomainConfig>(it->second);
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = next;
    return *next;
}

DomainConfig DomainController::select_custom(DomainConfig config) {
    config.name = DomainProfile::Custom;
    auto next = std::make_shared<const DomainConfig>(config);

    std::lock_guard<std::mutex> lock(mutex_);
    active_ = next;
    return config;
}

void DomainController::forward() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!channel_ || stopping_) {
            return;
        }
        ++requested_generation_;
    }
    forward_cv_.notify_all();
}

bool DomainController::wait_forwarded(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return forward_cv_.wait_for(lock, timeout, [this]() {
        return forwarded_generation_ >= requested_generation_ || !forward_thread_.joinable();
    });
}

void DomainController::stop_forwarding() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        worker = std::move(forward_thread_);
    }
    forward_cv_.notify_all();

    if (worker.joinable()) {
        worker.join();
    }
    forward_cv_.notify_all();
}

void DomainController::forward_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        forward_cv_.wait(lock, [this]() {
            return stopping_ || requested_generation_ > forwarded_generation_;
        });
        if (stopping_) {
            return;
        }

        // Берём профиль, активный сейчас, а не на момент запроса
        const uint64_t generation = requested_generation_;
        const DomainConfig config = *active_;
        auto channel = channel_;

        lock.unlock();
        auto result = channel->apply(config);
        if (!result) {
            std::cerr << "[DomainController] " << channel->vendor()
                      << ": " << result.error().message << std::endl;
            monitoring::Alerter::instance().alert_native_forward_failed(channel->vendor(), result.error());
        }
        lock.lock();

        forwarded_generation_ = generation;
        forward_cv_.notify_all();
    }
}

Result<void> DomainController::apply(std::string_view profile_name) {
    auto selected = select(profile_name);
    if (!selected) {
        return std::unexpected(selected.error());
    }

    forward();
    monitoring::Alerter::instance().alert_profile_applied(to_string(selected->name));
    return {};
}

void DomainController::apply_custom(const DomainConfig& config) {
    auto selected = select_custom(config);
    forward();
    monitoring::Alerter::instance().alert_profile_applied(to_string(selected.name));
}

// =============================================================================
// Состояние
// =============================================================================

DomainConfig DomainController::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return *active_;
}

} // namespace asicemu::emulation
