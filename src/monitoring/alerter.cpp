/**
 * @file alerter.cpp
 * @brief Реализация журнала событий
 */

#include "alerter.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace asicemu::monitoring {

// =============================================================================
// Singleton
// =============================================================================

Alerter& Alerter::instance() {
    static Alerter instance;
    return instance;
}

Alerter::Alerter() = default;

// =============================================================================
// Конфигурация
// =============================================================================

void Alerter::configure(const AlerterConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void Alerter::set_callback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

// =============================================================================
// Общие алерты
// =============================================================================

void Alerter::alert(AlertLevel level, std::string_view message) {
    AlerterConfig config;
    AlertCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        callback = callback_;
    }

    // Проверяем уровень
    if (level < config.log_level) {
        return;
    }

    // Увеличиваем счётчики
    alerts_count_++;
    if (level == AlertLevel::Critical) {
        critical_count_++;
    }

    // Выводим в консоль
    if (config.console_output) {
        log_to_console(level, message, config.color);
    }

    if (callback) {
        callback(level, message);
    }
}

// =============================================================================
// Предопределённые алерты
// =============================================================================

void Alerter::alert_probe_failed(const Error& error) {
    if (!should_send("probe_failed")) return;

    std::ostringstream ss;
    ss << "Нативное управление недоступно (" << error.message
       << "), работаем в режиме симуляции";
    alert(AlertLevel::Warning, ss.str());
}

void Alerter::alert_native_channel_found(std::string_view vendor) {
    std::ostringstream ss;
    ss << "Найден нативный канал управления: " << vendor;
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_native_forward_failed(std::string_view vendor, const Error& error) {
    std::string key = "native_forward_" + std::string(vendor);
    if (!should_send(key)) return;

    std::ostringstream ss;
    ss << "Ошибка нативного канала " << vendor << ": " << error.message;
    alert(AlertLevel::Warning, ss.str());
}

void Alerter::alert_api_unavailable(const Error& error) {
    if (!should_send("api_unavailable")) return;

    std::ostringstream ss;
    ss << "HTTP API недоступен: " << error.message << ", телеметрия только в процессе";
    alert(AlertLevel::Critical, ss.str());
}

void Alerter::alert_api_started(const std::string& address, uint16_t port) {
    std::ostringstream ss;
    ss << "HTTP API запущен на " << address << ":" << port;
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_profile_applied(std::string_view profile) {
    // Смена профиля - всегда отправляем (без дедупликации)
    std::ostringstream ss;
    ss << "Применён профиль питания: " << profile;
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_high_temperature(double temperature) {
    if (!should_send("high_temperature")) return;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    ss << "Высокая температура: " << temperature << "°C";
    alert(AlertLevel::Warning, ss.str());
}

void Alerter::alert_fan_failure(std::size_t fan_id) {
    std::string key = "fan_failure_" + std::to_string(fan_id);
    if (!should_send(key)) return;

    std::ostringstream ss;
    ss << "Отказ вентилятора " << fan_id << ": 0 RPM";
    alert(AlertLevel::Critical, ss.str());
}

void Alerter::alert_unit_silenced(std::size_t unit_id) {
    std::string key = "unit_silenced_" + std::to_string(unit_id);
    if (!should_send(key)) return;

    std::ostringstream ss;
    ss << "Хеш-плата " << unit_id << " в окне тишины";
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_state_changed(std::string_view from, std::string_view to) {
    std::ostringstream ss;
    ss << "Состояние эмулятора: " << from << " -> " << to;
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_invalid_power(double watts) {
    if (!should_send("invalid_power")) return;

    std::ostringstream ss;
    ss << "Отклонена некорректная мощность: " << watts << " Вт";
    alert(AlertLevel::Warning, ss.str());
}

// =============================================================================
// Статистика
// =============================================================================

uint64_t Alerter::get_alerts_count() const noexcept {
    return alerts_count_;
}

uint64_t Alerter::get_critical_count() const noexcept {
    return critical_count_;
}

void Alerter::reset_stats() {
    alerts_count_ = 0;
    critical_count_ = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    last_alerts_.clear();
}

// =============================================================================
// Приватные методы
// =============================================================================

bool Alerter::should_send(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    auto it = last_alerts_.find(key);

    if (it != last_alerts_.end()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            now - it->second
        );

        if (elapsed.count() < static_cast<long>(config_.dedup_interval_seconds)) {
            return false;
        }
    }

    last_alerts_[key] = now;
    return true;
}

void Alerter::log_to_console(AlertLevel level, std::string_view message, bool color) {
    // Получаем текущее время
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::localtime_r(&time, &tm);

    // Формируем вывод
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << alert_level_to_string(level) << "] ";
    ss << message;

    auto& out = level == AlertLevel::Critical ? std::cerr : std::cout;
    if (!color) {
        out << ss.str() << std::endl;
        return;
    }

    // Выводим с цветом в зависимости от уровня
    switch (level) {
        case AlertLevel::Info:
            out << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case AlertLevel::Warning:
            out << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case AlertLevel::Critical:
            out << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace asicemu::monitoring
