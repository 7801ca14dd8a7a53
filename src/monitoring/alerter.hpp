/**
 * @file alerter.hpp
 * @brief Централизованный журнал событий эмулятора
 *
 * Предоставляет:
 * - Предопределённые сообщения для типичных ситуаций эмулятора
 * - Дедупликацию повторяющихся сообщений
 * - Callback для перехвата сообщений (используется в тестах)
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <string_view>

namespace asicemu::monitoring {

// =============================================================================
// Уровни алертов
// =============================================================================

/**
 * @brief Уровень алерта
 */
enum class AlertLevel {
    Info,      ///< Информационное сообщение
    Warning,   ///< Предупреждение
    Critical   ///< Критическая ситуация
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view alert_level_to_string(AlertLevel level) noexcept {
    switch (level) {
        case AlertLevel::Info:     return "INFO";
        case AlertLevel::Warning:  return "WARNING";
        case AlertLevel::Critical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Уровень из строки конфигурации ("info", "warning", "critical")
 */
[[nodiscard]] constexpr std::optional<AlertLevel> alert_level_from_string(std::string_view name) noexcept {
    if (name == "info") return AlertLevel::Info;
    if (name == "warning") return AlertLevel::Warning;
    if (name == "critical") return AlertLevel::Critical;
    return std::nullopt;
}

// =============================================================================
// Callback
// =============================================================================

/**
 * @brief Callback для обработки алертов
 *
 * @param level Уровень алерта
 * @param message Сообщение
 */
using AlertCallback = std::function<void(AlertLevel level, std::string_view message)>;

// =============================================================================
// Alerter
// =============================================================================

/**
 * @brief Конфигурация Alerter
 */
struct AlerterConfig {
    /// @brief Минимальный уровень для логирования
    AlertLevel log_level{AlertLevel::Info};

    /// @brief Включить вывод в консоль
    bool console_output{true};

    /// @brief ANSI цвета
    bool color{true};

    /// @brief Минимальный интервал между одинаковыми алертами (секунды)
    uint32_t dedup_interval_seconds{60};
};

/**
 * @brief Журнал событий
 *
 * Один экземпляр на процесс: все компоненты эмулятора пишут сюда.
 */
class Alerter {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Alerter& instance();

    // Запрещаем копирование
    Alerter(const Alerter&) = delete;
    Alerter& operator=(const Alerter&) = delete;

    // =========================================================================
    // Конфигурация
    // =========================================================================

    /**
     * @brief Установить конфигурацию
     */
    void configure(const AlerterConfig& config);

    /**
     * @brief Установить callback
     */
    void set_callback(AlertCallback callback);

    // =========================================================================
    // Общие алерты
    // =========================================================================

    /**
     * @brief Отправить алерт
     *
     * @param level Уровень
     * @param message Сообщение
     */
    void alert(AlertLevel level, std::string_view message);

    // =========================================================================
    // Предопределённые алерты
    // =========================================================================

    /**
     * @brief Нативная утилита управления не найдена или падает
     *
     * Эмулятор продолжает работу в режиме симуляции.
     */
    void alert_probe_failed(const Error& error);

    /**
     * @brief Найден нативный канал управления
     *
     * @param vendor Производитель ("AMD", "NVIDIA")
     */
    void alert_native_channel_found(std::string_view vendor);

    /**
     * @brief Ошибка передачи параметров в нативный канал
     */
    void alert_native_forward_failed(std::string_view vendor, const Error& error);

    /**
     * @brief Порт API недоступен
     */
    void alert_api_unavailable(const Error& error);

    /**
     * @brief API запущен
     */
    void alert_api_started(const std::string& address, uint16_t port);

    /**
     * @brief Применён профиль питания
     */
    void alert_profile_applied(std::string_view profile);

    /**
     * @brief Высокая температура
     *
     * @param temperature Температура в градусах Цельсия
     */
    void alert_high_temperature(double temperature);

    /**
     * @brief Отказ вентилятора
     */
    void alert_fan_failure(std::size_t fan_id);

    /**
     * @brief Хеш-плата ушла в окно тишины
     */
    void alert_unit_silenced(std::size_t unit_id);

    /**
     * @brief Смена состояния оркестратора
     */
    void alert_state_changed(std::string_view from, std::string_view to);

    /**
     * @brief Некорректная мощность от вызывающего кода
     */
    void alert_invalid_power(double watts);

    // =========================================================================
    // Статистика
    // =========================================================================

    /**
     * @brief Получить количество отправленных алертов
     */
    [[nodiscard]] uint64_t get_alerts_count() const noexcept;

    /**
     * @brief Получить количество critical алертов
     */
    [[nodiscard]] uint64_t get_critical_count() const noexcept;

    /**
     * @brief Сбросить статистику
     */
    void reset_stats();

private:
    Alerter();
    ~Alerter() = default;

    /**
     * @brief Проверка дедупликации
     *
     * @param key Ключ алерта
     * @return true если алерт можно отправить
     */
    bool should_send(const std::string& key);

    /**
     * @brief Вывод в консоль
     */
    void log_to_console(AlertLevel level, std::string_view message, bool color);

    // Конфигурация
    AlerterConfig config_;

    // Callback
    AlertCallback callback_;

    // Дедупликация
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_alerts_;
    std::mutex mutex_;

    // Статистика
    std::atomic<uint64_t> alerts_count_{0};
    std::atomic<uint64_t> critical_count_{0};
};

} // namespace asicemu::monitoring
