/**
 * @file health_handler.hpp
 * @brief HTTP обработчик для /health endpoint
 *
 * Возвращает состояние эмулятора в формате JSON.
 */

#pragma once

#include "http_server.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace asicemu::http {

// =============================================================================
// Данные для Health Check
// =============================================================================

/**
 * @brief Провайдер данных для health check
 */
struct HealthData {
    /// @brief Время запуска эмулятора
    std::chrono::steady_clock::time_point start_time;

    /// @brief Состояние оркестратора
    std::string state{"Uninitialized"};

    /// @brief Эмуляция активна
    bool hybrid_active{false};

    /// @brief Температура кристалла (°C)
    double thermal_temp_c{0.0};

    /// @brief Активный профиль питания
    std::string current_domain;

    /// @brief Производитель нативного канала или "UNKNOWN"
    std::string gpu_vendor{"UNKNOWN"};

    /// @brief Порт API (0 если API недоступен)
    uint16_t api_port{0};

    /// @brief Текущая вероятность ошибки nonce
    double nonce_error_rate{0.0};

    /// @brief Средний интервал между шарами (секунды)
    double share_interval{0.0};

    /// @brief "Молчащая" хеш-плата
    std::optional<std::size_t> silent_unit;

    /// @brief Регистр отказов
    uint32_t fault_register{0};

    /// @brief Здорова ли система
    bool is_healthy{true};

    /// @brief Сообщение о статусе
    std::string status_message{"healthy"};
};

/**
 * @brief Функция получения данных для health check
 */
using HealthDataProvider = std::function<HealthData()>;

// =============================================================================
// Health Handler
// =============================================================================

/**
 * @brief Сформировать ответ /health
 *
 * 200 если эмулятор активен, иначе 503.
 */
inline HttpResponse render_health(const HealthData& data) {
    // Вычисляем uptime
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        now - data.start_time
    );

    nlohmann::ordered_json json{
        {"status", data.status_message},
        {"uptime_seconds", uptime.count()},
        {"state", data.state},
        {"hybrid_active", data.hybrid_active},
        {"thermal_temp_c", data.thermal_temp_c},
        {"current_domain", data.current_domain},
        {"gpu_vendor", data.gpu_vendor},
        {"api_port", data.api_port},
        {"nonce_error_rate", data.nonce_error_rate},
        {"share_interval", data.share_interval},
        {"silent_unit", nullptr},
        {"fault_register", data.fault_register}
    };
    if (data.silent_unit) {
        json["silent_unit"] = *data.silent_unit;
    }

    return HttpResponse::json(
        data.is_healthy ? HttpStatus::OK : HttpStatus::ServiceUnavailable,
        json.dump()
    );
}

/**
 * @brief Создать обработчик /health endpoint
 *
 * @param provider Функция получения данных
 * @return HttpHandler Обработчик
 */
inline HttpHandler create_health_handler(HealthDataProvider provider) {
    return [provider = std::move(provider)](const HttpRequest& /*request*/) -> HttpResponse {
        return render_health(provider());
    };
}

} // namespace asicemu::http
