/**
 * @file miner_api.hpp
 * @brief HTTP API эмулируемого устройства
 *
 * Пути и форматы повторяют веб-интерфейс прошивки Antminer:
 * - GET  /cgi-bin/get_miner_status.cgi - снимок телеметрии
 * - POST /cgi-bin/set_miner_conf.cgi   - {freq, volt, fan, power-strict}
 * - GET  /health                       - состояние эмулятора
 *
 * Аутентификации нет: реальное устройство доверяет локальной сети.
 */

#pragma once

#include "health_handler.hpp"
#include "http_server.hpp"
#include "../core/types.hpp"
#include "../telemetry/status_snapshot.hpp"

#include <optional>
#include <string_view>

namespace asicemu::http {

// =============================================================================
// Запрос set_miner_conf.cgi
// =============================================================================

/**
 * @brief Допустимые диапазоны полей set_miner_conf.cgi
 */
namespace conf_limits {
    inline constexpr double FREQ_MIN_MHZ = 100.0;
    inline constexpr double FREQ_MAX_MHZ = 1000.0;
    inline constexpr double VOLT_MIN_MV = 600.0;
    inline constexpr double VOLT_MAX_MV = 1500.0;
    inline constexpr double FAN_MIN_PERCENT = 0.0;
    inline constexpr double FAN_MAX_PERCENT = 100.0;
    inline constexpr double POWER_MIN_W = 0.0;
    inline constexpr double POWER_MAX_W = 10000.0;
}

/**
 * @brief Проверенный запрос записи конфигурации
 */
struct MinerConfRequest {
    /// @brief Частота чипов (МГц)
    uint32_t freq_mhz{0};

    /// @brief Напряжение (мВ)
    uint32_t volt_mv{0};

    /// @brief Скорость вентиляторов (%)
    uint32_t fan_percent{0};

    /// @brief Лимит мощности (поле "power-strict", необязательное)
    std::optional<double> power_limit_w;
};

/**
 * @brief Разобрать и проверить тело set_miner_conf.cgi
 *
 * Поля freq, volt, fan обязательны, power-strict - нет. Числа
 * принимаются как JSON числа или как строки с числом.
 *
 * @return MinerConfRequest или ValidationMalformedJson /
 *         ValidationMissingField / ValidationOutOfRange
 */
[[nodiscard]] Result<MinerConfRequest> parse_miner_conf(std::string_view body);

// =============================================================================
// Источник телеметрии
// =============================================================================

/**
 * @brief Состояние, которое API читает и изменяет
 *
 * Реализуется оркестратором; сервер получает ссылку при создании.
 */
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    /// @brief Свежий снимок телеметрии
    [[nodiscard]] virtual telemetry::StatusSnapshot snapshot() = 0;

    /// @brief Применить проверенный запрос записи
    [[nodiscard]] virtual Result<void> apply_miner_conf(const MinerConfRequest& request) = 0;

    /// @brief Данные для /health
    [[nodiscard]] virtual HealthData health() = 0;
};

// =============================================================================
// TelemetryApiServer
// =============================================================================

/**
 * @brief HTTP сервер API устройства
 */
class TelemetryApiServer {
public:
    /**
     * @brief Создать сервер и зарегистрировать маршруты
     *
     * @param config Конфигурация HTTP сервера
     * @param source Источник телеметрии (должен пережить сервер)
     */
    TelemetryApiServer(const HttpServerConfig& config, TelemetrySource& source);

    ~TelemetryApiServer();

    TelemetryApiServer(const TelemetryApiServer&) = delete;
    TelemetryApiServer& operator=(const TelemetryApiServer&) = delete;

    /// @brief Запустить рабочий поток
    [[nodiscard]] Result<void> start();

    /// @brief Остановить рабочий поток в пределах grace
    void stop(std::chrono::milliseconds grace);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept;

    /// @brief Маршрутизация без сети
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request);

    // =========================================================================
    // Обработчики
    // =========================================================================

    [[nodiscard]] HttpResponse handle_status(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_conf(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_health(const HttpRequest& request);

private:
    TelemetrySource& source_;
    HttpServer server_;
};

} // namespace asicemu::http
