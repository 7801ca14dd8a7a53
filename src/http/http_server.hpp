/**
 * @file http_server.hpp
 * @brief Простой HTTP сервер для API эмулятора
 *
 * Минималистичный HTTP/1.1 сервер для:
 * - /cgi-bin/get_miner_status.cgi - телеметрия в формате прошивки
 * - /cgi-bin/set_miner_conf.cgi - запись конфигурации
 * - /health - состояние эмулятора
 *
 * Соединения обслуживаются последовательно одним рабочим потоком.
 */

#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace asicemu::http {

// =============================================================================
// HTTP типы
// =============================================================================

/**
 * @brief HTTP методы
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    UNKNOWN
};

/**
 * @brief HTTP статус коды
 */
enum class HttpStatus {
    OK = 200,
    BadRequest = 400,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    InternalServerError = 500,
    ServiceUnavailable = 503
};

/**
 * @brief Получить текст статуса
 */
[[nodiscard]] constexpr std::string_view get_status_text(HttpStatus status) noexcept {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::BadRequest: return "Bad Request";
        case HttpStatus::NotFound: return "Not Found";
        case HttpStatus::MethodNotAllowed: return "Method Not Allowed";
        case HttpStatus::RequestTimeout: return "Request Timeout";
        case HttpStatus::PayloadTooLarge: return "Payload Too Large";
        case HttpStatus::InternalServerError: return "Internal Server Error";
        case HttpStatus::ServiceUnavailable: return "Service Unavailable";
        default: return "Unknown";
    }
}

/**
 * @brief HTTP запрос
 */
struct HttpRequest {
    /// @brief Метод
    HttpMethod method{HttpMethod::GET};

    /// @brief Путь (например, "/health")
    std::string path;

    /// @brief Query string (без ?)
    std::string query;

    /// @brief Заголовки
    std::unordered_map<std::string, std::string> headers;

    /// @brief Тело запроса
    std::string body;

    /// @brief Получить заголовок (case-insensitive)
    [[nodiscard]] std::string get_header(const std::string& name) const;
};

/**
 * @brief Разобрать запрос (строка запроса, заголовки, тело)
 *
 * @param raw Полный текст запроса
 * @return nullopt если нет строки запроса
 */
[[nodiscard]] std::optional<HttpRequest> parse_request(std::string_view raw);

/**
 * @brief HTTP ответ
 */
struct HttpResponse {
    /// @brief Статус
    HttpStatus status{HttpStatus::OK};

    /// @brief Заголовки
    std::unordered_map<std::string, std::string> headers;

    /// @brief Тело ответа
    std::string body;

    /**
     * @brief Создать ответ OK с JSON
     */
    static HttpResponse json(const std::string& json_body);

    /**
     * @brief Создать JSON ответ с произвольным статусом
     */
    static HttpResponse json(HttpStatus status, const std::string& json_body);

    /**
     * @brief Создать ответ с ошибкой
     */
    static HttpResponse error(HttpStatus status, const std::string& message);

    /**
     * @brief Сериализовать в HTTP строку
     */
    [[nodiscard]] std::string serialize() const;
};

// =============================================================================
// HTTP Handler
// =============================================================================

/**
 * @brief Тип обработчика HTTP запроса
 */
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// =============================================================================
// HTTP Server
// =============================================================================

/**
 * @brief Конфигурация HTTP сервера
 */
struct HttpServerConfig {
    /// @brief Адрес для прослушивания
    std::string bind_address{"127.0.0.1"};

    /// @brief Порт (0 - выбрать свободный)
    uint16_t port{constants::DEFAULT_API_PORT};

    /// @brief Очередь ожидающих соединений
    uint32_t max_connections{16};

    /// @brief Таймаут чтения запроса
    std::chrono::milliseconds read_timeout{constants::DEFAULT_READ_TIMEOUT_MS};

    /// @brief Максимальный размер тела
    std::size_t max_body{constants::MAX_REQUEST_BODY};

    /// @brief Включён ли сервер
    bool enabled{true};
};

/**
 * @brief Простой HTTP сервер
 *
 * Один рабочий поток: accept с опросом раз в 100 мс, затем
 * чтение запроса с таймаутом, обработчик и ответ.
 */
class HttpServer {
public:
    /**
     * @brief Создать сервер с конфигурацией
     */
    explicit HttpServer(const HttpServerConfig& config);

    ~HttpServer();

    // Запрещаем копирование
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // ==========================================================================
    // Маршрутизация
    // ==========================================================================

    /**
     * @brief Зарегистрировать обработчик для пути (любой метод)
     *
     * @param path Путь (например, "/health")
     * @param handler Функция обработки
     */
    void route(const std::string& path, HttpHandler handler);

    /**
     * @brief Зарегистрировать обработчик для метода и пути
     *
     * Запрос к известному пути с другим методом получает 405.
     */
    void route(HttpMethod method, const std::string& path, HttpHandler handler);

    /**
     * @brief Обработать запрос без сети
     *
     * Та же маршрутизация, что и у рабочего потока.
     */
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request);

    // ==========================================================================
    // Управление
    // ==========================================================================

    /**
     * @brief Запустить сервер
     *
     * @return NetworkSocketFailed / NetworkBindFailed / NetworkListenFailed
     */
    [[nodiscard]] Result<void> start();

    /**
     * @brief Остановить сервер
     *
     * Прерывает текущее соединение и ждёт рабочий поток не дольше grace.
     * Если поток не завершился, он принудительно отменяется; сокет
     * соединения при этом закрывается. Поток, не дошедший до точки
     * отмены за секунду, отсоединяется, и stop() возвращается.
     */
    void stop(std::chrono::milliseconds grace =
                  std::chrono::milliseconds(constants::DEFAULT_SHUTDOWN_GRACE_MS));

    /**
     * @brief Проверить, запущен ли сервер
     */
    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Получить порт (фактический после start)
     */
    [[nodiscard]] uint16_t get_port() const noexcept;

    // ==========================================================================
    // Статистика
    // ==========================================================================

    /**
     * @brief Получить количество обработанных запросов
     */
    [[nodiscard]] uint64_t get_requests_count() const noexcept;

    /**
     * @brief Получить количество ошибок
     */
    [[nodiscard]] uint64_t get_errors_count() const noexcept;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace asicemu::http
