/**
 * @file test_health_endpoint.cpp
 * @brief Тесты для HTTP сервера и health endpoint
 */

#include <gtest/gtest.h>

#include "http/http_server.hpp"
#include "http/health_handler.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

namespace asicemu::tests {

// =============================================================================
// Тесты HTTP Response
// =============================================================================

class HttpResponseTest : public ::testing::Test {};

/**
 * @brief Тест: создание JSON ответа
 */
TEST_F(HttpResponseTest, JsonResponse) {
    auto response = http::HttpResponse::json("{\"status\":\"ok\"}");

    EXPECT_EQ(response.status, http::HttpStatus::OK);
    EXPECT_EQ(response.headers["Content-Type"], "application/json");
    EXPECT_EQ(response.body, "{\"status\":\"ok\"}");
}

/**
 * @brief Тест: создание error ответа
 */
TEST_F(HttpResponseTest, ErrorResponse) {
    auto response = http::HttpResponse::error(http::HttpStatus::NotFound, "Not \"found\"");

    EXPECT_EQ(response.status, http::HttpStatus::NotFound);
    EXPECT_EQ(response.headers["Content-Type"], "application/json");

    // Сообщение экранируется
    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["error"], "Not \"found\"");
}

/**
 * @brief Тест: сериализация ответа
 */
TEST_F(HttpResponseTest, Serialize) {
    auto response = http::HttpResponse::json(http::HttpStatus::BadRequest, "{\"test\":true}");
    std::string serialized = response.serialize();

    // Проверяем наличие HTTP строки статуса
    EXPECT_NE(serialized.find("HTTP/1.1 400 Bad Request"), std::string::npos);

    // Проверяем Content-Length
    EXPECT_NE(serialized.find("Content-Length: 13"), std::string::npos);

    // Проверяем Content-Type
    EXPECT_NE(serialized.find("Content-Type: application/json"), std::string::npos);

    // Проверяем тело
    EXPECT_NE(serialized.find("\r\n\r\n{\"test\":true}"), std::string::npos);
}

// =============================================================================
// Тесты HTTP Status
// =============================================================================

TEST(HttpStatusTest, GetStatusText) {
    EXPECT_EQ(http::get_status_text(http::HttpStatus::OK), "OK");
    EXPECT_EQ(http::get_status_text(http::HttpStatus::NotFound), "Not Found");
    EXPECT_EQ(http::get_status_text(http::HttpStatus::MethodNotAllowed), "Method Not Allowed");
    EXPECT_EQ(http::get_status_text(http::HttpStatus::PayloadTooLarge), "Payload Too Large");
    EXPECT_EQ(http::get_status_text(http::HttpStatus::ServiceUnavailable), "Service Unavailable");
    EXPECT_EQ(http::get_status_text(http::HttpStatus::InternalServerError), "Internal Server Error");
}

// =============================================================================
// Тесты разбора запроса
// =============================================================================

TEST(ParseRequestTest, PostWithBody) {
    auto request = http::parse_request(
        "POST /cgi-bin/set_miner_conf.cgi?x=1 HTTP/1.1\r\n"
        "Host: 192.168.1.50\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 12\r\n"
        "\r\n"
        "{\"fan\": 100}");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, http::HttpMethod::POST);
    EXPECT_EQ(request->path, "/cgi-bin/set_miner_conf.cgi");
    EXPECT_EQ(request->query, "x=1");
    EXPECT_EQ(request->get_header("content-type"), "application/json");
    EXPECT_EQ(request->body, "{\"fan\": 100}");
}

/**
 * @brief Тест: тело с переводами строк не обрезается
 */
TEST(ParseRequestTest, MultilineBodyPreserved) {
    auto request = http::parse_request(
        "POST /x HTTP/1.1\r\n\r\n{\n  \"freq\": 450\n}\n");

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->body, "{\n  \"freq\": 450\n}\n");
}

TEST(ParseRequestTest, Malformed) {
    EXPECT_FALSE(http::parse_request("").has_value());
    EXPECT_FALSE(http::parse_request("GET\r\n\r\n").has_value());
}

// =============================================================================
// Тесты Health Handler
// =============================================================================

class HealthHandlerTest : public ::testing::Test {};

/**
 * @brief Тест: health handler с провайдером данных
 */
TEST_F(HealthHandlerTest, HealthHandlerWithProvider) {
    auto handler = http::create_health_handler([]() {
        http::HealthData data;
        data.start_time = std::chrono::steady_clock::now();
        data.state = "Active";
        data.hybrid_active = true;
        data.thermal_temp_c = 71.4;
        data.current_domain = "BALANCED";
        data.gpu_vendor = "AMD";
        data.api_port = 8080;
        data.nonce_error_rate = 5e-5;
        data.share_interval = 5.2;
        data.silent_unit = 2;
        data.fault_register = 0x01;
        data.is_healthy = true;
        data.status_message = "healthy";
        return data;
    });

    http::HttpRequest request;
    request.method = http::HttpMethod::GET;
    request.path = "/health";

    auto response = handler(request);

    EXPECT_EQ(response.status, http::HttpStatus::OK);

    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["state"], "Active");
    EXPECT_EQ(json["hybrid_active"], true);
    EXPECT_EQ(json["current_domain"], "BALANCED");
    EXPECT_EQ(json["gpu_vendor"], "AMD");
    EXPECT_EQ(json["api_port"], 8080);
    EXPECT_EQ(json["silent_unit"], 2);
    EXPECT_EQ(json["fault_register"], 1);
    EXPECT_TRUE(json.contains("uptime_seconds"));
    EXPECT_TRUE(json.contains("thermal_temp_c"));
    EXPECT_TRUE(json.contains("nonce_error_rate"));
    EXPECT_TRUE(json.contains("share_interval"));
}

/**
 * @brief Тест: unhealthy status
 */
TEST_F(HealthHandlerTest, UnhealthyStatus) {
    auto handler = http::create_health_handler([]() {
        http::HealthData data;
        data.start_time = std::chrono::steady_clock::now();
        data.state = "Stopped";
        data.is_healthy = false;
        data.status_message = "inactive";
        return data;
    });

    http::HttpRequest request;
    auto response = handler(request);

    EXPECT_EQ(response.status, http::HttpStatus::ServiceUnavailable);

    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["status"], "inactive");
    EXPECT_TRUE(json["silent_unit"].is_null());
}

// =============================================================================
// Тесты HTTP Server Config
// =============================================================================

TEST(HttpServerConfigTest, DefaultValues) {
    http::HttpServerConfig config;

    EXPECT_EQ(config.bind_address, "127.0.0.1");
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.max_connections, 16u);
    EXPECT_EQ(config.max_body, 64u * 1024u);
    EXPECT_TRUE(config.enabled);
}

// =============================================================================
// Тесты HTTP Server (сокет)
// =============================================================================

namespace {

/**
 * @brief Отправить сырой запрос и прочитать ответ целиком
 */
std::string roundtrip(uint16_t port, const std::string& raw) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return {};
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    std::string response;
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
        ::send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);

        char buffer[4096];
        ssize_t n;
        while ((n = ::recv(fd, buffer, sizeof(buffer), 0)) > 0) {
            response.append(buffer, static_cast<std::size_t>(n));
        }
    }

    ::close(fd);
    return response;
}

/**
 * @brief Число открытых дескрипторов процесса
 */
std::size_t open_fd_count() {
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
        ++count;
    }
    return count;
}

} // anonymous namespace

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.port = 0;
        config_.read_timeout = std::chrono::milliseconds(500);
        config_.max_body = 128;
    }

    http::HttpServerConfig config_;
};

/**
 * @brief Тест: порт 0 выбирает свободный порт
 */
TEST_F(HttpServerTest, EphemeralPortAndRouting) {
    http::HttpServer server(config_);
    server.route(http::HttpMethod::GET, "/health", [](const http::HttpRequest&) {
        return http::HttpResponse::json("{\"ok\":true}");
    });

    ASSERT_TRUE(server.start().has_value());
    ASSERT_NE(server.get_port(), 0);
    EXPECT_TRUE(server.is_running());

    auto ok = roundtrip(server.get_port(), "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_NE(ok.find("HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_NE(ok.find("{\"ok\":true}"), std::string::npos);

    auto missing = roundtrip(server.get_port(), "GET /nope HTTP/1.1\r\n\r\n");
    EXPECT_NE(missing.find("HTTP/1.1 404"), std::string::npos);

    server.stop();
    EXPECT_FALSE(server.is_running());
    EXPECT_GE(server.get_requests_count(), 2u);
}

TEST_F(HttpServerTest, BodyTooLarge) {
    http::HttpServer server(config_);
    server.route(http::HttpMethod::POST, "/conf", [](const http::HttpRequest&) {
        return http::HttpResponse::json("{}");
    });
    ASSERT_TRUE(server.start().has_value());

    auto response = roundtrip(server.get_port(),
        "POST /conf HTTP/1.1\r\nContent-Length: 100000\r\n\r\n{}");
    EXPECT_NE(response.find("HTTP/1.1 413"), std::string::npos);

    server.stop();
}

/**
 * @brief Тест: клиент, не дославший тело, получает 408
 */
TEST_F(HttpServerTest, SlowClientTimesOut) {
    http::HttpServer server(config_);
    server.route(http::HttpMethod::POST, "/conf", [](const http::HttpRequest&) {
        return http::HttpResponse::json("{}");
    });
    ASSERT_TRUE(server.start().has_value());

    auto response = roundtrip(server.get_port(),
        "POST /conf HTTP/1.1\r\nContent-Length: 50\r\n\r\n{\"freq\"");
    EXPECT_NE(response.find("HTTP/1.1 408"), std::string::npos);

    server.stop();
}

/**
 * @brief Тест: исключение обработчика превращается в 500
 */
TEST_F(HttpServerTest, HandlerExceptionIsInternalError) {
    http::HttpServer server(config_);
    server.route("/boom", [](const http::HttpRequest&) -> http::HttpResponse {
        throw std::runtime_error("boom");
    });

    http::HttpRequest request;
    request.path = "/boom";
    auto response = server.dispatch(request);

    EXPECT_EQ(response.status, http::HttpStatus::InternalServerError);
    EXPECT_EQ(server.get_errors_count(), 1u);
}

/**
 * @brief Тест: stop() отменяет зависший обработчик за ограниченное время
 *        и закрывает сокет соединения
 */
TEST_F(HttpServerTest, StopCancelsStuckHandler) {
    std::atomic<bool> entered{false};

    http::HttpServer server(config_);
    server.route("/slow", [&entered](const http::HttpRequest&) {
        entered = true;
        std::this_thread::sleep_for(std::chrono::seconds(30));
        return http::HttpResponse::json("{}");
    });

    const std::size_t fds_before = open_fd_count();
    ASSERT_TRUE(server.start().has_value());

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.get_port());
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    ASSERT_EQ(::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);

    const std::string raw = "GET /slow HTTP/1.1\r\nHost: x\r\n\r\n";
    ::send(fd, raw.data(), raw.size(), MSG_NOSIGNAL);

    const auto wait_until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!entered && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(entered);

    const auto begin = std::chrono::steady_clock::now();
    server.stop(std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_FALSE(server.is_running());

    // Сервер закрыл свою сторону, ответа не будет
    char byte = 0;
    EXPECT_LE(::recv(fd, &byte, 1, 0), 0);
    ::close(fd);

    EXPECT_EQ(open_fd_count(), fds_before);
}

TEST_F(HttpServerTest, StopWithoutStart) {
    http::HttpServer server(config_);
    server.stop();
    EXPECT_FALSE(server.is_running());
}

} // namespace asicemu::tests
