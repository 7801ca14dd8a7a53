/**
 * @file http_server.cpp
 * @brief Реализация простого HTTP сервера
 */

#include "http_server.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <pthread.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <poll.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <sstream>
#include <mutex>
#include <vector>

namespace asicemu::http {

namespace {

/// Интервал опроса accept (мс)
constexpr int ACCEPT_POLL_MS = 100;

/// Сколько ждать рабочий поток после pthread_cancel (мс)
constexpr int CANCEL_WAIT_MS = 1000;

/// Максимальный размер строки запроса и заголовков
constexpr std::size_t MAX_HEADER_SIZE = 16 * 1024;

std::string to_lower(std::string_view value) {
    std::string lower;
    lower.reserve(value.size());
    for (char c : value) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

HttpMethod parse_method(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "DELETE") return HttpMethod::DELETE;
    if (method == "HEAD") return HttpMethod::HEAD;
    if (method == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

/**
 * @brief Результат чтения запроса из сокета
 */
enum class ReadStatus {
    Ok,
    Closed,      ///< Клиент закрыл соединение, не отправив запрос
    Timeout,
    TooLarge,
    Malformed
};

} // anonymous namespace

// =============================================================================
// HttpRequest
// =============================================================================

std::string HttpRequest::get_header(const std::string& name) const {
    // Case-insensitive поиск
    const std::string lower_name = to_lower(name);

    for (const auto& [key, value] : headers) {
        if (to_lower(key) == lower_name) {
            return value;
        }
    }

    return "";
}

std::optional<HttpRequest> parse_request(std::string_view raw) {
    // Разделяем заголовки и тело
    std::string_view head = raw;
    std::string_view body;
    auto head_end = raw.find("\r\n\r\n");
    if (head_end != std::string_view::npos) {
        head = raw.substr(0, head_end);
        body = raw.substr(head_end + 4);
    } else if ((head_end = raw.find("\n\n")) != std::string_view::npos) {
        head = raw.substr(0, head_end);
        body = raw.substr(head_end + 2);
    }

    HttpRequest request;
    std::istringstream stream{std::string(head)};
    std::string line;

    // Request line
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::istringstream request_line(line);
    std::string method, path, version;
    request_line >> method >> path >> version;
    if (method.empty() || path.empty()) {
        return std::nullopt;
    }

    request.method = parse_method(method);

    // Путь и query
    auto query_pos = path.find('?');
    if (query_pos != std::string::npos) {
        request.query = path.substr(query_pos + 1);
        request.path = path.substr(0, query_pos);
    } else {
        request.path = path;
    }

    // Headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) break;

        auto colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string name = line.substr(0, colon_pos);
            std::string value = line.substr(colon_pos + 1);

            // Trim whitespace
            while (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }
            while (!value.empty() && value.back() == ' ') {
                value.pop_back();
            }

            request.headers[name] = value;
        }
    }

    request.body = std::string(body);
    return request;
}

// =============================================================================
// HttpResponse
// =============================================================================

HttpResponse HttpResponse::json(const std::string& json_body) {
    return json(HttpStatus::OK, json_body);
}

HttpResponse HttpResponse::json(HttpStatus status, const std::string& json_body) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    response.body = json_body;
    return response;
}

HttpResponse HttpResponse::error(HttpStatus status, const std::string& message) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    response.body = nlohmann::json{{"error", message}}.dump();
    return response;
}

std::string HttpResponse::serialize() const {
    std::ostringstream ss;

    // Status line
    ss << "HTTP/1.1 " << static_cast<int>(status) << " " << get_status_text(status) << "\r\n";

    // Headers
    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }

    // Content-Length
    ss << "Content-Length: " << body.size() << "\r\n";

    // Connection
    ss << "Connection: close\r\n";

    // End of headers
    ss << "\r\n";

    // Body
    ss << body;

    return ss.str();
}

// =============================================================================
// HttpServer Implementation
// =============================================================================

struct HttpServer::Impl {
    HttpServerConfig config;

    // Сокет
    int server_fd{-1};
    std::atomic<uint16_t> bound_port{0};

    // Текущее соединение (для прерывания при остановке)
    int client_fd{-1};
    std::mutex client_mutex;

    // Состояние
    std::atomic<bool> running{false};

    // Завершение рабочего потока
    bool worker_exited{false};
    std::mutex exit_mutex;
    std::condition_variable exit_cv;

    // Статистика
    std::atomic<uint64_t> requests_count{0};
    std::atomic<uint64_t> errors_count{0};

    // Маршруты
    struct Route {
        HttpMethod method;
        std::string path;
        HttpHandler handler;
    };
    std::vector<Route> routes;
    std::mutex routes_mutex;

    // Поток обработки
    std::thread server_thread;

    explicit Impl(const HttpServerConfig& cfg) : config(cfg) {}

    /**
     * @brief Принятое соединение
     *
     * Публикует сокет для abort_client() и закрывает его в деструкторе,
     * в том числе при раскрутке стека после pthread_cancel.
     */
    class ClientConnection {
    public:
        ClientConnection(Impl& impl, int fd) : impl_(impl), fd_(fd) {
            std::lock_guard<std::mutex> lock(impl_.client_mutex);
            impl_.client_fd = fd_;
        }

        ~ClientConnection() {
            std::lock_guard<std::mutex> lock(impl_.client_mutex);
            impl_.client_fd = -1;
            ::close(fd_);
        }

        ClientConnection(const ClientConnection&) = delete;
        ClientConnection& operator=(const ClientConnection&) = delete;

        int fd() const noexcept { return fd_; }

    private:
        Impl& impl_;
        int fd_;
    };

    /**
     * @brief Отмечает выход рабочего потока, в том числе отменённого
     */
    class WorkerExit {
    public:
        explicit WorkerExit(Impl& impl) : impl_(impl) {}

        ~WorkerExit() {
            std::lock_guard<std::mutex> lock(impl_.exit_mutex);
            impl_.worker_exited = true;
            impl_.exit_cv.notify_all();
        }

        WorkerExit(const WorkerExit&) = delete;
        WorkerExit& operator=(const WorkerExit&) = delete;

    private:
        Impl& impl_;
    };

    bool wait_worker_exit(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(exit_mutex);
        return exit_cv.wait_for(lock, timeout, [this]() { return worker_exited; });
    }

    ~Impl() {
        close_socket();
    }

    void close_socket() {
        if (server_fd >= 0) {
            ::close(server_fd);
            server_fd = -1;
        }
    }

    bool create_socket() {
        server_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (server_fd < 0) {
            return false;
        }

        // Разрешить переиспользование адреса
        int opt = 1;
        ::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        return true;
    }

    bool bind_socket() {
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.port);

        if (config.bind_address == "0.0.0.0") {
            addr.sin_addr.s_addr = INADDR_ANY;
        } else {
            if (::inet_pton(AF_INET, config.bind_address.c_str(), &addr.sin_addr) <= 0) {
                return false;
            }
        }

        if (::bind(server_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            return false;
        }

        // Фактический порт (важно при port = 0)
        socklen_t len = sizeof(addr);
        if (::getsockname(server_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
            bound_port = ntohs(addr.sin_port);
        } else {
            bound_port = config.port;
        }

        return true;
    }

    bool listen_socket() {
        return ::listen(server_fd, static_cast<int>(config.max_connections)) == 0;
    }

    void server_loop() {
        struct pollfd pfd{};
        pfd.fd = server_fd;
        pfd.events = POLLIN;

        while (running) {
            int ret = ::poll(&pfd, 1, ACCEPT_POLL_MS);

            if (ret < 0) {
                if (errno == EINTR) continue;
                errors_count++;
                running = false;
                break;
            }

            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                struct sockaddr_in client_addr{};
                socklen_t client_len = sizeof(client_addr);

                int fd = ::accept4(server_fd,
                    reinterpret_cast<struct sockaddr*>(&client_addr), &client_len, SOCK_CLOEXEC);

                if (fd >= 0) {
                    ClientConnection connection(*this, fd);
                    handle_client(connection.fd());
                }
            }
        }
    }

    void abort_client() {
        std::lock_guard<std::mutex> lock(client_mutex);
        if (client_fd >= 0) {
            ::shutdown(client_fd, SHUT_RDWR);
        }
    }

    void handle_client(int fd) {
        // Таймаут на каждую операцию чтения и записи
        struct timeval tv{};
        tv.tv_sec = static_cast<time_t>(config.read_timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((config.read_timeout.count() % 1000) * 1000);
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        std::string raw;
        HttpResponse response;

        switch (read_request(fd, raw)) {
            case ReadStatus::Closed:
                errors_count++;
                return;
            case ReadStatus::Timeout:
                errors_count++;
                response = HttpResponse::error(HttpStatus::RequestTimeout, "Request timeout");
                break;
            case ReadStatus::TooLarge:
                errors_count++;
                response = HttpResponse::error(HttpStatus::PayloadTooLarge, "Request too large");
                break;
            case ReadStatus::Malformed:
                errors_count++;
                response = HttpResponse::error(HttpStatus::BadRequest, "Malformed request");
                break;
            case ReadStatus::Ok: {
                auto request = parse_request(raw);
                if (request) {
                    response = route_request(*request);
                } else {
                    errors_count++;
                    response = HttpResponse::error(HttpStatus::BadRequest, "Malformed request");
                }
                break;
            }
        }

        // Отправляем ответ
        if (!send_all(fd, response.serialize())) {
            errors_count++;
            return;
        }

        requests_count++;
    }

    ReadStatus read_request(int fd, std::string& raw) {
        const auto deadline = Clock::now() + config.read_timeout;
        std::size_t header_end = std::string::npos;
        std::size_t content_length = 0;
        char buffer[4096];

        while (true) {
            if (header_end != std::string::npos && raw.size() >= header_end + 4 + content_length) {
                return ReadStatus::Ok;
            }
            if (Clock::now() >= deadline) {
                return ReadStatus::Timeout;
            }

            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::Timeout;
                return ReadStatus::Closed;
            }
            if (n == 0) {
                return raw.empty() ? ReadStatus::Closed : ReadStatus::Malformed;
            }

            raw.append(buffer, static_cast<std::size_t>(n));

            if (header_end == std::string::npos) {
                header_end = raw.find("\r\n\r\n");
                if (header_end == std::string::npos) {
                    if (raw.size() > MAX_HEADER_SIZE) return ReadStatus::TooLarge;
                    continue;
                }

                auto head = parse_request(std::string_view(raw).substr(0, header_end + 4));
                if (!head) {
                    return ReadStatus::Malformed;
                }

                const std::string length = head->get_header("Content-Length");
                if (!length.empty()) {
                    auto [ptr, ec] = std::from_chars(length.data(), length.data() + length.size(), content_length);
                    if (ec != std::errc{} || ptr != length.data() + length.size()) {
                        return ReadStatus::Malformed;
                    }
                }
                if (content_length > config.max_body) {
                    return ReadStatus::TooLarge;
                }
            }
        }
    }

    bool send_all(int fd, const std::string& data) {
        std::size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    HttpResponse route_request(const HttpRequest& request) {
        HttpHandler handler;
        bool path_known = false;

        {
            std::lock_guard<std::mutex> lock(routes_mutex);
            for (const auto& route : routes) {
                if (route.path != request.path) continue;
                path_known = true;
                if (route.method == HttpMethod::UNKNOWN || route.method == request.method) {
                    handler = route.handler;
                    break;
                }
            }
        }

        if (!handler) {
            if (path_known) {
                return HttpResponse::error(HttpStatus::MethodNotAllowed, "Method not allowed");
            }
            return HttpResponse::error(HttpStatus::NotFound, "Not found");
        }

        try {
            return handler(request);
        } catch (const std::exception& e) {
            errors_count++;
            return HttpResponse::error(HttpStatus::InternalServerError, e.what());
        }
    }
};

// =============================================================================
// Публичный API
// =============================================================================

HttpServer::HttpServer(const HttpServerConfig& config)
    : impl_(std::make_shared<Impl>(config)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& path, HttpHandler handler) {
    route(HttpMethod::UNKNOWN, path, std::move(handler));
}

void HttpServer::route(HttpMethod method, const std::string& path, HttpHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->routes_mutex);
    impl_->routes.push_back({method, path, std::move(handler)});
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) {
    return impl_->route_request(request);
}

Result<void> HttpServer::start() {
    if (impl_->running) {
        return {};
    }

    if (!impl_->config.enabled) {
        return {};
    }

    if (!impl_->create_socket()) {
        return Err<void>(ErrorCode::NetworkSocketFailed,
            std::string("Не удалось создать сокет: ") + std::strerror(errno));
    }

    if (!impl_->bind_socket()) {
        const int err = errno;
        impl_->close_socket();
        return Err<void>(ErrorCode::NetworkBindFailed,
            "Не удалось привязать сокет к " + impl_->config.bind_address +
            ":" + std::to_string(impl_->config.port) + ": " + std::strerror(err));
    }

    if (!impl_->listen_socket()) {
        impl_->close_socket();
        return Err<void>(ErrorCode::NetworkListenFailed,
            "Не удалось начать прослушивание");
    }

    {
        std::lock_guard<std::mutex> lock(impl_->exit_mutex);
        impl_->worker_exited = false;
    }

    impl_->running = true;
    // Поток держит свою ссылку на Impl: после detach() она должна пережить сервер
    impl_->server_thread = std::thread([impl = impl_]() {
        Impl::WorkerExit exit_guard(*impl);
        impl->server_loop();
    });

    return {};
}

void HttpServer::stop(std::chrono::milliseconds grace) {
    impl_->running = false;

    if (impl_->server_thread.joinable()) {
        // Прерываем соединение, которое сейчас обслуживается
        impl_->abort_client();

        bool exited = impl_->wait_worker_exit(grace);

        if (!exited) {
            std::cerr << "[HttpServer] Рабочий поток не завершился за "
                      << grace.count() << " мс, принудительная отмена" << std::endl;
            ::pthread_cancel(impl_->server_thread.native_handle());
            exited = impl_->wait_worker_exit(std::chrono::milliseconds(CANCEL_WAIT_MS));
        }

        if (exited) {
            impl_->server_thread.join();
        } else {
            // Обработчик висит вне точки отмены
            std::cerr << "[HttpServer] Рабочий поток не отменился за "
                      << CANCEL_WAIT_MS << " мс, поток отсоединён" << std::endl;
            impl_->server_thread.detach();
        }
    }

    impl_->close_socket();
}

bool HttpServer::is_running() const noexcept {
    return impl_->running;
}

uint16_t HttpServer::get_port() const noexcept {
    const uint16_t bound = impl_->bound_port;
    return bound != 0 ? bound : impl_->config.port;
}

uint64_t HttpServer::get_requests_count() const noexcept {
    return impl_->requests_count;
}

uint64_t HttpServer::get_errors_count() const noexcept {
    return impl_->errors_count;
}

} // namespace asicemu::http
