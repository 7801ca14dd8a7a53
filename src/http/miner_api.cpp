/**
 * @file miner_api.cpp
 * @brief Реализация HTTP API устройства
 */

#include "miner_api.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <format>

namespace asicemu::http {

namespace {

/**
 * @brief Прочитать числовое поле (число или строка с числом)
 *
 * @return nullopt если поля нет
 */
Result<std::optional<double>> read_number(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<double>{};
    }

    double value = 0.0;
    if (it->is_number()) {
        value = it->get<double>();
    } else if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return Err<std::optional<double>>(
                ErrorCode::ValidationMalformedJson,
                std::format("Поле '{}' не является числом", key)
            );
        }
    } else {
        return Err<std::optional<double>>(
            ErrorCode::ValidationMalformedJson,
            std::format("Поле '{}' не является числом", key)
        );
    }

    if (!std::isfinite(value)) {
        return Err<std::optional<double>>(
            ErrorCode::ValidationOutOfRange,
            std::format("Поле '{}' не является конечным числом", key)
        );
    }
    return std::optional<double>{value};
}

Result<double> read_required(const nlohmann::json& object, const char* key,
                             double min, double max) {
    auto value = read_number(object, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!value->has_value()) {
        return Err<double>(
            ErrorCode::ValidationMissingField,
            std::format("Отсутствует поле '{}'", key)
        );
    }
    if (**value < min || **value > max) {
        return Err<double>(
            ErrorCode::ValidationOutOfRange,
            std::format("Поле '{}' вне диапазона [{}, {}]", key, min, max)
        );
    }
    return **value;
}

HttpResponse conf_response(HttpStatus status, bool success, const std::string& message) {
    nlohmann::ordered_json json{
        {"success", success},
        {"message", message}
    };
    return HttpResponse::json(status, json.dump());
}

} // anonymous namespace

// =============================================================================
// parse_miner_conf
// =============================================================================

Result<MinerConfRequest> parse_miner_conf(std::string_view body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return Err<MinerConfRequest>(ErrorCode::ValidationMalformedJson,
                                     "Тело запроса не является JSON объектом");
    }

    auto freq = read_required(json, "freq", conf_limits::FREQ_MIN_MHZ, conf_limits::FREQ_MAX_MHZ);
    if (!freq) return std::unexpected(freq.error());

    auto volt = read_required(json, "volt", conf_limits::VOLT_MIN_MV, conf_limits::VOLT_MAX_MV);
    if (!volt) return std::unexpected(volt.error());

    auto fan = read_required(json, "fan", conf_limits::FAN_MIN_PERCENT, conf_limits::FAN_MAX_PERCENT);
    if (!fan) return std::unexpected(fan.error());

    auto power = read_number(json, "power-strict");
    if (!power) return std::unexpected(power.error());

    MinerConfRequest request;
    request.freq_mhz = static_cast<uint32_t>(std::lround(*freq));
    request.volt_mv = static_cast<uint32_t>(std::lround(*volt));
    request.fan_percent = static_cast<uint32_t>(std::lround(*fan));

    if (power->has_value()) {
        if (**power < conf_limits::POWER_MIN_W || **power > conf_limits::POWER_MAX_W) {
            return Err<MinerConfRequest>(
                ErrorCode::ValidationOutOfRange,
                std::format("Поле 'power-strict' вне диапазона [{}, {}]",
                            conf_limits::POWER_MIN_W, conf_limits::POWER_MAX_W)
            );
        }
        request.power_limit_w = **power;
    }

    return request;
}

// =============================================================================
// TelemetryApiServer
// =============================================================================

TelemetryApiServer::TelemetryApiServer(const HttpServerConfig& config, TelemetrySource& source)
    : source_(source)
    , server_(config) {
    server_.route(HttpMethod::GET, constants::MINER_STATUS_PATH,
        [this](const HttpRequest& request) { return handle_status(request); });
    server_.route(HttpMethod::POST, constants::MINER_CONF_PATH,
        [this](const HttpRequest& request) { return handle_conf(request); });
    server_.route(HttpMethod::GET, constants::HEALTH_PATH,
        [this](const HttpRequest& request) { return handle_health(request); });
}

TelemetryApiServer::~TelemetryApiServer() {
    server_.stop();
}

Result<void> TelemetryApiServer::start() {
    return server_.start();
}

void TelemetryApiServer::stop(std::chrono::milliseconds grace) {
    server_.stop(grace);
}

bool TelemetryApiServer::is_running() const noexcept {
    return server_.is_running();
}

uint16_t TelemetryApiServer::port() const noexcept {
    return server_.get_port();
}

HttpResponse TelemetryApiServer::dispatch(const HttpRequest& request) {
    return server_.dispatch(request);
}

HttpResponse TelemetryApiServer::handle_status(const HttpRequest& /*request*/) {
    auto snapshot = source_.snapshot();
    return HttpResponse::json(telemetry::serialize(snapshot.document));
}

HttpResponse TelemetryApiServer::handle_conf(const HttpRequest& request) {
    auto parsed = parse_miner_conf(request.body);
    if (!parsed) {
        return conf_response(HttpStatus::BadRequest, false, parsed.error().message);
    }

    auto applied = source_.apply_miner_conf(*parsed);
    if (!applied) {
        const auto status = applied.error().category() == ErrorCategory::Validation
            ? HttpStatus::BadRequest
            : HttpStatus::ServiceUnavailable;
        return conf_response(status, false, applied.error().message);
    }

    return conf_response(HttpStatus::OK, true, "Configuration updated");
}

HttpResponse TelemetryApiServer::handle_health(const HttpRequest& /*request*/) {
    return render_health(source_.health());
}

} // namespace asicemu::http
