/**
 * @file test_miner_api.cpp
 * @brief Тесты HTTP API устройства (cgi-bin)
 */

#include <gtest/gtest.h>

#include "http/miner_api.hpp"

#include <nlohmann/json.hpp>

namespace asicemu::tests {

// =============================================================================
// parse_miner_conf
// =============================================================================

TEST(ParseMinerConfTest, ValidBody) {
    auto request = http::parse_miner_conf(
        R"({"freq": 450, "volt": 1225, "fan": 100, "power-strict": 2800})");

    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->freq_mhz, 450u);
    EXPECT_EQ(request->volt_mv, 1225u);
    EXPECT_EQ(request->fan_percent, 100u);
    ASSERT_TRUE(request->power_limit_w.has_value());
    EXPECT_DOUBLE_EQ(*request->power_limit_w, 2800.0);
}

/**
 * @brief Тест: веб-интерфейс прошивки отправляет числа строками
 */
TEST(ParseMinerConfTest, NumericStrings) {
    auto request = http::parse_miner_conf(R"({"freq": "500", "volt": "900", "fan": "80"})");

    ASSERT_TRUE(request.has_value()) << request.error().message;
    EXPECT_EQ(request->freq_mhz, 500u);
    EXPECT_EQ(request->volt_mv, 900u);
    EXPECT_EQ(request->fan_percent, 80u);
    EXPECT_FALSE(request->power_limit_w.has_value());
}

TEST(ParseMinerConfTest, MissingField) {
    auto request = http::parse_miner_conf(R"({"volt": 1225, "fan": 100})");

    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().code, ErrorCode::ValidationMissingField);
    EXPECT_EQ(request.error().category(), ErrorCategory::Validation);
}

TEST(ParseMinerConfTest, MalformedJson) {
    for (const char* body : {"", "{freq: 450", "[1, 2, 3]", "\"text\"",
                             R"({"freq": "fast", "volt": 900, "fan": 100})",
                             R"({"freq": true, "volt": 900, "fan": 100})"}) {
        auto request = http::parse_miner_conf(body);
        ASSERT_FALSE(request.has_value()) << body;
        EXPECT_EQ(request.error().code, ErrorCode::ValidationMalformedJson) << body;
    }
}

TEST(ParseMinerConfTest, OutOfRange) {
    for (const char* body : {R"({"freq": 50, "volt": 900, "fan": 100})",
                             R"({"freq": 500, "volt": 2000, "fan": 100})",
                             R"({"freq": 500, "volt": 900, "fan": 101})",
                             R"({"freq": 500, "volt": 900, "fan": 100, "power-strict": -1})"}) {
        auto request = http::parse_miner_conf(body);
        ASSERT_FALSE(request.has_value()) << body;
        EXPECT_EQ(request.error().code, ErrorCode::ValidationOutOfRange) << body;
    }
}

// =============================================================================
// TelemetryApiServer (без сети)
// =============================================================================

namespace {

/**
 * @brief Источник телеметрии с фиксированными ответами
 */
class FakeTelemetrySource : public http::TelemetrySource {
public:
    telemetry::StatusSnapshot snapshot() override {
        ++snapshots;
        telemetry::StatusSnapshot snapshot;
        snapshot.document.status.push_back(telemetry::StatusEntry{});
        snapshot.document.summary.push_back(telemetry::SummaryEntry{});
        return snapshot;
    }

    Result<void> apply_miner_conf(const http::MinerConfRequest& request) override {
        applied.push_back(request);
        return apply_result;
    }

    http::HealthData health() override {
        http::HealthData data;
        data.start_time = std::chrono::steady_clock::now();
        data.state = "Active";
        data.hybrid_active = true;
        return data;
    }

    int snapshots{0};
    std::vector<http::MinerConfRequest> applied;
    Result<void> apply_result;
};

http::HttpRequest make_request(http::HttpMethod method, const std::string& path,
                               const std::string& body = "") {
    http::HttpRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    return request;
}

} // anonymous namespace

class TelemetryApiServerTest : public ::testing::Test {
protected:
    FakeTelemetrySource source_;
    http::TelemetryApiServer server_{http::HttpServerConfig{}, source_};
};

TEST_F(TelemetryApiServerTest, StatusReturnsDocument) {
    auto response = server_.dispatch(
        make_request(http::HttpMethod::GET, constants::MINER_STATUS_PATH));

    EXPECT_EQ(response.status, http::HttpStatus::OK);
    EXPECT_EQ(response.headers["Content-Type"], "application/json");
    EXPECT_EQ(source_.snapshots, 1);

    auto json = nlohmann::json::parse(response.body);
    EXPECT_TRUE(json.contains("STATUS"));
    EXPECT_TRUE(json.contains("SUMMARY"));
}

TEST_F(TelemetryApiServerTest, ConfAccepted) {
    auto response = server_.dispatch(make_request(http::HttpMethod::POST, constants::MINER_CONF_PATH,
        R"({"freq": 450, "volt": 1225, "fan": 100, "power-strict": 2800})"));

    EXPECT_EQ(response.status, http::HttpStatus::OK);
    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["success"], true);
    EXPECT_EQ(json["message"], "Configuration updated");
    ASSERT_EQ(source_.applied.size(), 1u);
    EXPECT_EQ(source_.applied[0].freq_mhz, 450u);
}

/**
 * @brief Тест: некорректное тело не доходит до источника
 */
TEST_F(TelemetryApiServerTest, ConfRejectedWithoutMutation) {
    auto response = server_.dispatch(make_request(http::HttpMethod::POST, constants::MINER_CONF_PATH,
        R"({"volt": 1225, "fan": 100})"));

    EXPECT_EQ(response.status, http::HttpStatus::BadRequest);
    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["success"], false);
    EXPECT_TRUE(source_.applied.empty());
}

TEST_F(TelemetryApiServerTest, ConfUnavailableWhenSourceInactive) {
    source_.apply_result = Err<void>(ErrorCode::InvalidState, "Stopped");

    auto response = server_.dispatch(make_request(http::HttpMethod::POST, constants::MINER_CONF_PATH,
        R"({"freq": 450, "volt": 1225, "fan": 100})"));

    EXPECT_EQ(response.status, http::HttpStatus::ServiceUnavailable);
}

TEST_F(TelemetryApiServerTest, MethodAndPathRouting) {
    EXPECT_EQ(server_.dispatch(make_request(http::HttpMethod::POST, constants::MINER_STATUS_PATH)).status,
              http::HttpStatus::MethodNotAllowed);
    EXPECT_EQ(server_.dispatch(make_request(http::HttpMethod::GET, constants::MINER_CONF_PATH)).status,
              http::HttpStatus::MethodNotAllowed);
    EXPECT_EQ(server_.dispatch(make_request(http::HttpMethod::GET, "/cgi-bin/reboot.cgi")).status,
              http::HttpStatus::NotFound);
}

TEST_F(TelemetryApiServerTest, Health) {
    auto response = server_.dispatch(make_request(http::HttpMethod::GET, constants::HEALTH_PATH));

    EXPECT_EQ(response.status, http::HttpStatus::OK);
    auto json = nlohmann::json::parse(response.body);
    EXPECT_EQ(json["state"], "Active");
}

} // namespace asicemu::tests
