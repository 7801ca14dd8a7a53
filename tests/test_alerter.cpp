/**
 * @file test_alerter.cpp
 * @brief Тесты журнала событий
 */

#include <gtest/gtest.h>

#include "monitoring/alerter.hpp"

#include <string>
#include <vector>

namespace asicemu::tests {

using monitoring::AlertLevel;
using monitoring::Alerter;
using monitoring::AlerterConfig;

class AlerterTest : public ::testing::Test {
protected:
    void SetUp() override {
        AlerterConfig config;
        config.console_output = false;
        config.dedup_interval_seconds = 60;
        Alerter::instance().configure(config);
        Alerter::instance().reset_stats();
        Alerter::instance().set_callback([this](AlertLevel level, std::string_view message) {
            levels_.push_back(level);
            messages_.emplace_back(message);
        });
    }

    void TearDown() override {
        Alerter::instance().set_callback(nullptr);
        Alerter::instance().configure(AlerterConfig{});
        Alerter::instance().reset_stats();
    }

    std::vector<AlertLevel> levels_;
    std::vector<std::string> messages_;
};

TEST_F(AlerterTest, CallbackReceivesMessage) {
    Alerter::instance().alert_profile_applied("LOW_POWER");

    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(levels_[0], AlertLevel::Info);
    EXPECT_NE(messages_[0].find("LOW_POWER"), std::string::npos);
    EXPECT_EQ(Alerter::instance().get_alerts_count(), 1u);
}

/**
 * @brief Тест: повторный алерт в пределах интервала подавляется
 */
TEST_F(AlerterTest, Deduplication) {
    Alerter::instance().alert_high_temperature(91.0);
    Alerter::instance().alert_high_temperature(92.0);
    Alerter::instance().alert_high_temperature(93.0);

    EXPECT_EQ(messages_.size(), 1u);

    // Разные платы - разные ключи
    Alerter::instance().alert_unit_silenced(0);
    Alerter::instance().alert_unit_silenced(1);
    Alerter::instance().alert_unit_silenced(1);

    EXPECT_EQ(messages_.size(), 3u);
}

TEST_F(AlerterTest, FanFailurePerFan) {
    Alerter::instance().alert_fan_failure(2);
    Alerter::instance().alert_fan_failure(2);
    Alerter::instance().alert_fan_failure(3);

    ASSERT_EQ(messages_.size(), 2u);
    EXPECT_EQ(levels_[0], AlertLevel::Critical);
    EXPECT_NE(messages_[0].find("2"), std::string::npos);
    EXPECT_NE(messages_[1].find("3"), std::string::npos);
}

TEST_F(AlerterTest, LevelFilter) {
    AlerterConfig config;
    config.console_output = false;
    config.log_level = AlertLevel::Warning;
    Alerter::instance().configure(config);

    Alerter::instance().alert_state_changed("Initializing", "Active");
    EXPECT_TRUE(messages_.empty());

    Alerter::instance().alert_invalid_power(-5.0);
    ASSERT_EQ(messages_.size(), 1u);
    EXPECT_EQ(levels_[0], AlertLevel::Warning);
}

TEST_F(AlerterTest, CriticalCounted) {
    Alerter::instance().alert_api_unavailable(Error{ErrorCode::NetworkBindFailed, "порт 8080 занят"});

    EXPECT_EQ(Alerter::instance().get_critical_count(), 1u);
    ASSERT_EQ(levels_.size(), 1u);
    EXPECT_EQ(levels_[0], AlertLevel::Critical);
    EXPECT_NE(messages_[0].find("8080"), std::string::npos);

    Alerter::instance().reset_stats();
    EXPECT_EQ(Alerter::instance().get_critical_count(), 0u);
    EXPECT_EQ(Alerter::instance().get_alerts_count(), 0u);
}

TEST(AlertLevelTest, FromString) {
    EXPECT_EQ(monitoring::alert_level_from_string("info"), AlertLevel::Info);
    EXPECT_EQ(monitoring::alert_level_from_string("warning"), AlertLevel::Warning);
    EXPECT_EQ(monitoring::alert_level_from_string("critical"), AlertLevel::Critical);
    EXPECT_FALSE(monitoring::alert_level_from_string("debug").has_value());
    EXPECT_EQ(monitoring::alert_level_to_string(AlertLevel::Warning), "WARNING");
}

} // namespace asicemu::tests
