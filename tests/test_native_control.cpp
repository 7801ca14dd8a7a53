/**
 * @file test_native_control.cpp
 * @brief Тесты нативного канала управления и проверки возможностей
 */

#include <gtest/gtest.h>

#include "hw/native_control.hpp"

#include <map>

namespace asicemu::tests {

using namespace std::chrono_literals;

namespace {

/**
 * @brief Подменный запуск команд
 *
 * Ответ выбирается по имени программы, все вызовы запоминаются.
 */
class FakeCommandRunner : public hw::CommandRunner {
public:
    Result<hw::CommandResult> run(const std::vector<std::string>& argv,
                                  std::chrono::milliseconds /*timeout*/) override {
        calls.push_back(argv);

        auto it = responses.find(argv.front());
        if (it == responses.end()) {
            return Err<hw::CommandResult>(ErrorCode::NativeSpawnFailed, "not found");
        }
        return it->second;
    }

    std::map<std::string, Result<hw::CommandResult>> responses;
    std::vector<std::vector<std::string>> calls;
};

Result<hw::CommandResult> exited(int code) {
    return hw::CommandResult{code, ""};
}

} // anonymous namespace

// =============================================================================
// Проверка возможностей
// =============================================================================

TEST(ProbeTest, NoToolsMeansMissing) {
    auto runner = std::make_shared<FakeCommandRunner>();

    auto channel = hw::probe_native_channel(runner, 100ms);

    ASSERT_FALSE(channel.has_value());
    EXPECT_EQ(channel.error().code, ErrorCode::ProbeToolMissing);
    EXPECT_EQ(channel.error().category(), ErrorCategory::CapabilityProbe);
    ASSERT_EQ(runner->calls.size(), 2u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"rocm-smi", "--showproductname"}));
    EXPECT_EQ(runner->calls[1], (std::vector<std::string>{"nvidia-smi", "-q"}));
}

TEST(ProbeTest, RocmPreferred) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("rocm-smi", exited(0));
    runner->responses.emplace("nvidia-smi", exited(0));

    auto channel = hw::probe_native_channel(runner, 100ms);

    ASSERT_TRUE(channel.has_value());
    EXPECT_EQ((*channel)->vendor(), "AMD");
    EXPECT_EQ(runner->calls.size(), 1u);
}

TEST(ProbeTest, NvidiaFallback) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("nvidia-smi", exited(0));

    auto channel = hw::probe_native_channel(runner, 100ms);

    ASSERT_TRUE(channel.has_value());
    EXPECT_EQ((*channel)->vendor(), "NVIDIA");
}

TEST(ProbeTest, TimeoutReported) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("rocm-smi",
        Err<hw::CommandResult>(ErrorCode::NativeCommandTimeout, "timeout"));

    auto channel = hw::probe_native_channel(runner, 100ms);

    ASSERT_FALSE(channel.has_value());
    EXPECT_EQ(channel.error().code, ErrorCode::ProbeTimeout);
}

TEST(ProbeTest, FailingToolReported) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("nvidia-smi", exited(9));

    auto channel = hw::probe_native_channel(runner, 100ms);

    ASSERT_FALSE(channel.has_value());
    EXPECT_EQ(channel.error().code, ErrorCode::ProbeFailed);
}

// =============================================================================
// Каналы
// =============================================================================

/**
 * @brief Тест: rocm-smi получает мощность, вентиляторы и частоту
 */
TEST(NativeChannelTest, RocmCommands) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("rocm-smi", exited(0));

    hw::RocmControlChannel channel(runner, 100ms);
    emulation::DomainConfig config{emulation::DomainProfile::LowPower, 800, 400, 2800.4, 75};

    ASSERT_TRUE(channel.apply(config).has_value());
    ASSERT_EQ(runner->calls.size(), 3u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"rocm-smi", "--setpoweroverdrive", "0", "2800"}));
    EXPECT_EQ(runner->calls[1], (std::vector<std::string>{"rocm-smi", "--setfan", "0", "75%"}));
    EXPECT_EQ(runner->calls[2], (std::vector<std::string>{"rocm-smi", "--setsclk", "0", "400"}));
}

/**
 * @brief Тест: ошибка одной команды не отменяет остальные
 */
TEST(NativeChannelTest, RocmFailureStillRunsAllCommands) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("rocm-smi", exited(1));

    hw::RocmControlChannel channel(runner, 100ms);
    auto result = channel.apply(emulation::DomainConfig{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NativeCommandFailed);
    EXPECT_EQ(runner->calls.size(), 3u);
}

TEST(NativeChannelTest, NvidiaPowerLimit) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("nvidia-smi", exited(0));

    hw::NvidiaControlChannel channel(runner, 100ms);
    emulation::DomainConfig config;
    config.power_limit_w = 4200.0;

    ASSERT_TRUE(channel.apply(config).has_value());
    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0], (std::vector<std::string>{"nvidia-smi", "-pl", "4200"}));
}

TEST(NativeChannelTest, TimeoutPropagated) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->responses.emplace("nvidia-smi",
        Err<hw::CommandResult>(ErrorCode::NativeCommandTimeout, "timeout"));

    hw::NvidiaControlChannel channel(runner, 100ms);
    auto result = channel.apply(emulation::DomainConfig{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NativeCommandTimeout);
    EXPECT_EQ(result.error().category(), ErrorCategory::Native);
}

} // namespace asicemu::tests
