/**
 * @file test_fault_injector.cpp
 * @brief Тесты модели отказов хеш-плат
 */

#include <gtest/gtest.h>

#include "emulation/fault_injector.hpp"

#include <array>

namespace asicemu::tests {

using namespace std::chrono_literals;
using emulation::Decision;
using emulation::DropReason;
using emulation::FaultInjector;

class FaultInjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.initial_silent_unit = std::nullopt;
        config_.silence_period = 1200s;
    }

    FaultConfig config_;
    TimePoint start_ = Clock::now();
    Rng rng_{12345};
};

// =============================================================================
// Ошибки nonce
// =============================================================================

/**
 * @brief Тест: при нулевой вероятности ничего не отбрасывается
 */
TEST_F(FaultInjectorTest, ZeroErrorRateNeverDrops) {
    config_.nonce_error_rate = 0.0;
    FaultInjector injector(config_, start_);

    for (uint64_t i = 0; i < 10000; ++i) {
        auto decision = injector.evaluate(3, i % 3, i, start_ + 1s, rng_);
        ASSERT_TRUE(decision.accepted());
        ASSERT_EQ(decision.value, i);
    }
}

/**
 * @brief Тест: при единичной вероятности отбрасывается всё
 */
TEST_F(FaultInjectorTest, UnitErrorRateAlwaysDrops) {
    config_.nonce_error_rate = 1.0;
    FaultInjector injector(config_, start_);

    for (uint64_t i = 0; i < 10000; ++i) {
        auto decision = injector.evaluate(3, i % 3, i, start_ + 1s, rng_);
        ASSERT_FALSE(decision.accepted());
        ASSERT_EQ(decision.reason, DropReason::NonceError);
    }
}

/**
 * @brief Тест: одинаковый seed даёт одинаковые решения
 */
TEST_F(FaultInjectorTest, DeterministicUnderFixedSeed) {
    config_.nonce_error_rate = 0.3;
    FaultInjector first(config_, start_);
    FaultInjector second(config_, start_);
    Rng rng_a(99);
    Rng rng_b(99);

    int drops = 0;
    for (uint64_t i = 0; i < 1000; ++i) {
        auto a = first.evaluate(3, 1, i, start_ + 1s, rng_a);
        auto b = second.evaluate(3, 1, i, start_ + 1s, rng_b);
        ASSERT_EQ(a.accepted(), b.accepted());
        if (!a.accepted()) {
            ++drops;
        }
    }

    // 30% от 1000 с большим запасом
    EXPECT_GT(drops, 200);
    EXPECT_LT(drops, 400);
}

// =============================================================================
// "Молчащая" плата
// =============================================================================

TEST_F(FaultInjectorTest, SilentUnitDropped) {
    config_.nonce_error_rate = 0.0;
    config_.initial_silent_unit = 1;
    FaultInjector injector(config_, start_);

    auto silent = injector.evaluate(3, 1, 7, start_ + 1s, rng_);
    EXPECT_FALSE(silent.accepted());
    EXPECT_EQ(silent.reason, DropReason::SilentUnit);

    EXPECT_TRUE(injector.evaluate(3, 0, 7, start_ + 1s, rng_).accepted());
    EXPECT_TRUE(injector.evaluate(3, 2, 7, start_ + 1s, rng_).accepted());
}

/**
 * @brief Тест: ротация по окончании окна тишины
 */
TEST_F(FaultInjectorTest, RotatesAfterSilencePeriod) {
    config_.nonce_error_rate = 0.0;
    config_.initial_silent_unit = 2;
    FaultInjector injector(config_, start_);

    // До конца окна плата 2 молчит
    EXPECT_FALSE(injector.evaluate(3, 2, 0, start_ + 1199s, rng_).accepted());

    // Окно истекло: (2 + 1) mod 3 = 0
    EXPECT_FALSE(injector.evaluate(3, 0, 0, start_ + 1200s, rng_).accepted());
    EXPECT_TRUE(injector.evaluate(3, 2, 0, start_ + 1200s, rng_).accepted());
    ASSERT_TRUE(injector.profile().silent_unit.has_value());
    EXPECT_EQ(*injector.profile().silent_unit, 0u);
    EXPECT_EQ(injector.profile().silence_started_at, start_ + 1200s);

    // Следующее окно
    EXPECT_TRUE(injector.rotate_if_due(3, start_ + 2400s));
    EXPECT_EQ(*injector.profile().silent_unit, 1u);
}

TEST_F(FaultInjectorTest, RotationStartsFromNoSilentUnit) {
    FaultInjector injector(config_, start_);
    EXPECT_FALSE(injector.profile().silent_unit.has_value());

    EXPECT_FALSE(injector.rotate_if_due(3, start_ + 10s));
    EXPECT_TRUE(injector.rotate_if_due(3, start_ + 1200s));
    EXPECT_EQ(*injector.profile().silent_unit, 0u);
}

/**
 * @brief Тест: некорректный номер платы не сдвигает окно
 */
TEST_F(FaultInjectorTest, InvalidUnitDoesNotRotate) {
    config_.initial_silent_unit = 0;
    FaultInjector injector(config_, start_);

    auto decision = injector.evaluate(3, 5, 0, start_ + 1300s, rng_);
    EXPECT_FALSE(decision.accepted());
    EXPECT_EQ(decision.reason, DropReason::InvalidUnit);
    EXPECT_EQ(*injector.profile().silent_unit, 0u);
    EXPECT_EQ(injector.profile().silence_started_at, start_);

    EXPECT_EQ(injector.evaluate(0, 0, 0, start_, rng_).reason, DropReason::InvalidUnit);
}

// =============================================================================
// Деградация
// =============================================================================

TEST(DegradationTest, PureComputation) {
    FaultConfig config;
    config.uptime_factor_per_hour = 0.01;
    config.thermal_optimum_c = 70.0;
    config.thermal_factor_per_c = 0.05;

    emulation::FaultProfile profile;
    profile.base_nonce_error_rate = 1e-4;

    // 10 часов и 80 °C: 1e-4 * 1.1 * 1.5
    EXPECT_NEAR(emulation::degraded_error_rate(profile, Seconds(36000.0), 80.0, config),
                1.65e-4, 1e-12);

    // Ниже оптимума температура не влияет
    EXPECT_NEAR(emulation::degraded_error_rate(profile, Seconds(0.0), 50.0, config),
                1e-4, 1e-15);

    // Результат не выходит за 1
    profile.base_nonce_error_rate = 0.9;
    EXPECT_DOUBLE_EQ(emulation::degraded_error_rate(profile, Seconds(3.6e6), 95.0, config), 1.0);
}

TEST_F(FaultInjectorTest, DegradationOnlyWhenEnabled) {
    config_.nonce_error_rate = 1e-4;

    FaultInjector disabled(config_, start_);
    disabled.apply_degradation(Seconds(36000.0), 90.0);
    EXPECT_DOUBLE_EQ(disabled.profile().nonce_error_rate, 1e-4);

    config_.degradation_enabled = true;
    FaultInjector enabled(config_, start_);
    enabled.apply_degradation(Seconds(36000.0), 90.0);
    const double degraded = enabled.profile().nonce_error_rate;
    EXPECT_GT(degraded, 1e-4);

    // Остывание не уменьшает накопленную деградацию
    enabled.apply_degradation(Seconds(36000.0), 20.0);
    EXPECT_GE(enabled.profile().nonce_error_rate, degraded);
}

/**
 * @brief Тест: деградация зависит от uptime и температуры, а не от числа вызовов
 */
TEST_F(FaultInjectorTest, DegradationDoesNotCompound) {
    config_.nonce_error_rate = 5e-5;
    config_.degradation_enabled = true;
    config_.thermal_optimum_c = 70.0;
    config_.thermal_factor_per_c = 0.05;

    FaultInjector injector(config_, start_);
    injector.apply_degradation(Seconds(0.0), 80.0);
    const double once = injector.profile().nonce_error_rate;
    EXPECT_NEAR(once, 7.5e-5, 1e-15);

    for (int i = 0; i < 1000; ++i) {
        injector.apply_degradation(Seconds(0.0), 80.0);
    }
    EXPECT_DOUBLE_EQ(injector.profile().nonce_error_rate, once);
    EXPECT_DOUBLE_EQ(injector.profile().base_nonce_error_rate, 5e-5);

    // Рост только с uptime: 10 часов при factor 0.01
    config_.uptime_factor_per_hour = 0.01;
    FaultInjector aging(config_, start_);
    for (int i = 0; i < 100; ++i) {
        aging.apply_degradation(Seconds(36000.0), 80.0);
    }
    EXPECT_NEAR(aging.profile().nonce_error_rate, 5e-5 * 1.1 * 1.5, 1e-15);
}

// =============================================================================
// Регистр отказов
// =============================================================================

TEST_F(FaultInjectorTest, FanFailureInjectAndClear) {
    FaultInjector injector(config_, start_);

    ASSERT_TRUE(injector.inject_fan_failure(1, 4).has_value());
    ASSERT_TRUE(injector.inject_fan_failure(3, 4).has_value());
    EXPECT_TRUE(injector.profile().fan_failed(1));
    EXPECT_TRUE(injector.profile().fan_failed(3));
    EXPECT_FALSE(injector.profile().fan_failed(0));

    ASSERT_TRUE(injector.clear_fan_failure(1, 4).has_value());
    EXPECT_FALSE(injector.profile().fan_failed(1));
    EXPECT_EQ(injector.profile().failed_fans, 1u << 3);

    auto missing = injector.inject_fan_failure(4, 4);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(injector.clear_fan_failure(40, 64).has_value());
    EXPECT_EQ(injector.profile().failed_fans, 1u << 3);
}

TEST_F(FaultInjectorTest, InjectAndClearRegisterBits) {
    FaultInjector injector(config_, start_);

    injector.inject_fault(emulation::fault_bits::VOLTAGE_LOW | emulation::fault_bits::TEMP_OVER_85C);
    EXPECT_EQ(injector.profile().injected_faults,
              emulation::fault_bits::VOLTAGE_LOW | emulation::fault_bits::TEMP_OVER_85C);

    injector.clear_fault(emulation::fault_bits::VOLTAGE_LOW);
    EXPECT_EQ(injector.profile().injected_faults, emulation::fault_bits::TEMP_OVER_85C);
}

TEST(FaultRegisterTest, Bits) {
    const std::array<uint32_t, 4> fans_ok{4300, 4310, 4290, 4305};
    const std::array<uint32_t, 4> fans_failed{4300, 0, 4290, 4305};

    EXPECT_EQ(emulation::fault_register(70.0, fans_ok, std::nullopt, 900, 700), 0u);

    EXPECT_EQ(emulation::fault_register(70.0, fans_ok, std::size_t{1}, 900, 700),
              emulation::fault_bits::HASH_BOARD_ABSENT);
    EXPECT_EQ(emulation::fault_register(70.0, fans_ok, std::nullopt, 650, 700),
              emulation::fault_bits::VOLTAGE_LOW);
    EXPECT_EQ(emulation::fault_register(86.0, fans_ok, std::nullopt, 900, 700),
              emulation::fault_bits::TEMP_OVER_85C);
    EXPECT_EQ(emulation::fault_register(70.0, fans_failed, std::nullopt, 900, 700),
              emulation::fault_bits::FAN_FAILURE);

    EXPECT_EQ(emulation::fault_register(90.0, fans_failed, std::size_t{0}, 600, 700), 0x0Fu);
}

} // namespace asicemu::tests
