/**
 * @file native_control.cpp
 * @brief Реализация нативного канала управления
 */

#include "native_control.hpp"

#include <cmath>
#include <format>
#include <string>
#include <vector>

namespace asicemu::hw {

namespace {

/**
 * @brief Выполнить команду и превратить ненулевой код в ошибку
 */
Result<void> run_checked(CommandRunner& runner,
                         const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) {
    auto result = runner.run(argv, timeout);
    if (!result) {
        if (result.error().code == ErrorCode::NativeCommandTimeout) {
            return std::unexpected(result.error());
        }
        return Err<void>(ErrorCode::NativeCommandFailed, result.error().message);
    }
    if (!result->succeeded()) {
        return Err<void>(
            ErrorCode::NativeCommandFailed,
            std::format("{} завершилась с кодом {}", argv.front(), result->exit_code)
        );
    }
    return {};
}

std::string watts_arg(double watts) {
    return std::to_string(static_cast<long>(std::lround(watts)));
}

/**
 * @brief Результат одной попытки проверки
 */
enum class ProbeOutcome {
    Found,
    Missing,
    Timeout,
    Failed
};

ProbeOutcome try_probe(CommandRunner& runner,
                       const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout) {
    auto result = runner.run(argv, timeout);
    if (!result) {
        switch (result.error().code) {
            case ErrorCode::NativeCommandTimeout: return ProbeOutcome::Timeout;
            case ErrorCode::NativeSpawnFailed: return ProbeOutcome::Missing;
            default: return ProbeOutcome::Failed;
        }
    }
    return result->succeeded() ? ProbeOutcome::Found : ProbeOutcome::Failed;
}

} // anonymous namespace

// =============================================================================
// RocmControlChannel
// =============================================================================

RocmControlChannel::RocmControlChannel(std::shared_ptr<CommandRunner> runner,
                                       std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), timeout_(timeout) {}

Result<void> RocmControlChannel::apply(const emulation::DomainConfig& config) {
    const std::vector<std::vector<std::string>> commands = {
        {"rocm-smi", "--setpoweroverdrive", "0", watts_arg(config.power_limit_w)},
        {"rocm-smi", "--setfan", "0", std::format("{}%", config.fan_percent)},
        {"rocm-smi", "--setsclk", "0", std::to_string(config.frequency_mhz)},
    };

    // Ошибка одной команды не мешает остальным
    Result<void> first_error;
    for (const auto& argv : commands) {
        auto result = run_checked(*runner_, argv, timeout_);
        if (!result && first_error) {
            first_error = std::unexpected(result.error());
        }
    }
    return first_error;
}

// =============================================================================
// NvidiaControlChannel
// =============================================================================

NvidiaControlChannel::NvidiaControlChannel(std::shared_ptr<CommandRunner> runner,
                                           std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), timeout_(timeout) {}

Result<void> NvidiaControlChannel::apply(const emulation::DomainConfig& config) {
    return run_checked(*runner_, {"nvidia-smi", "-pl", watts_arg(config.power_limit_w)}, timeout_);
}

// =============================================================================
// Проверка возможностей
// =============================================================================

Result<std::unique_ptr<NativeControlChannel>> probe_native_channel(
    std::shared_ptr<CommandRunner> runner,
    std::chrono::milliseconds timeout
) {
    auto amd = try_probe(*runner, {"rocm-smi", "--showproductname"}, timeout);
    if (amd == ProbeOutcome::Found) {
        return std::make_unique<RocmControlChannel>(runner, timeout);
    }

    auto nvidia = try_probe(*runner, {"nvidia-smi", "-q"}, timeout);
    if (nvidia == ProbeOutcome::Found) {
        return std::make_unique<NvidiaControlChannel>(runner, timeout);
    }

    if (amd == ProbeOutcome::Timeout || nvidia == ProbeOutcome::Timeout) {
        return Err<std::unique_ptr<NativeControlChannel>>(
            ErrorCode::ProbeTimeout,
            std::format("Утилита управления не ответила за {} мс", timeout.count())
        );
    }
    if (amd == ProbeOutcome::Failed || nvidia == ProbeOutcome::Failed) {
        return Err<std::unique_ptr<NativeControlChannel>>(
            ErrorCode::ProbeFailed,
            "rocm-smi/nvidia-smi завершились с ошибкой"
        );
    }
    return Err<std::unique_ptr<NativeControlChannel>>(
        ErrorCode::ProbeToolMissing,
        "Не найдены rocm-smi и nvidia-smi"
    );
}

ChannelProber make_process_prober(std::chrono::milliseconds timeout) {
    return [timeout]() {
        return probe_native_channel(std::make_shared<ProcessCommandRunner>(), timeout);
    };
}

} // namespace asicemu::hw
