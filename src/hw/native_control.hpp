/**
 * @file native_control.hpp
 * @brief Нативный канал управления питанием (rocm-smi / nvidia-smi)
 *
 * Необязательная сквозная передача параметров домена в утилиту
 * производителя. Если утилиты нет, эмулятор работает только
 * в режиме симуляции.
 */

#pragma once

#include "command_runner.hpp"
#include "../core/types.hpp"
#include "../emulation/domain_config.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace asicemu::hw {

/**
 * @brief Канал управления железом
 */
class NativeControlChannel {
public:
    virtual ~NativeControlChannel() = default;

    /// @brief Производитель ("AMD", "NVIDIA")
    [[nodiscard]] virtual std::string_view vendor() const noexcept = 0;

    /**
     * @brief Передать параметры домена в утилиту
     *
     * @return NativeCommandFailed / NativeCommandTimeout при ошибке
     */
    [[nodiscard]] virtual Result<void> apply(const emulation::DomainConfig& config) = 0;
};

/**
 * @brief Канал через rocm-smi
 *
 * Передаёт лимит мощности, скорость вентиляторов и частоту.
 */
class RocmControlChannel : public NativeControlChannel {
public:
    RocmControlChannel(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string_view vendor() const noexcept override { return "AMD"; }
    [[nodiscard]] Result<void> apply(const emulation::DomainConfig& config) override;

private:
    std::shared_ptr<CommandRunner> runner_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Канал через nvidia-smi
 *
 * Передаёт только лимит мощности (-pl).
 */
class NvidiaControlChannel : public NativeControlChannel {
public:
    NvidiaControlChannel(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout);

    [[nodiscard]] std::string_view vendor() const noexcept override { return "NVIDIA"; }
    [[nodiscard]] Result<void> apply(const emulation::DomainConfig& config) override;

private:
    std::shared_ptr<CommandRunner> runner_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Функция проверки возможностей
 *
 * Возвращает найденный канал или ошибку категории CapabilityProbe.
 */
using ChannelProber = std::function<Result<std::unique_ptr<NativeControlChannel>>()>;

/**
 * @brief Найти утилиту управления
 *
 * Порядок: rocm-smi --showproductname, затем nvidia-smi -q.
 * Каждая команда ограничена таймаутом.
 *
 * @return Канал или ProbeToolMissing / ProbeTimeout / ProbeFailed
 */
[[nodiscard]] Result<std::unique_ptr<NativeControlChannel>> probe_native_channel(
    std::shared_ptr<CommandRunner> runner,
    std::chrono::milliseconds timeout
);

/**
 * @brief Проверка через реальные процессы
 */
[[nodiscard]] ChannelProber make_process_prober(std::chrono::milliseconds timeout);

} // namespace asicemu::hw
