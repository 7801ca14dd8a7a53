/**
 * @file command_runner.hpp
 * @brief Запуск внешних утилит с ограничением по времени
 *
 * Используется нативным каналом управления (rocm-smi, nvidia-smi).
 * Ни один запуск не может заблокировать вызывающего дольше таймаута:
 * по его истечении группа процессов получает SIGKILL.
 */

#pragma once

#include "../core/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace asicemu::hw {

/**
 * @brief Результат выполнения команды
 */
struct CommandResult {
    /// @brief Код завершения (-1 если процесс убит сигналом)
    int exit_code{0};

    /// @brief Объединённый stdout и stderr
    std::string output;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Интерфейс запуска команд
 *
 * Выделен, чтобы тесты могли подменять реальные процессы.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Выполнить команду
     *
     * @param argv Имя программы и аргументы (поиск по PATH)
     * @param timeout Максимальное время выполнения
     * @return CommandResult или NativeSpawnFailed / NativeCommandTimeout
     */
    [[nodiscard]] virtual Result<CommandResult> run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout
    ) = 0;
};

/**
 * @brief Запуск через fork/execvp
 */
class ProcessCommandRunner : public CommandRunner {
public:
    [[nodiscard]] Result<CommandResult> run(
        const std::vector<std::string>& argv,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace asicemu::hw
