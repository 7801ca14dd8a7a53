/**
 * @file command_runner.cpp
 * @brief Реализация запуска внешних утилит (POSIX)
 */

#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace asicemu::hw {

namespace {

/// Интервал опроса дочернего процесса (мс)
constexpr int POLL_INTERVAL_MS = 20;

/// Ограничение на объём захватываемого вывода
constexpr std::size_t MAX_OUTPUT = 64 * 1024;

/**
 * @brief Пара файловых дескрипторов канала с автоматическим закрытием
 */
struct Pipe {
    int fds[2]{-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }

    bool open(int flags) {
        return ::pipe2(fds, flags) == 0;
    }

    void close_read() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }

    void close_write() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

/**
 * @brief Прочитать всё доступное из неблокирующего дескриптора
 *
 * @return false когда достигнут EOF
 */
bool drain(int fd, std::string& output) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (output.size() < MAX_OUTPUT) {
                output.append(buffer, static_cast<std::size_t>(
                    std::min<std::size_t>(static_cast<std::size_t>(n), MAX_OUTPUT - output.size())));
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return true;  // EAGAIN
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // anonymous namespace

Result<CommandResult> ProcessCommandRunner::run(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout
) {
    if (argv.empty()) {
        return Err<CommandResult>(ErrorCode::NativeSpawnFailed, "Пустая команда");
    }

    Pipe output_pipe;
    Pipe exec_error_pipe;
    if (!output_pipe.open(O_CLOEXEC) || !exec_error_pipe.open(O_CLOEXEC)) {
        return Err<CommandResult>(
            ErrorCode::NativeSpawnFailed,
            std::format("pipe: {}", std::strerror(errno))
        );
    }

    // argv собираем до fork: в дочернем процессе не выделяем память
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Err<CommandResult>(
            ErrorCode::NativeSpawnFailed,
            std::format("fork: {}", std::strerror(errno))
        );
    }

    if (pid == 0) {
        // Своя группа процессов: по таймауту убиваем и потомков
        ::setpgid(0, 0);
        ::dup2(output_pipe.fds[1], STDOUT_FILENO);
        ::dup2(output_pipe.fds[1], STDERR_FILENO);
        ::execvp(args[0], args.data());

        int err = errno;
        ssize_t ignored = ::write(exec_error_pipe.fds[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    output_pipe.close_write();
    exec_error_pipe.close_write();

    // Канал ошибок закрывается при успешном exec (O_CLOEXEC)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_error_pipe.fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        return Err<CommandResult>(
            ErrorCode::NativeSpawnFailed,
            std::format("{}: {}", argv[0], std::strerror(exec_errno))
        );
    }

    ::fcntl(output_pipe.fds[0], F_SETFL, O_NONBLOCK);

    CommandResult result;
    const auto deadline = Clock::now() + timeout;
    bool output_open = true;

    while (true) {
        int status = 0;
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            if (output_open) {
                drain(output_pipe.fds[0], result.output);
            }
            result.exit_code = decode_status(status);
            return result;
        }
        if (waited < 0 && errno != EINTR) {
            return Err<CommandResult>(
                ErrorCode::NativeCommandFailed,
                std::format("waitpid: {}", std::strerror(errno))
            );
        }

        if (Clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            return Err<CommandResult>(
                ErrorCode::NativeCommandTimeout,
                std::format("{}: превышен таймаут {} мс", argv[0], timeout.count())
            );
        }

        if (output_open) {
            struct pollfd pfd{};
            pfd.fd = output_pipe.fds[0];
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, POLL_INTERVAL_MS) > 0) {
                output_open = drain(output_pipe.fds[0], result.output);
            }
        } else {
            ::usleep(POLL_INTERVAL_MS * 1000);
        }
    }
}

} // namespace asicemu::hw
