/**
 * @file main.cpp
 * @brief Точка входа ASIC Emulator
 *
 * ASIC Emulator - эмулятор внешнего поведения Antminer L7 на обычной
 * вычислительной платформе (GPU). Нужен для разработки и тестирования
 * систем управления фермой без реального оборудования.
 *
 * Основные компоненты:
 * 1. ThermalModel - тепловая RC-модель кристалла
 * 2. FaultInjector - ошибки nonce и "молчащие" хеш-платы
 * 3. ShareTimingController - тайминг отправки шар
 * 4. DomainController - профили питания и нативный канал управления
 * 5. TelemetryApiServer - HTTP API в формате прошивки
 *
 * Использование:
 *   asic-emulator [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "emulation/orchestrator.hpp"
#include "monitoring/alerter.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <random>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
ASIC Emulator v)" << VERSION << R"(
Эмулятор телеметрии и поведения Antminer L7

ИСПОЛЬЗОВАНИЕ:
    asic-emulator [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (asic-emulator.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

ПРИМЕРЫ:
    asic-emulator -c /etc/asic-emulator/asic-emulator.toml
    curl http://127.0.0.1:8080/cgi-bin/get_miner_status.cgi

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "ASIC Emulator v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Настройки журнала из конфигурации
 */
asicemu::monitoring::AlerterConfig make_alerter_config(const asicemu::LoggingConfig& logging) {
    asicemu::monitoring::AlerterConfig config;
    config.log_level = asicemu::monitoring::alert_level_from_string(logging.level)
        .value_or(asicemu::monitoring::AlertLevel::Info);
    config.color = logging.color;
    config.dedup_interval_seconds = logging.dedup_interval_s;
    return config;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace asicemu;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Загружаем конфигурацию
    std::cout << "[INFO] Загрузка конфигурации..." << std::endl;

    auto config_result = Config::load_with_search(
        args.config_path ? std::optional<std::filesystem::path>(*args.config_path) : std::nullopt
    );

    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    monitoring::Alerter::instance().configure(make_alerter_config(config.logging));

    std::cout << "[INFO] Конфигурация загружена успешно" << std::endl;

    // Запускаем эмуляцию
    emulation::EmulationOrchestrator emulator(config);

    auto init_result = emulator.initialize();
    if (!init_result) {
        std::cerr << "[ERROR] Не удалось запустить эмуляцию: "
                  << init_result.error().message << std::endl;
        return 1;
    }

    if (emulator.api_port() != 0) {
        std::cout << "[INFO] API: http://" << config.api.bind_address << ":"
                  << emulator.api_port() << constants::MINER_STATUS_PATH << std::endl;
    } else {
        std::cout << "[INFO] API недоступен, режим симуляции без телеметрии по сети" << std::endl;
    }

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Демонстрационный цикл: номинальная мощность активного профиля
    std::cout << "[INFO] Эмуляция запущена, Ctrl+C для остановки" << std::endl;

    Rng nonce_rng(config.fault.seed);
    uint64_t shares_submitted = 0;
    uint64_t results_accepted = 0;
    uint64_t results_dropped = 0;
    std::size_t next_unit = 0;

    while (g_running.load(std::memory_order_relaxed)) {
        auto fed = emulator.feed_power(emulator.current_domain().power_limit_w);
        if (!fed) {
            std::cerr << "[ERROR] " << fed.error().message << std::endl;
            break;
        }

        if (emulator.should_submit_share()) {
            ++shares_submitted;
        }

        if (emulator.evaluate_unit(next_unit, nonce_rng())) {
            ++results_accepted;
        } else {
            ++results_dropped;
        }
        next_unit = (next_unit + 1) % config.telemetry.unit_count;

        // Пауза перед следующей итерацией
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    // Graceful shutdown
    std::cout << "\n[INFO] Получен сигнал завершения, останавливаем..." << std::endl;
    emulator.shutdown();

    std::cout << "[INFO] ASIC Emulator остановлен" << std::endl;

    // Выводим финальную статистику
    auto final_snapshot = emulator.snapshot();
    std::cout << "\n=== Итоговая статистика ===" << std::endl;
    std::cout << "Время работы: " << final_snapshot.document.summary.front().elapsed << " секунд" << std::endl;
    std::cout << "Отправлено шар: " << shares_submitted << std::endl;
    std::cout << "Принято результатов: " << results_accepted << std::endl;
    std::cout << "Отброшено результатов: " << results_dropped << std::endl;

    return 0;
}
