/**
 * @file config.hpp
 * @brief Конфигурация ASIC Emulator
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 * Все секции необязательны: отсутствующие значения берутся из constants.hpp.
 *
 * Пример конфигурации (asic-emulator.toml):
 * @code
 * [api]
 * bind_address = "127.0.0.1"
 * port = 8080
 * read_timeout_ms = 5000
 *
 * [thermal]
 * r_thermal = 1.5
 * c_thermal = 250.0
 * ceiling_c = 95.0
 *
 * [fault]
 * nonce_error_rate = 0.00005
 * silence_period_s = 1200
 * initial_silent_unit = 0
 *
 * [share_timing]
 * mean_interval_ms = 5200
 * jitter_stddev_ms = 800
 * floor_interval_ms = 1000
 *
 * [domain]
 * default_profile = "BALANCED"
 * native_control = true
 *
 * [domain.profiles.LOW_POWER]
 * voltage_mv = 780
 *
 * [telemetry]
 * unit_count = 3
 * nominal_rate_mhs = 9500.0
 *
 * [logging]
 * level = "info"
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "../emulation/domain_config.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace asicemu {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки HTTP API
 */
struct ApiConfig {
    /// @brief Включить HTTP API
    bool enabled = true;

    /// @brief Адрес для прослушивания (API модели доверяет только LAN)
    std::string bind_address = "127.0.0.1";

    /// @brief Порт (0 - выбрать свободный)
    uint16_t port = constants::DEFAULT_API_PORT;

    /// @brief Таймаут чтения запроса
    std::chrono::milliseconds read_timeout{constants::DEFAULT_READ_TIMEOUT_MS};

    /// @brief Время ожидания остановки рабочего потока
    std::chrono::milliseconds shutdown_grace{constants::DEFAULT_SHUTDOWN_GRACE_MS};
};

/**
 * @brief Параметры тепловой RC-модели
 */
struct ThermalConfig {
    /// @brief Тепловое сопротивление (K/W)
    double r_thermal = constants::DEFAULT_R_THERMAL;

    /// @brief Теплоёмкость (J/K)
    double c_thermal = constants::DEFAULT_C_THERMAL;

    /// @brief Начальная температура кристалла (°C)
    double initial_temp_c = constants::DEFAULT_INITIAL_TEMP_C;

    /// @brief Нижняя граница температуры (°C)
    double ambient_floor_c = constants::DEFAULT_AMBIENT_FLOOR_C;

    /// @brief Верхняя граница температуры (°C)
    double ceiling_c = constants::DEFAULT_TEMP_CEILING_C;

    /// @brief Максимальный шаг интегрирования
    std::chrono::milliseconds max_step{constants::DEFAULT_MAX_STEP_MS};

    /// @brief Амплитуда шума датчика (±°C)
    double noise_c = constants::DEFAULT_SENSOR_NOISE_C;
};

/**
 * @brief Параметры модели отказов
 */
struct FaultConfig {
    /// @brief Вероятность ошибки nonce [0, 1]
    double nonce_error_rate = constants::DEFAULT_NONCE_ERROR_RATE;

    /// @brief Период ротации "молчащей" платы
    std::chrono::seconds silence_period{constants::DEFAULT_SILENCE_PERIOD_S};

    /// @brief Плата, молчащая с момента запуска (nullopt - ни одна)
    std::optional<std::size_t> initial_silent_unit = 0;

    /// @brief Включить деградацию error rate
    bool degradation_enabled = false;

    /// @brief Относительный рост error rate за час работы
    double uptime_factor_per_hour = 0.01;

    /// @brief Оптимальная температура (°C)
    double thermal_optimum_c = constants::DEFAULT_THERMAL_OPTIMUM_C;

    /// @brief Относительный рост error rate на градус выше оптимума
    double thermal_factor_per_c = 0.05;

    /// @brief Seed генератора случайных чисел эмулятора
    uint64_t seed = constants::DEFAULT_SEED;
};

/**
 * @brief Параметры тайминга шар
 */
struct ShareTimingConfig {
    /// @brief Средний интервал между шарами
    std::chrono::milliseconds mean_interval{constants::DEFAULT_SHARE_MEAN_MS};

    /// @brief Стандартное отклонение интервала
    std::chrono::milliseconds jitter_stddev{constants::DEFAULT_SHARE_STDDEV_MS};

    /// @brief Минимальный интервал между шарами
    std::chrono::milliseconds floor_interval{constants::DEFAULT_SHARE_FLOOR_MS};
};

/**
 * @brief Настройки доменов питания
 */
struct DomainSettings {
    /// @brief Профиль, применяемый при запуске
    std::string default_profile = constants::DEFAULT_PROFILE;

    /// @brief Таблица профилей
    emulation::ProfileTable profiles = emulation::default_profile_table();

    /// @brief Пытаться найти нативную утилиту управления
    bool native_control = true;

    /// @brief Таймаут одной команды нативной утилиты
    std::chrono::milliseconds probe_timeout{constants::DEFAULT_PROBE_TIMEOUT_MS};
};

/**
 * @brief Параметры генерации телеметрии
 */
struct TelemetryConfig {
    /// @brief Количество хеш-плат (DEVS/TEMPS)
    std::size_t unit_count = constants::DEFAULT_UNIT_COUNT;

    /// @brief Количество вентиляторов (FANS)
    std::size_t fan_count = constants::DEFAULT_FAN_COUNT;

    /// @brief Номинальный хешрейт платы при опорной частоте (MH/s)
    double nominal_rate_mhs = constants::DEFAULT_NOMINAL_RATE_MHS;

    /// @brief Опорная частота (МГц)
    uint32_t reference_frequency_mhz = constants::DEFAULT_REFERENCE_FREQUENCY_MHZ;

    /// @brief Разброс хешрейта между платами (доля)
    double rate_variance = constants::DEFAULT_RATE_VARIANCE;

    /// @brief Максимальные обороты вентилятора (RPM)
    uint32_t max_fan_rpm = constants::DEFAULT_MAX_FAN_RPM;

    /// @brief Доля отклонённых пулом шар
    double pool_reject_ratio = constants::DEFAULT_POOL_REJECT_RATIO;

    /// @brief Порог бита VOLTAGE_LOW (мВ)
    uint32_t voltage_floor_mv = constants::DEFAULT_VOLTAGE_FLOOR_MV;

    /// @brief Мощность для прогрева тепловой модели при запуске (Вт)
    double nominal_power_w = constants::DEFAULT_NOMINAL_POWER_W;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "info", "warning", "critical"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;

    /// @brief Минимальный интервал между одинаковыми сообщениями (секунды)
    uint32_t dedup_interval_s = 60;
};

/**
 * @brief Полная конфигурация эмулятора
 */
struct Config {
    ApiConfig api;
    ThermalConfig thermal;
    FaultConfig fault;
    ShareTimingConfig share_timing;
    DomainSettings domain;
    TelemetryConfig telemetry;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь (ошибка, если файла нет)
     * 2. ./asic-emulator.toml
     * 3. /etc/asic-emulator/asic-emulator.toml
     * 4. ~/.config/asic-emulator/asic-emulator.toml
     *
     * Если путь не указан и файл не найден, возвращается конфигурация
     * по умолчанию.
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет диапазоны числовых значений и имя профиля по умолчанию.
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace asicemu
