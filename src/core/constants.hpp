/**
 * @file constants.hpp
 * @brief Константы эмулируемого устройства (Antminer L7)
 *
 * Значения по умолчанию для тепловой модели, модели отказов,
 * тайминга шар и телеметрии. Все они могут быть переопределены
 * в конфигурации.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace asicemu::constants {

// =============================================================================
// Тепловая модель
// =============================================================================

/// @brief Тепловое сопротивление по умолчанию (K/W)
inline constexpr double DEFAULT_R_THERMAL = 1.5;

/// @brief Теплоёмкость по умолчанию (J/K)
inline constexpr double DEFAULT_C_THERMAL = 250.0;

/// @brief Начальная температура кристалла (типичный idle ASIC, °C)
inline constexpr double DEFAULT_INITIAL_TEMP_C = 65.0;

/// @brief Нижняя граница температуры (окружающая среда, °C)
inline constexpr double DEFAULT_AMBIENT_FLOOR_C = 20.0;

/// @brief Верхняя граница правдоподобной температуры (°C)
inline constexpr double DEFAULT_TEMP_CEILING_C = 95.0;

/// @brief Максимальный шаг интегрирования (мс)
inline constexpr uint32_t DEFAULT_MAX_STEP_MS = 2000;

/// @brief Амплитуда шума датчика (±°C)
inline constexpr double DEFAULT_SENSOR_NOISE_C = 0.3;

/// @brief Порог TEMP_OVER_85C в регистре отказов (°C)
inline constexpr double FAULT_TEMP_THRESHOLD_C = 85.0;

// =============================================================================
// Модель отказов
// =============================================================================

/// @brief Вероятность ошибки nonce (0.005% как у реального L7)
inline constexpr double DEFAULT_NONCE_ERROR_RATE = 5e-5;

/// @brief Период ротации "молчащей" платы (20 минут)
inline constexpr uint32_t DEFAULT_SILENCE_PERIOD_S = 1200;

/// @brief Оптимальная температура для модели деградации (°C)
inline constexpr double DEFAULT_THERMAL_OPTIMUM_C = 70.0;

/// @brief Seed генератора по умолчанию
inline constexpr uint64_t DEFAULT_SEED = 0x4c37'4153'4943ULL;

// =============================================================================
// Тайминг шар
// =============================================================================

/// @brief Средний интервал между шарами (мс)
inline constexpr uint32_t DEFAULT_SHARE_MEAN_MS = 5200;

/// @brief Стандартное отклонение интервала (мс)
inline constexpr uint32_t DEFAULT_SHARE_STDDEV_MS = 800;

/// @brief Минимальный интервал между шарами (мс)
inline constexpr uint32_t DEFAULT_SHARE_FLOOR_MS = 1000;

// =============================================================================
// Домены питания
// =============================================================================

/// @brief Профиль по умолчанию
inline constexpr const char* DEFAULT_PROFILE = "BALANCED";

/// @brief Номинальная мощность L7 (W)
inline constexpr double DEFAULT_NOMINAL_POWER_W = 3425.0;

/// @brief Таймаут проверки нативной утилиты (мс)
inline constexpr uint32_t DEFAULT_PROBE_TIMEOUT_MS = 2000;

/// @brief Нижняя граница напряжения для бита VOLTAGE_LOW (мВ)
inline constexpr uint32_t DEFAULT_VOLTAGE_FLOOR_MV = 700;

// =============================================================================
// Телеметрия
// =============================================================================

/// @brief Количество хеш-плат
inline constexpr std::size_t DEFAULT_UNIT_COUNT = 3;

/// @brief Количество вентиляторов
inline constexpr std::size_t DEFAULT_FAN_COUNT = 4;

/// @brief Максимум вентиляторов (маска отказов - 32 бита)
inline constexpr std::size_t MAX_FAN_COUNT = 32;

/// @brief Номинальный хешрейт одной платы (MH/s)
inline constexpr double DEFAULT_NOMINAL_RATE_MHS = 9500.0;

/// @brief Частота, при которой достигается номинальный хешрейт (MHz)
inline constexpr uint32_t DEFAULT_REFERENCE_FREQUENCY_MHZ = 500;

/// @brief Разброс хешрейта между платами (±2%)
inline constexpr double DEFAULT_RATE_VARIANCE = 0.02;

/// @brief Разброс температуры между платами (±°C)
inline constexpr double UNIT_TEMP_SPREAD_C = 2.0;

/// @brief Разброс "MHS 5s" относительно среднего (±5%)
inline constexpr double SHORT_RATE_VARIANCE = 0.05;

/// @brief Базовые обороты вентилятора при 100% (RPM)
inline constexpr double FAN_BASE_RPM = 4200.0;

/// @brief Температура, выше которой обороты растут (°C)
inline constexpr double FAN_RESPONSE_TEMP_C = 65.0;

/// @brief Прирост оборотов на градус (RPM/°C)
inline constexpr double FAN_RPM_PER_C = 20.0;

/// @brief Шум оборотов (±RPM)
inline constexpr int FAN_RPM_JITTER = 50;

/// @brief Максимальные обороты вентилятора (RPM)
inline constexpr uint32_t DEFAULT_MAX_FAN_RPM = 6000;

/// @brief Доля отклонённых пулом шар
inline constexpr double DEFAULT_POOL_REJECT_RATIO = 0.005;

/// @brief Диапазон "Best Share"
inline constexpr uint64_t BEST_SHARE_MIN = 1'000'000;
inline constexpr uint64_t BEST_SHARE_MAX = 1'000'000'000;

/// @brief Имя устройства в секции DEVS
inline constexpr const char* DEVICE_NAME = "BTM";

/// @brief Код ответа cgminer для секции Summary
inline constexpr int STATUS_CODE_SUMMARY = 11;

// =============================================================================
// HTTP API
// =============================================================================

/// @brief Порт API по умолчанию
inline constexpr uint16_t DEFAULT_API_PORT = 8080;

/// @brief Таймаут чтения запроса (мс)
inline constexpr uint32_t DEFAULT_READ_TIMEOUT_MS = 5000;

/// @brief Время ожидания остановки сервера (мс)
inline constexpr uint32_t DEFAULT_SHUTDOWN_GRACE_MS = 2000;

/// @brief Максимальный размер тела запроса
inline constexpr std::size_t MAX_REQUEST_BODY = 64 * 1024;

/// @brief Путь чтения статуса
inline constexpr const char* MINER_STATUS_PATH = "/cgi-bin/get_miner_status.cgi";

/// @brief Путь записи конфигурации
inline constexpr const char* MINER_CONF_PATH = "/cgi-bin/set_miner_conf.cgi";

/// @brief Путь health check
inline constexpr const char* HEALTH_PATH = "/health";

} // namespace asicemu::constants
