/**
 * @file status_snapshot.hpp
 * @brief Типизированная схема ответа get_miner_status.cgi
 *
 * Каждая секция ответа - отдельная структура. Имена полей на проводе
 * задаются в одном месте (to_json), поэтому расхождение схемы
 * обнаруживается тестами на конкретные ключи.
 *
 * Формат воспроизводит cgminer API прошивки Antminer L7:
 * @code
 * {
 *   "STATUS":  [{"STATUS":"S","When":3600,"Code":11,"Msg":"Summary"}],
 *   "SUMMARY": [{"Elapsed":3600,"MHS av":9500.0,"MHS 5s":9480.3,...}],
 *   "DEVS":    [{"ASC":0,"Name":"BTM","Temperature":71.2,"MHS av":9512.1,...}],
 *   "FANS":    [{"ID":0,"Speed":4380}],
 *   "TEMPS":   [{"ID":0,"Temperature":71.2}]
 * }
 * @endcode
 */

#pragma once

#include "../core/types.hpp"
#include "../emulation/domain_config.hpp"
#include "../emulation/fault_injector.hpp"
#include "../emulation/thermal_model.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace asicemu::telemetry {

// =============================================================================
// Секции ответа
// =============================================================================

/**
 * @brief Секция STATUS
 */
struct StatusEntry {
    std::string status{"S"};
    uint64_t when{0};
    int code{constants::STATUS_CODE_SUMMARY};
    std::string msg{"Summary"};
};

/**
 * @brief Секция SUMMARY
 */
struct SummaryEntry {
    uint64_t elapsed{0};
    double mhs_av{0.0};
    double mhs_5s{0.0};
    double temperature{0.0};
    std::vector<uint32_t> fan_speed;
    uint64_t accepted{0};
    uint64_t rejected{0};
    uint64_t hardware_errors{0};
    double total_mh{0.0};
    double pool_rejected_percent{0.0};
    uint64_t best_share{0};
};

/**
 * @brief Элемент секции DEVS (одна хеш-плата)
 */
struct DeviceEntry {
    std::size_t asc{0};
    std::string name{constants::DEVICE_NAME};
    double temperature{0.0};
    double mhs_av{0.0};
    uint64_t accepted{0};
    uint64_t rejected{0};
    uint64_t hardware_errors{0};
};

/**
 * @brief Элемент секции FANS
 */
struct FanEntry {
    std::size_t id{0};
    uint32_t speed{0};
};

/**
 * @brief Элемент секции TEMPS
 */
struct TempEntry {
    std::size_t id{0};
    double temperature{0.0};
};

/**
 * @brief Документ get_miner_status.cgi целиком
 */
struct MinerStatus {
    std::vector<StatusEntry> status;
    std::vector<SummaryEntry> summary;
    std::vector<DeviceEntry> devs;
    std::vector<FanEntry> fans;
    std::vector<TempEntry> temps;
};

// =============================================================================
// Внутреннее представление
// =============================================================================

/**
 * @brief Телеметрия одной хеш-платы
 */
struct UnitTelemetry {
    std::size_t id{0};

    /// @brief Хешрейт (MH/s)
    double rate_mhs{0.0};

    double temp_c{0.0};
    double voltage_v{0.0};
    uint32_t frequency_mhz{0};

    uint64_t accepted{0};
    uint64_t rejected{0};
    uint64_t hw_errors{0};
};

/**
 * @brief Накопительные счётчики одной платы
 *
 * Дробные аккумуляторы: на проводе публикуется целая часть.
 */
struct UnitCounters {
    double accepted{0.0};
    double rejected{0.0};
    double hw_errors{0.0};

    /// @brief Результаты, отброшенные FaultInjector
    uint64_t dropped{0};
};

/**
 * @brief Накопительные счётчики устройства
 *
 * Передаются через сборщик явно и никогда не уменьшаются.
 */
struct CumulativeCounters {
    /// @brief Момент, до которого счётчики продвинуты
    TimePoint as_of{};

    std::vector<UnitCounters> units;

    uint64_t best_share{0};
};

/**
 * @brief Слить счётчики поэлементным максимумом
 *
 * Два параллельных снимка, построенные из одной копии, не уменьшают
 * и не удваивают счётчики.
 */
[[nodiscard]] CumulativeCounters merge_counters(const CumulativeCounters& current,
                                                const CumulativeCounters& update);

/**
 * @brief Неизменяемый снимок состояния эмулятора
 */
struct StatusSnapshot {
    /// @brief Ответ API
    MinerStatus document;

    /// @brief Состояние моделей на момент снимка
    emulation::ThermalState thermal;
    emulation::FaultProfile fault;
    emulation::DomainConfig domain;

    std::vector<UnitTelemetry> units;

    /// @brief Показание датчика температуры, использованное в снимке
    double sensor_temp_c{0.0};

    /// @brief Регистр отказов (fault_bits)
    uint32_t fault_register{0};
};

// =============================================================================
// Сериализация
// =============================================================================

void to_json(nlohmann::ordered_json& j, const StatusEntry& entry);
void to_json(nlohmann::ordered_json& j, const SummaryEntry& entry);
void to_json(nlohmann::ordered_json& j, const DeviceEntry& entry);
void to_json(nlohmann::ordered_json& j, const FanEntry& entry);
void to_json(nlohmann::ordered_json& j, const TempEntry& entry);
void to_json(nlohmann::ordered_json& j, const MinerStatus& status);

/**
 * @brief Сериализовать документ в JSON строку
 */
[[nodiscard]] std::string serialize(const MinerStatus& status);

} // namespace asicemu::telemetry
