/**
 * @file domain_config.hpp
 * @brief Профили питания (домены напряжения/частоты) хеш-плат
 *
 * Профиль - неизменяемый набор параметров одной рабочей точки:
 * напряжение, частота, лимит мощности и скорость вентиляторов.
 * Таблица по умолчанию соответствует хеш-платам L7.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

namespace asicemu::emulation {

/**
 * @brief Имя профиля питания
 */
enum class DomainProfile {
    LowPower,
    Balanced,
    HighPerformance,
    Custom          ///< Параметры, заданные через set_miner_conf.cgi
};

/**
 * @brief Преобразовать профиль в строку (имя как в конфигурации)
 */
[[nodiscard]] constexpr std::string_view to_string(DomainProfile profile) noexcept {
    switch (profile) {
        case DomainProfile::LowPower:        return "LOW_POWER";
        case DomainProfile::Balanced:        return "BALANCED";
        case DomainProfile::HighPerformance: return "HIGH_PERFORMANCE";
        case DomainProfile::Custom:          return "CUSTOM";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Найти именованный профиль по строке
 *
 * CUSTOM не является именованным профилем и не находится.
 */
[[nodiscard]] constexpr std::optional<DomainProfile> profile_from_string(std::string_view name) noexcept {
    if (name == "LOW_POWER") return DomainProfile::LowPower;
    if (name == "BALANCED") return DomainProfile::Balanced;
    if (name == "HIGH_PERFORMANCE") return DomainProfile::HighPerformance;
    return std::nullopt;
}

/// @brief Все именованные профили
inline constexpr std::array<DomainProfile, 3> NAMED_PROFILES = {
    DomainProfile::LowPower,
    DomainProfile::Balanced,
    DomainProfile::HighPerformance
};

/**
 * @brief Параметры домена питания
 */
struct DomainConfig {
    DomainProfile name{DomainProfile::Balanced};

    /// @brief Напряжение ядра (мВ)
    uint32_t voltage_mv{900};

    /// @brief Частота чипов (МГц)
    uint32_t frequency_mhz{500};

    /// @brief Лимит мощности (Вт)
    double power_limit_w{3425.0};

    /// @brief Скорость вентиляторов (%)
    uint32_t fan_percent{100};

    [[nodiscard]] bool operator==(const DomainConfig& other) const noexcept = default;
};

/// @brief Таблица именованных профилей
using ProfileTable = std::map<DomainProfile, DomainConfig>;

/**
 * @brief Таблица профилей по умолчанию (хеш-платы L7)
 */
[[nodiscard]] inline ProfileTable default_profile_table() {
    return {
        {DomainProfile::LowPower,        {DomainProfile::LowPower,         800, 400, 2800.0, 100}},
        {DomainProfile::Balanced,        {DomainProfile::Balanced,         900, 500, 3425.0, 100}},
        {DomainProfile::HighPerformance, {DomainProfile::HighPerformance, 1000, 600, 4200.0, 100}},
    };
}

} // namespace asicemu::emulation
