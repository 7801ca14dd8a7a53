/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <format>
#include <vector>

namespace asicemu {

namespace {

// =============================================================================
// Разбор секций
// =============================================================================

void read_api(const toml::table& api, ApiConfig& out) {
    if (auto val = api["enabled"].value<bool>()) {
        out.enabled = *val;
    }
    if (auto val = api["bind_address"].value<std::string>()) {
        out.bind_address = *val;
    }
    if (auto val = api["port"].value<int64_t>()) {
        out.port = static_cast<uint16_t>(*val);
    }
    if (auto val = api["read_timeout_ms"].value<int64_t>()) {
        out.read_timeout = std::chrono::milliseconds(*val);
    }
    if (auto val = api["shutdown_grace_ms"].value<int64_t>()) {
        out.shutdown_grace = std::chrono::milliseconds(*val);
    }
}

void read_thermal(const toml::table& thermal, ThermalConfig& out) {
    if (auto val = thermal["r_thermal"].value<double>()) {
        out.r_thermal = *val;
    }
    if (auto val = thermal["c_thermal"].value<double>()) {
        out.c_thermal = *val;
    }
    if (auto val = thermal["initial_temp_c"].value<double>()) {
        out.initial_temp_c = *val;
    }
    if (auto val = thermal["ambient_floor_c"].value<double>()) {
        out.ambient_floor_c = *val;
    }
    if (auto val = thermal["ceiling_c"].value<double>()) {
        out.ceiling_c = *val;
    }
    if (auto val = thermal["max_step_ms"].value<int64_t>()) {
        out.max_step = std::chrono::milliseconds(*val);
    }
    if (auto val = thermal["noise_c"].value<double>()) {
        out.noise_c = *val;
    }
}

void read_fault(const toml::table& fault, FaultConfig& out) {
    if (auto val = fault["nonce_error_rate"].value<double>()) {
        out.nonce_error_rate = *val;
    }
    if (auto val = fault["silence_period_s"].value<int64_t>()) {
        out.silence_period = std::chrono::seconds(*val);
    }
    // Отрицательное значение отключает начальную "молчащую" плату
    if (auto val = fault["initial_silent_unit"].value<int64_t>()) {
        if (*val < 0) {
            out.initial_silent_unit = std::nullopt;
        } else {
            out.initial_silent_unit = static_cast<std::size_t>(*val);
        }
    }
    if (auto val = fault["degradation_enabled"].value<bool>()) {
        out.degradation_enabled = *val;
    }
    if (auto val = fault["uptime_factor_per_hour"].value<double>()) {
        out.uptime_factor_per_hour = *val;
    }
    if (auto val = fault["thermal_optimum_c"].value<double>()) {
        out.thermal_optimum_c = *val;
    }
    if (auto val = fault["thermal_factor_per_c"].value<double>()) {
        out.thermal_factor_per_c = *val;
    }
    if (auto val = fault["seed"].value<int64_t>()) {
        out.seed = static_cast<uint64_t>(*val);
    }
}

void read_share_timing(const toml::table& timing, ShareTimingConfig& out) {
    if (auto val = timing["mean_interval_ms"].value<int64_t>()) {
        out.mean_interval = std::chrono::milliseconds(*val);
    }
    if (auto val = timing["jitter_stddev_ms"].value<int64_t>()) {
        out.jitter_stddev = std::chrono::milliseconds(*val);
    }
    if (auto val = timing["floor_interval_ms"].value<int64_t>()) {
        out.floor_interval = std::chrono::milliseconds(*val);
    }
}

Result<void> read_domain(const toml::table& domain, DomainSettings& out) {
    if (auto val = domain["default_profile"].value<std::string>()) {
        out.default_profile = *val;
    }
    if (auto val = domain["native_control"].value<bool>()) {
        out.native_control = *val;
    }
    if (auto val = domain["probe_timeout_ms"].value<int64_t>()) {
        out.probe_timeout = std::chrono::milliseconds(*val);
    }

    // Переопределения из [domain.profiles.<NAME>]
    if (auto profiles = domain["profiles"].as_table()) {
        for (const auto& [key, node] : *profiles) {
            auto profile = emulation::profile_from_string(key.str());
            if (!profile) {
                return Err<void>(
                    ErrorCode::ConfigUnknownProfile,
                    std::format("Неизвестный профиль в [domain.profiles]: {}", key.str())
                );
            }

            auto* table = node.as_table();
            if (!table) {
                continue;
            }

            auto& entry = out.profiles[*profile];
            entry.name = *profile;
            if (auto val = (*table)["voltage_mv"].value<int64_t>()) {
                entry.voltage_mv = static_cast<uint32_t>(*val);
            }
            if (auto val = (*table)["frequency_mhz"].value<int64_t>()) {
                entry.frequency_mhz = static_cast<uint32_t>(*val);
            }
            if (auto val = (*table)["power_limit_w"].value<double>()) {
                entry.power_limit_w = *val;
            }
            if (auto val = (*table)["fan_percent"].value<int64_t>()) {
                entry.fan_percent = static_cast<uint32_t>(*val);
            }
        }
    }

    return {};
}

void read_telemetry(const toml::table& telemetry, TelemetryConfig& out) {
    if (auto val = telemetry["unit_count"].value<int64_t>()) {
        out.unit_count = static_cast<std::size_t>(*val);
    }
    if (auto val = telemetry["fan_count"].value<int64_t>()) {
        out.fan_count = static_cast<std::size_t>(*val);
    }
    if (auto val = telemetry["nominal_rate_mhs"].value<double>()) {
        out.nominal_rate_mhs = *val;
    }
    if (auto val = telemetry["reference_frequency_mhz"].value<int64_t>()) {
        out.reference_frequency_mhz = static_cast<uint32_t>(*val);
    }
    if (auto val = telemetry["rate_variance"].value<double>()) {
        out.rate_variance = *val;
    }
    if (auto val = telemetry["max_fan_rpm"].value<int64_t>()) {
        out.max_fan_rpm = static_cast<uint32_t>(*val);
    }
    if (auto val = telemetry["pool_reject_ratio"].value<double>()) {
        out.pool_reject_ratio = *val;
    }
    if (auto val = telemetry["voltage_floor_mv"].value<int64_t>()) {
        out.voltage_floor_mv = static_cast<uint32_t>(*val);
    }
    if (auto val = telemetry["nominal_power_w"].value<double>()) {
        out.nominal_power_w = *val;
    }
}

void read_logging(const toml::table& logging, LoggingConfig& out) {
    if (auto val = logging["level"].value<std::string>()) {
        out.level = *val;
    }
    if (auto val = logging["color"].value<bool>()) {
        out.color = *val;
    }
    if (auto val = logging["dedup_interval_s"].value<int64_t>()) {
        out.dedup_interval_s = static_cast<uint32_t>(*val);
    }
}

Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [api] ===
    if (auto api = table["api"].as_table()) {
        read_api(*api, config.api);
    }

    // === Секция [thermal] ===
    if (auto thermal = table["thermal"].as_table()) {
        read_thermal(*thermal, config.thermal);
    }

    // === Секция [fault] ===
    if (auto fault = table["fault"].as_table()) {
        read_fault(*fault, config.fault);
    }

    // === Секция [share_timing] ===
    if (auto timing = table["share_timing"].as_table()) {
        read_share_timing(*timing, config.share_timing);
    }

    // === Секция [domain] ===
    if (auto domain = table["domain"].as_table()) {
        auto result = read_domain(*domain, config.domain);
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    // === Секция [telemetry] ===
    if (auto telemetry = table["telemetry"].as_table()) {
        read_telemetry(*telemetry, config.telemetry);
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        read_logging(*logging, config.logging);
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    // Стандартные пути
    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("asic-emulator.toml");
    search_paths.push_back("/etc/asic-emulator/asic-emulator.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "asic-emulator" / "asic-emulator.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Config{};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Тепловая модель
    if (!(thermal.r_thermal > 0.0) || !(thermal.c_thermal > 0.0)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "r_thermal и c_thermal должны быть положительными"
        );
    }
    if (!(thermal.ambient_floor_c < thermal.ceiling_c)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "ambient_floor_c должна быть ниже ceiling_c"
        );
    }
    if (thermal.initial_temp_c < thermal.ambient_floor_c ||
        thermal.initial_temp_c > thermal.ceiling_c) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("initial_temp_c вне диапазона [{}, {}]",
                        thermal.ambient_floor_c, thermal.ceiling_c)
        );
    }
    if (thermal.max_step.count() <= 0 || thermal.noise_c < 0.0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "max_step_ms должен быть положительным, noise_c неотрицательным"
        );
    }

    // Модель отказов
    if (!(fault.nonce_error_rate >= 0.0 && fault.nonce_error_rate <= 1.0)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "nonce_error_rate должен быть в диапазоне [0, 1]"
        );
    }
    if (fault.silence_period.count() <= 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "silence_period_s должен быть положительным"
        );
    }
    if (fault.initial_silent_unit && *fault.initial_silent_unit >= telemetry.unit_count) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("initial_silent_unit {} вне диапазона плат (всего {})",
                        *fault.initial_silent_unit, telemetry.unit_count)
        );
    }
    if (fault.uptime_factor_per_hour < 0.0 || fault.thermal_factor_per_c < 0.0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Коэффициенты деградации не могут быть отрицательными"
        );
    }

    // Тайминг шар
    if (share_timing.mean_interval.count() <= 0 ||
        share_timing.jitter_stddev.count() < 0 ||
        share_timing.floor_interval.count() < 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Некорректные интервалы [share_timing]"
        );
    }

    // Домены питания
    if (!emulation::profile_from_string(domain.default_profile)) {
        return Err<void>(
            ErrorCode::ConfigUnknownProfile,
            std::format("Неизвестный профиль по умолчанию: {}", domain.default_profile)
        );
    }
    for (const auto& [name, profile] : domain.profiles) {
        if (profile.fan_percent > 100 || !(profile.power_limit_w >= 0.0)) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Некорректные параметры профиля {}", emulation::to_string(name))
            );
        }
    }

    // Телеметрия
    if (telemetry.unit_count == 0 || telemetry.fan_count == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "unit_count и fan_count должны быть больше 0"
        );
    }
    if (telemetry.fan_count > constants::MAX_FAN_COUNT) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("fan_count не больше {}", constants::MAX_FAN_COUNT)
        );
    }
    if (!(telemetry.nominal_rate_mhs > 0.0) || telemetry.reference_frequency_mhz == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "nominal_rate_mhs и reference_frequency_mhz должны быть положительными"
        );
    }
    // Разброс ограничен, чтобы цифры не выглядели неправдоподобно
    if (telemetry.rate_variance < 0.0 || telemetry.rate_variance > 0.05) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "rate_variance должен быть в диапазоне [0, 0.05]"
        );
    }
    if (telemetry.pool_reject_ratio < 0.0 || telemetry.pool_reject_ratio > 1.0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "pool_reject_ratio должен быть в диапазоне [0, 1]"
        );
    }
    if (!std::isfinite(telemetry.nominal_power_w) || telemetry.nominal_power_w < 0.0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "nominal_power_w должна быть неотрицательной"
        );
    }

    // Логирование
    if (logging.level != "info" && logging.level != "warning" && logging.level != "critical") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "level должен быть 'info', 'warning' или 'critical'"
        );
    }

    return {};
}

} // namespace asicemu
