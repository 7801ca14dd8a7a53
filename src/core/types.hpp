/**
 * @file types.hpp
 * @brief Базовые типы для ASIC Emulator
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Clock / TimePoint: монотонные часы симуляции
 * - Rng: инжектируемый генератор случайных чисел
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ни один компонент эмулятора не должен аварийно завершать процесс:
 *       все ошибки возвращаются через Result и деградируют функциональность.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <random>
#include <string>
#include <string_view>

namespace asicemu {

// =============================================================================
// Время и случайность
// =============================================================================

/**
 * @brief Часы симуляции
 *
 * Монотонные часы: переход системного времени назад не ломает
 * тепловую модель и окна ротации плат.
 */
using Clock = std::chrono::steady_clock;

/// @brief Момент времени симуляции
using TimePoint = Clock::time_point;

/// @brief Длительность с дробными секундами
using Seconds = std::chrono::duration<double>;

/**
 * @brief Генератор случайных чисел
 *
 * Передаётся явно во все стохастические компоненты, чтобы поведение
 * было воспроизводимым в тестах с фиксированным seed.
 */
using Rng = std::mt19937_64;

// =============================================================================
// Коды ошибок эмулятора
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Используется вместо исключений: ни одна ошибка эмулятора не является
 * фатальной для хост-процесса.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,
    ConfigUnknownProfile = 103,

    // Ошибки сети (200-299)
    NetworkSocketFailed = 200,
    NetworkBindFailed = 201,
    NetworkListenFailed = 202,

    // Ошибки проверки возможностей железа (300-399)
    ProbeToolMissing = 300,
    ProbeTimeout = 301,
    ProbeFailed = 302,

    // Ошибки нативного канала управления (400-499)
    NativeCommandFailed = 400,
    NativeCommandTimeout = 401,
    NativeSpawnFailed = 402,

    // Ошибки валидации запросов API (500-599)
    ValidationMalformedJson = 500,
    ValidationMissingField = 501,
    ValidationOutOfRange = 502,

    // Ошибки интеграции (600-699)
    InvalidArgument = 600,
    InvalidState = 601,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::ConfigUnknownProfile: return "Неизвестный профиль питания";
        case ErrorCode::NetworkSocketFailed: return "Не удалось создать сокет";
        case ErrorCode::NetworkBindFailed: return "Порт API недоступен";
        case ErrorCode::NetworkListenFailed: return "Не удалось начать прослушивание";
        case ErrorCode::ProbeToolMissing: return "Нативная утилита управления не найдена";
        case ErrorCode::ProbeTimeout: return "Таймаут проверки нативной утилиты";
        case ErrorCode::ProbeFailed: return "Нативная утилита вернула ошибку";
        case ErrorCode::NativeCommandFailed: return "Ошибка команды нативного управления";
        case ErrorCode::NativeCommandTimeout: return "Таймаут команды нативного управления";
        case ErrorCode::NativeSpawnFailed: return "Не удалось запустить процесс";
        case ErrorCode::ValidationMalformedJson: return "Некорректный JSON";
        case ErrorCode::ValidationMissingField: return "Отсутствует обязательное поле";
        case ErrorCode::ValidationOutOfRange: return "Значение вне допустимого диапазона";
        case ErrorCode::InvalidArgument: return "Некорректный аргумент";
        case ErrorCode::InvalidState: return "Операция недоступна в текущем состоянии";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Категория ошибки (таксономия эмулятора)
 */
enum class ErrorCategory {
    None,
    Configuration,      ///< Неизвестный профиль, ошибки конфигурации
    CapabilityProbe,    ///< Нативная утилита отсутствует или падает
    Validation,         ///< Некорректное тело запроса API
    Bind,               ///< Порт API недоступен
    Native,             ///< Ошибка пересылки в нативный канал
    Integration         ///< Ошибка программиста в вызывающем коде
};

/**
 * @brief Определить категорию по коду ошибки
 */
[[nodiscard]] constexpr ErrorCategory category_of(ErrorCode code) noexcept {
    const auto value = static_cast<int>(code);
    if (value == 0) return ErrorCategory::None;
    if (value < 200) return ErrorCategory::Configuration;
    if (value < 300) return ErrorCategory::Bind;
    if (value < 400) return ErrorCategory::CapabilityProbe;
    if (value < 500) return ErrorCategory::Native;
    if (value < 600) return ErrorCategory::Validation;
    return ErrorCategory::Integration;
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    /**
     * @brief Категория ошибки
     */
    [[nodiscard]] ErrorCategory category() const noexcept {
        return category_of(code);
    }

    /**
     * @brief Оператор сравнения
     */
    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto result = orchestrator.apply_profile("LOW_POWER");
 * if (!result) {
 *     std::cerr << result.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace asicemu
