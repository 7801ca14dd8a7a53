/**
 * @file orchestrator.hpp
 * @brief Оркестратор эмуляции ASIC
 *
 * Владеет жизненным циклом всех компонентов эмулятора и предоставляет
 * единственную точку интеграции для внешнего цикла майнинга.
 *
 * Машина состояний:
 * Uninitialized -> Initializing -> Active -> ShuttingDown -> Stopped
 *
 * Всё изменяемое состояние (тепловая модель, модель отказов, счётчики,
 * тайминг шар, генератор) защищено одним мьютексом. Сетевой ввод-вывод
 * и запуск дочерних процессов выполняются вне него.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../hw/native_control.hpp"
#include "../http/miner_api.hpp"
#include "../telemetry/status_snapshot.hpp"
#include "domain_config.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace asicemu::emulation {

/**
 * @brief Состояние оркестратора
 */
enum class OrchestratorState {
    Uninitialized,
    Initializing,
    Active,
    ShuttingDown,
    Stopped
};

/**
 * @brief Преобразовать состояние в строку
 */
[[nodiscard]] constexpr std::string_view to_string(OrchestratorState state) noexcept {
    switch (state) {
        case OrchestratorState::Uninitialized: return "Uninitialized";
        case OrchestratorState::Initializing:  return "Initializing";
        case OrchestratorState::Active:        return "Active";
        case OrchestratorState::ShuttingDown:  return "ShuttingDown";
        case OrchestratorState::Stopped:       return "Stopped";
        default: return "Unknown";
    }
}

/**
 * @brief Оркестратор эмуляции
 *
 * @code
 * EmulationOrchestrator emulator(config);
 * if (auto r = emulator.initialize(); !r) { ... }
 *
 * while (mining) {
 *     emulator.feed_power(read_power_draw());
 *     if (emulator.should_submit_share()) { ... }
 *     if (auto nonce = emulator.evaluate_unit(board, value)) { ... }
 * }
 * emulator.shutdown();
 * @endcode
 */
class EmulationOrchestrator : public http::TelemetrySource {
public:
    /**
     * @brief Создать оркестратор
     *
     * @param config Полная конфигурация
     * @param prober Проверка нативного канала (по умолчанию реальные процессы)
     */
    explicit EmulationOrchestrator(Config config,
                                   std::optional<hw::ChannelProber> prober = std::nullopt);

    ~EmulationOrchestrator() override;

    // Запрещаем копирование
    EmulationOrchestrator(const EmulationOrchestrator&) = delete;
    EmulationOrchestrator& operator=(const EmulationOrchestrator&) = delete;

    // =========================================================================
    // Жизненный цикл
    // =========================================================================

    /**
     * @brief Запустить эмуляцию
     *
     * Проверяет нативный канал, применяет профиль по умолчанию, прогревает
     * тепловую модель и запускает API. Недоступный порт не фатален:
     * оркестратор переходит в Active без API.
     *
     * @return InvalidState если вызван не из Uninitialized
     */
    [[nodiscard]] Result<void> initialize();

    /**
     * @brief Остановить эмуляцию (идемпотентно)
     */
    void shutdown();

    [[nodiscard]] OrchestratorState state() const noexcept;

    // =========================================================================
    // Точка интеграции
    // =========================================================================

    /**
     * @brief Передать текущую потребляемую мощность
     *
     * @return InvalidArgument для отрицательной или нечисловой мощности,
     *         InvalidState вне Active
     */
    [[nodiscard]] Result<void> feed_power(double watts);

    /**
     * @brief Можно ли отправить шару сейчас (false вне Active)
     */
    [[nodiscard]] bool should_submit_share();

    /**
     * @brief Решить, принимать ли результат платы
     *
     * @return Значение или nullopt (отброшено или вне Active)
     */
    [[nodiscard]] std::optional<uint64_t> evaluate_unit(std::size_t unit_id, uint64_t value);

    /**
     * @brief Свежий снимок телеметрии (доступен в любом состоянии)
     */
    [[nodiscard]] telemetry::StatusSnapshot snapshot() override;

    /**
     * @brief Применить именованный профиль
     *
     * @return ConfigUnknownProfile (состояние не меняется) или InvalidState
     */
    [[nodiscard]] Result<void> apply_profile(std::string_view name);

    /**
     * @brief Применить запрос set_miner_conf.cgi
     */
    [[nodiscard]] Result<void> apply_miner_conf(const http::MinerConfRequest& request) override;

    // =========================================================================
    // Внесение отказов
    // =========================================================================

    /**
     * @brief Отказ вентилятора: в FANS и "Fan Speed" он показывает 0,
     *        в регистре выставляется FAN_FAILURE
     *
     * @return InvalidArgument для несуществующего вентилятора,
     *         InvalidState вне Active
     */
    [[nodiscard]] Result<void> inject_fan_failure(std::size_t fan_id);

    /// @brief Вернуть вентилятор в работу
    [[nodiscard]] Result<void> clear_fan_failure(std::size_t fan_id);

    /**
     * @brief Выставить биты регистра отказов (fault_bits) вручную
     *
     * @return InvalidState вне Active
     */
    [[nodiscard]] Result<void> inject_fault(uint32_t bits);

    /// @brief Снять выставленные вручную биты
    [[nodiscard]] Result<void> clear_fault(uint32_t bits);

    /**
     * @brief Данные для /health
     */
    [[nodiscard]] http::HealthData health() override;

    // =========================================================================
    // Информация
    // =========================================================================

    /// @brief Порт API или 0, если API не запущен
    [[nodiscard]] uint16_t api_port() const noexcept;

    /// @brief Активный профиль питания
    [[nodiscard]] DomainConfig current_domain() const;

    /// @brief Производитель нативного канала или "UNKNOWN"
    [[nodiscard]] std::string vendor() const;

    /// @brief Конфигурация
    [[nodiscard]] const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace asicemu::emulation
