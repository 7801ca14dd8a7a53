/**
 * @file domain_controller.hpp
 * @brief Управление доменами питания
 *
 * Сопоставляет имя профиля с параметрами (напряжение, частота,
 * мощность, вентиляторы) и при наличии нативного канала передаёт
 * их утилите производителя.
 *
 * Выбор профиля (select) и передача в канал (forward) разделены:
 * оркестратор держит свою блокировку только на время выбора,
 * а ввод-вывод дочерних процессов выполняется вне неё.
 *
 * Передача асинхронная: forward() только отмечает запрос, а отдельный
 * поток канала применяет профиль, активный на момент обработки.
 * Несколько запросов подряд схлопываются в один, поэтому канал всегда
 * приходит к последнему выбранному профилю.
 */

#pragma once

#include "domain_config.hpp"
#include "../core/types.hpp"
#include "../hw/native_control.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace asicemu::emulation {

/**
 * @brief Контроллер доменов питания
 *
 * Потокобезопасен. Активный профиль - неизменяемое значение,
 * указатель на которое подменяется целиком.
 */
class DomainController {
public:
    /**
     * @brief Создать контроллер
     *
     * @param profiles Таблица именованных профилей
     * @param initial Имя профиля до первого apply
     */
    explicit DomainController(ProfileTable profiles,
                              DomainProfile initial = DomainProfile::Balanced);

    ~DomainController();

    // Запрещаем копирование
    DomainController(const DomainController&) = delete;
    DomainController& operator=(const DomainController&) = delete;

    // =========================================================================
    // Проверка возможностей
    // =========================================================================

    /**
     * @brief Найти нативный канал управления
     *
     * Выполняется один раз, результат кешируется. Ошибка не фатальна:
     * контроллер остаётся в режиме симуляции.
     *
     * @return Результат первой проверки (повторные вызовы возвращают его же)
     */
    Result<void> probe(const hw::ChannelProber& prober);

    /// @brief Установлен ли нативный канал
    [[nodiscard]] bool has_native_channel() const;

    /// @brief Производитель канала или "UNKNOWN"
    [[nodiscard]] std::string vendor() const;

    // =========================================================================
    // Выбор профиля
    // =========================================================================

    /**
     * @brief Сделать активным именованный профиль (без ввода-вывода)
     *
     * @return Параметры профиля или ConfigUnknownProfile
     */
    [[nodiscard]] Result<DomainConfig> select(std::string_view profile_name);

    /**
     * @brief Сделать активными произвольные параметры (CUSTOM)
     */
    DomainConfig select_custom(DomainConfig config);

    /**
     * @brief Запросить передачу активного профиля в нативный канал
     *
     * Не ждёт завершения утилиты. Ошибки только логируются.
     * Без канала или после stop_forwarding() ничего не делает.
     */
    void forward();

    /**
     * @brief Дождаться обработки всех запросов forward()
     *
     * @return false если таймаут истёк раньше
     */
    bool wait_forwarded(std::chrono::milliseconds timeout);

    /**
     * @brief Остановить поток канала (идемпотентно)
     *
     * Уже запущенная команда дорабатывает до своего таймаута.
     */
    void stop_forwarding();

    /**
     * @brief select + forward
     *
     * Неизвестное имя возвращает ConfigUnknownProfile и ничего не меняет.
     * Ошибка нативного канала не делает apply неуспешным.
     */
    [[nodiscard]] Result<void> apply(std::string_view profile_name);

    /**
     * @brief select_custom + forward
     */
    void apply_custom(const DomainConfig& config);

    // =========================================================================
    // Состояние
    // =========================================================================

    /// @brief Активный профиль
    [[nodiscard]] DomainConfig current() const;

    /// @brief Таблица профилей
    [[nodiscard]] const ProfileTable& profiles() const noexcept { return profiles_; }

private:
    /**
     * @brief Цикл потока канала
     */
    void forward_loop();

    const ProfileTable profiles_;

    mutable std::mutex mutex_;
    std::shared_ptr<const DomainConfig> active_;
    std::shared_ptr<hw::NativeControlChannel> channel_;
    bool probed_{false};
    Result<void> probe_result_;

    // Поток канала (защищено mutex_)
    std::condition_variable forward_cv_;
    std::thread forward_thread_;
    uint64_t requested_generation_{0};
    uint64_t forwarded_generation_{0};
    bool stopping_{false};
};

} // namespace asicemu::emulation
