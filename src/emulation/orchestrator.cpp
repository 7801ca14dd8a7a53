/**
 * @file orchestrator.cpp
 * @brief Реализация оркестратора эмуляции
 */

#include "orchestrator.hpp"

#include "domain_controller.hpp"
#include "fault_injector.hpp"
#include "share_timing.hpp"
#include "thermal_model.hpp"
#include "../monitoring/alerter.hpp"
#include "../telemetry/snapshot_builder.hpp"

#include <atomic>
#include <cmath>
#include <iostream>
#include <mutex>

namespace asicemu::emulation {

namespace {

http::HttpServerConfig make_http_config(const ApiConfig& api) {
    http::HttpServerConfig config;
    config.bind_address = api.bind_address;
    config.port = api.port;
    config.read_timeout = api.read_timeout;
    config.enabled = api.enabled;
    return config;
}

} // anonymous namespace

// =============================================================================
// Impl
// =============================================================================

struct EmulationOrchestrator::Impl {
    Config config;
    hw::ChannelProber prober;
    TimePoint started_at;

    // Жизненный цикл
    std::atomic<OrchestratorState> state{OrchestratorState::Uninitialized};
    std::mutex lifecycle_mutex;

    // Состояние эмуляции (защищено mutex)
    mutable std::mutex mutex;
    ThermalModel thermal;
    FaultInjector fault;
    ShareTimingController share_timing;
    telemetry::CumulativeCounters counters;
    Rng rng;

    // Компоненты со своей синхронизацией
    DomainController domain;
    telemetry::SnapshotBuilder builder;

    // API
    std::unique_ptr<http::TelemetryApiServer> api;
    std::atomic<uint16_t> api_port{0};

    Impl(Config cfg, hw::ChannelProber channel_prober, TimePoint now)
        : config(std::move(cfg))
        , prober(std::move(channel_prober))
        , started_at(now)
        , thermal(config.thermal, now)
        , fault(config.fault, now)
        , share_timing(config.share_timing, config.fault.seed ^ 0x5348'4152'4553ULL)
        , rng(config.fault.seed)
        , domain(config.domain.profiles,
                 profile_from_string(config.domain.default_profile).value_or(DomainProfile::Balanced))
        , builder(config.telemetry, config.thermal, config.share_timing) {
        counters.as_of = now;
        counters.units.resize(config.telemetry.unit_count);
    }

    void set_state(OrchestratorState next) {
        const auto previous = state.exchange(next);
        if (previous != next) {
            monitoring::Alerter::instance().alert_state_changed(to_string(previous), to_string(next));
        }
    }

    [[nodiscard]] bool active() const noexcept {
        return state == OrchestratorState::Active;
    }

    [[nodiscard]] Seconds uptime(TimePoint now) const {
        return std::chrono::duration_cast<Seconds>(now - started_at);
    }
};

// =============================================================================
// Жизненный цикл
// =============================================================================

EmulationOrchestrator::EmulationOrchestrator(Config config, std::optional<hw::ChannelProber> prober) {
    hw::ChannelProber channel_prober = prober
        ? std::move(*prober)
        : hw::make_process_prober(config.domain.probe_timeout);
    impl_ = std::make_unique<Impl>(std::move(config), std::move(channel_prober), Clock::now());
}

EmulationOrchestrator::~EmulationOrchestrator() {
    shutdown();
}

Result<void> EmulationOrchestrator::initialize() {
    std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);

    if (impl_->state != OrchestratorState::Uninitialized) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("initialize() в состоянии ") + std::string(to_string(impl_->state.load())));
    }
    impl_->set_state(OrchestratorState::Initializing);

    // === Проверка нативного канала (один раз, ошибка не фатальна) ===
    if (impl_->config.domain.native_control && impl_->prober) {
        auto probed = impl_->domain.probe(impl_->prober);
        if (!probed) {
            std::cerr << "[Orchestrator] Режим симуляции: " << probed.error().message << std::endl;
        }
    }

    // === Профиль по умолчанию ===
    Result<DomainConfig> selected = Err<DomainConfig>(ErrorCode::ConfigUnknownProfile);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        selected = impl_->domain.select(impl_->config.domain.default_profile);
    }
    if (!selected) {
        impl_->set_state(OrchestratorState::Uninitialized);
        return std::unexpected(selected.error());
    }
    impl_->domain.forward();
    monitoring::Alerter::instance().alert_profile_applied(to_string(selected->name));

    // === Прогрев тепловой модели ===
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        const auto now = Clock::now();
        impl_->thermal.prime(impl_->config.telemetry.nominal_power_w, now);
        impl_->counters.as_of = now;
    }

    // === HTTP API (недоступный порт не фатален) ===
    if (impl_->config.api.enabled) {
        auto api = std::make_unique<http::TelemetryApiServer>(
            make_http_config(impl_->config.api), *this);

        auto started = api->start();
        if (started) {
            impl_->api_port = api->port();
            impl_->api = std::move(api);
            monitoring::Alerter::instance().alert_api_started(
                impl_->config.api.bind_address, impl_->api_port);
        } else {
            std::cerr << "[Orchestrator] " << started.error().message << std::endl;
            monitoring::Alerter::instance().alert_api_unavailable(started.error());
        }
    }

    impl_->set_state(OrchestratorState::Active);
    return {};
}

void EmulationOrchestrator::shutdown() {
    std::lock_guard<std::mutex> lifecycle(impl_->lifecycle_mutex);

    if (impl_->state == OrchestratorState::Stopped) {
        return;
    }
    impl_->set_state(OrchestratorState::ShuttingDown);

    if (impl_->api) {
        impl_->api->stop(impl_->config.api.shutdown_grace);
        impl_->api.reset();
    }
    impl_->api_port = 0;
    impl_->domain.stop_forwarding();

    impl_->set_state(OrchestratorState::Stopped);
}

OrchestratorState EmulationOrchestrator::state() const noexcept {
    return impl_->state;
}

// =============================================================================
// Точка интеграции
// =============================================================================

Result<void> EmulationOrchestrator::feed_power(double watts) {
    if (!std::isfinite(watts) || watts < 0.0) {
        monitoring::Alerter::instance().alert_invalid_power(watts);
        return Err<void>(ErrorCode::InvalidArgument,
            "Мощность должна быть конечным неотрицательным числом");
    }
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("feed_power() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    double temp = 0.0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        const auto now = Clock::now();
        impl_->thermal.update(watts, now);
        temp = impl_->thermal.junction_temp();
        impl_->fault.apply_degradation(impl_->uptime(now), temp);
    }

    if (temp > constants::FAULT_TEMP_THRESHOLD_C) {
        monitoring::Alerter::instance().alert_high_temperature(temp);
    }
    return {};
}

bool EmulationOrchestrator::should_submit_share() {
    if (!impl_->active()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->share_timing.should_submit(Clock::now());
}

std::optional<uint64_t> EmulationOrchestrator::evaluate_unit(std::size_t unit_id, uint64_t value) {
    if (!impl_->active()) {
        return std::nullopt;
    }

    Decision decision;
    std::optional<std::size_t> silenced;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        const auto before = impl_->fault.profile().silent_unit;

        decision = impl_->fault.evaluate(
            impl_->config.telemetry.unit_count, unit_id, value, Clock::now(), impl_->rng);

        if (decision.reason == DropReason::NonceError && unit_id < impl_->counters.units.size()) {
            impl_->counters.units[unit_id].dropped++;
        }

        const auto after = impl_->fault.profile().silent_unit;
        if (after && after != before) {
            silenced = after;
        }
    }

    if (silenced) {
        monitoring::Alerter::instance().alert_unit_silenced(*silenced);
    }

    if (!decision.accepted()) {
        return std::nullopt;
    }
    return decision.value;
}

telemetry::StatusSnapshot EmulationOrchestrator::snapshot() {
    ThermalState thermal;
    FaultProfile fault;
    DomainConfig domain;
    telemetry::CumulativeCounters previous;
    uint64_t seed = 0;
    std::optional<std::size_t> silenced;

    const auto now = Clock::now();

    // Короткая критическая секция: только копирование
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->fault.rotate_if_due(impl_->config.telemetry.unit_count, now)) {
            silenced = impl_->fault.profile().silent_unit;
        }
        thermal = impl_->thermal.state();
        fault = impl_->fault.profile();
        domain = impl_->domain.current();
        previous = impl_->counters;
        seed = impl_->rng();
    }

    if (silenced) {
        monitoring::Alerter::instance().alert_unit_silenced(*silenced);
    }

    // Сборка вне блокировки
    Rng local(seed);
    auto built = impl_->builder.build(thermal, fault, domain, previous, now, impl_->uptime(now), local);

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->counters = telemetry::merge_counters(impl_->counters, built.counters);
    }

    return std::move(built.snapshot);
}

Result<void> EmulationOrchestrator::apply_profile(std::string_view name) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("apply_profile() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    Result<DomainConfig> selected = Err<DomainConfig>(ErrorCode::ConfigUnknownProfile);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        selected = impl_->domain.select(name);
    }
    if (!selected) {
        return std::unexpected(selected.error());
    }

    // Нативный канал - асинхронно, вне блокировки
    impl_->domain.forward();
    monitoring::Alerter::instance().alert_profile_applied(to_string(selected->name));
    return {};
}

Result<void> EmulationOrchestrator::apply_miner_conf(const http::MinerConfRequest& request) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("apply_miner_conf() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    DomainConfig selected;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        DomainConfig next = impl_->domain.current();
        next.frequency_mhz = request.freq_mhz;
        next.voltage_mv = request.volt_mv;
        next.fan_percent = request.fan_percent;
        if (request.power_limit_w) {
            next.power_limit_w = *request.power_limit_w;
        }
        selected = impl_->domain.select_custom(next);
    }

    impl_->domain.forward();
    monitoring::Alerter::instance().alert_profile_applied(to_string(selected.name));
    return {};
}

// =============================================================================
// Внесение отказов
// =============================================================================

Result<void> EmulationOrchestrator::inject_fan_failure(std::size_t fan_id) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("inject_fan_failure() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    Result<void> result;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        result = impl_->fault.inject_fan_failure(fan_id, impl_->config.telemetry.fan_count);
    }
    if (result) {
        monitoring::Alerter::instance().alert_fan_failure(fan_id);
    }
    return result;
}

Result<void> EmulationOrchestrator::clear_fan_failure(std::size_t fan_id) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("clear_fan_failure() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->fault.clear_fan_failure(fan_id, impl_->config.telemetry.fan_count);
}

Result<void> EmulationOrchestrator::inject_fault(uint32_t bits) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("inject_fault() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->fault.inject_fault(bits);
    return {};
}

Result<void> EmulationOrchestrator::clear_fault(uint32_t bits) {
    if (!impl_->active()) {
        return Err<void>(ErrorCode::InvalidState,
            std::string("clear_fault() в состоянии ") + std::string(to_string(impl_->state.load())));
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->fault.clear_fault(bits);
    return {};
}

http::HealthData EmulationOrchestrator::health() {
    auto snap = snapshot();

    http::HealthData data;
    data.start_time = impl_->started_at;
    data.state = std::string(to_string(impl_->state.load()));
    data.hybrid_active = impl_->active();
    data.thermal_temp_c = std::round(snap.thermal.junction_temp * 10.0) / 10.0;
    data.current_domain = std::string(to_string(snap.domain.name));
    data.gpu_vendor = impl_->domain.vendor();
    data.api_port = impl_->api_port;
    data.nonce_error_rate = snap.fault.nonce_error_rate;
    data.share_interval = std::chrono::duration_cast<Seconds>(
        impl_->config.share_timing.mean_interval).count();
    data.silent_unit = snap.fault.silent_unit;
    data.fault_register = snap.fault_register;
    data.is_healthy = data.hybrid_active;
    data.status_message = data.is_healthy ? "healthy" : "inactive";
    return data;
}

// =============================================================================
// Информация
// =============================================================================

uint16_t EmulationOrchestrator::api_port() const noexcept {
    return impl_->api_port;
}

DomainConfig EmulationOrchestrator::current_domain() const {
    return impl_->domain.current();
}

std::string EmulationOrchestrator::vendor() const {
    return impl_->domain.vendor();
}

const Config& EmulationOrchestrator::config() const noexcept {
    return impl_->config;
}

} // namespace asicemu::emulation
