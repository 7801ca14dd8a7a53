/**
 * @file status_snapshot.cpp
 * @brief Сериализация ответа get_miner_status.cgi
 */

#include "status_snapshot.hpp"

#include <algorithm>

namespace asicemu::telemetry {

// =============================================================================
// Счётчики
// =============================================================================

CumulativeCounters merge_counters(const CumulativeCounters& current,
                                  const CumulativeCounters& update) {
    CumulativeCounters merged;
    merged.as_of = std::max(current.as_of, update.as_of);
    merged.best_share = std::max(current.best_share, update.best_share);

    const std::size_t count = std::max(current.units.size(), update.units.size());
    merged.units.resize(count);

    for (std::size_t i = 0; i < count; ++i) {
        const UnitCounters a = i < current.units.size() ? current.units[i] : UnitCounters{};
        const UnitCounters b = i < update.units.size() ? update.units[i] : UnitCounters{};

        merged.units[i].accepted = std::max(a.accepted, b.accepted);
        merged.units[i].rejected = std::max(a.rejected, b.rejected);
        merged.units[i].hw_errors = std::max(a.hw_errors, b.hw_errors);
        merged.units[i].dropped = std::max(a.dropped, b.dropped);
    }

    return merged;
}

// =============================================================================
// to_json
// =============================================================================

void to_json(nlohmann::ordered_json& j, const StatusEntry& entry) {
    j = nlohmann::ordered_json{
        {"STATUS", entry.status},
        {"When", entry.when},
        {"Code", entry.code},
        {"Msg", entry.msg}
    };
}

void to_json(nlohmann::ordered_json& j, const SummaryEntry& entry) {
    j = nlohmann::ordered_json{
        {"Elapsed", entry.elapsed},
        {"MHS av", entry.mhs_av},
        {"MHS 5s", entry.mhs_5s},
        {"Temperature", entry.temperature},
        {"Fan Speed", entry.fan_speed},
        {"Accepted", entry.accepted},
        {"Rejected", entry.rejected},
        {"Hardware Errors", entry.hardware_errors},
        {"Total MH", entry.total_mh},
        {"Pool Rejected%", entry.pool_rejected_percent},
        {"Best Share", entry.best_share}
    };
}

void to_json(nlohmann::ordered_json& j, const DeviceEntry& entry) {
    j = nlohmann::ordered_json{
        {"ASC", entry.asc},
        {"Name", entry.name},
        {"Temperature", entry.temperature},
        {"MHS av", entry.mhs_av},
        {"Accepted", entry.accepted},
        {"Rejected", entry.rejected},
        {"Hardware Errors", entry.hardware_errors}
    };
}

void to_json(nlohmann::ordered_json& j, const FanEntry& entry) {
    j = nlohmann::ordered_json{
        {"ID", entry.id},
        {"Speed", entry.speed}
    };
}

void to_json(nlohmann::ordered_json& j, const TempEntry& entry) {
    j = nlohmann::ordered_json{
        {"ID", entry.id},
        {"Temperature", entry.temperature}
    };
}

void to_json(nlohmann::ordered_json& j, const MinerStatus& status) {
    j = nlohmann::ordered_json{
        {"STATUS", status.status},
        {"SUMMARY", status.summary},
        {"DEVS", status.devs},
        {"FANS", status.fans},
        {"TEMPS", status.temps}
    };
}

std::string serialize(const MinerStatus& status) {
    return nlohmann::ordered_json(status).dump();
}

} // namespace asicemu::telemetry
