#include "core/types/HostRecord.hpp"

#include "core/types/Ipv4.hpp"

#include <algorithm>

namespace netledger::core {

std::optional<std::string> HostRecord::primaryIp() const {
    if (ips.empty()) {
        return std::nullopt;
    }
    return *std::min_element(ips.begin(), ips.end(), [](const auto& a, const auto& b) {
        return ipSortKey(a) < ipSortKey(b);
    });
}

std::string HostRecord::primaryHostname() const {
    return hostnames.empty() ? std::string{} : *hostnames.begin();
}

HostStateView HostStateView::fromRecord(const HostRecord& record) {
    HostStateView view;
    view.identity = record.identity;
    view.ip = record.primaryIp().value_or("");
    view.hostname = record.primaryHostname();
    view.ports.assign(record.ports.begin(), record.ports.end());
    view.alive = record.alive;
    return view;
}

std::vector<const HostRecord*> Ledger::sortedByIp() const {
    std::vector<std::pair<uint64_t, const HostRecord*>> keyed;
    keyed.reserve(records.size());
    for (const auto& [identity, record] : records) {
        auto ip = record.primaryIp();
        keyed.emplace_back(ip ? ipSortKey(*ip) : 0, &record);
    }

    // records is already ordered by identity, so a stable sort keeps ties deterministic
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<const HostRecord*> result;
    result.reserve(keyed.size());
    for (const auto& [key, record] : keyed) {
        result.push_back(record);
    }
    return result;
}

std::vector<std::string> Ledger::header() const {
    std::vector<std::string> columns(kReservedColumns.begin(), kReservedColumns.end());
    columns.insert(columns.end(), extraColumns.begin(), extraColumns.end());
    return columns;
}

void Ledger::addExtraColumn(const std::string& name) {
    if (name.empty() || isReservedColumn(name)) {
        return;
    }
    if (std::find(extraColumns.begin(), extraColumns.end(), name) != extraColumns.end()) {
        return;
    }
    extraColumns.push_back(name);
    for (auto& [identity, record] : records) {
        record.extra.try_emplace(name, "");
    }
}

bool isReservedColumn(std::string_view name) {
    return std::find(Ledger::kReservedColumns.begin(), Ledger::kReservedColumns.end(), name) !=
           Ledger::kReservedColumns.end();
}

} // namespace netledger::core
