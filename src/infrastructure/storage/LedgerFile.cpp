#include "infrastructure/storage/LedgerFile.hpp"

#include "core/identity/IdentityResolver.hpp"
#include "core/types/Ipv4.hpp"
#include "infrastructure/storage/Csv.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

namespace netledger::infra {

namespace {

enum class Column { Identity, Ips, Hostnames, Alive, Ports, FailedPings, Extra };

Column classify(const std::string& name) {
    if (name == "Identity" || name == "MAC Address") {
        return Column::Identity;
    }
    if (name == "IPs") {
        return Column::Ips;
    }
    if (name == "Hostnames") {
        return Column::Hostnames;
    }
    if (name == "Alive") {
        return Column::Alive;
    }
    if (name == "Ports") {
        return Column::Ports;
    }
    if (name == "FailedPings" || name == "Failed_Pings") {
        return Column::FailedPings;
    }
    return Column::Extra;
}

std::optional<int> parseNonNegative(const std::string& text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ';';
        }
        out += items[i];
    }
    return out;
}

std::string trimmed(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// Rows that share an identity after normalization. Sets are united, so a
// host seen under two addresses ends up with both and is pruned on reconcile.
void mergeRecord(core::HostRecord& into, const core::HostRecord& from) {
    into.ips.insert(from.ips.begin(), from.ips.end());
    into.hostnames.insert(from.hostnames.begin(), from.hostnames.end());
    into.ports.insert(from.ports.begin(), from.ports.end());
    into.alive = into.alive || from.alive;
    into.failedPings = std::min(into.failedPings, from.failedPings);
    for (const auto& [column, value] : from.extra) {
        auto& current = into.extra[column];
        if (current.empty()) {
            current = value;
        }
    }
}

} // namespace

LedgerFile::LedgerFile(std::filesystem::path path) : path_(std::move(path)) {}

core::Ledger LedgerFile::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("Ledger {} not found, starting empty", path_.string());
        return {};
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        spdlog::warn("Cannot open ledger {}, starting empty", path_.string());
        return {};
    }

    try {
        auto ledger = parse(file);
        spdlog::debug("Loaded {} ledger records from {}", ledger.size(), path_.string());
        return ledger;
    } catch (const std::exception& e) {
        auto backup = path_;
        backup += ".corrupt";
        std::filesystem::copy_file(path_, backup, std::filesystem::copy_options::overwrite_existing,
                                   ec);
        spdlog::warn("Ledger {} is corrupt ({}), starting empty; original kept at {}",
                     path_.string(), e.what(), ec ? "<copy failed>" : backup.string());
        return {};
    }
}

bool LedgerFile::save(const core::Ledger& ledger) const {
    try {
        writeFileAtomically(path_, serialize(ledger));
        spdlog::debug("Saved {} ledger records to {}", ledger.size(), path_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save ledger: {}", e.what());
        return false;
    }
}

core::Ledger LedgerFile::parse(std::istream& input) {
    auto rows = Csv::parse(input);
    core::Ledger ledger;
    if (rows.empty()) {
        return ledger;
    }

    const auto& header = rows.front();
    std::vector<Column> kinds;
    std::optional<size_t> identityIndex;
    kinds.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        auto name = trimmed(header[i]);
        auto kind = classify(name);
        kinds.push_back(kind);
        if (kind == Column::Identity && !identityIndex) {
            identityIndex = i;
        } else if (kind == Column::Extra) {
            ledger.addExtraColumn(name);
        }
    }
    if (!identityIndex) {
        throw std::runtime_error("header has no Identity column");
    }

    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        auto field = [&row](size_t i) -> std::string { return i < row.size() ? row[i] : ""; };

        auto raw = trimmed(field(*identityIndex));
        if (raw.empty()) {
            continue;
        }
        auto identity = core::IdentityResolver::normalizeHardwareAddress(raw).value_or(raw);

        core::HostRecord record;
        record.identity = identity;
        for (size_t i = 0; i < kinds.size(); ++i) {
            const auto value = field(i);
            switch (kinds[i]) {
            case Column::Identity:
                break;
            case Column::Ips:
                for (auto& ip : splitList(value)) {
                    record.ips.insert(std::move(ip));
                }
                break;
            case Column::Hostnames:
                for (auto& name : splitList(value)) {
                    record.hostnames.insert(std::move(name));
                }
                break;
            case Column::Alive:
                record.alive = trimmed(value) == "1";
                break;
            case Column::Ports:
                for (const auto& port : splitList(value)) {
                    auto parsed = parseNonNegative(port);
                    if (parsed && *parsed >= 1 && *parsed <= 65535) {
                        record.ports.insert(static_cast<uint16_t>(*parsed));
                    }
                }
                break;
            case Column::FailedPings:
                record.failedPings = parseNonNegative(trimmed(value)).value_or(0);
                break;
            case Column::Extra: {
                auto name = trimmed(header[i]);
                if (std::find(ledger.extraColumns.begin(), ledger.extraColumns.end(), name) !=
                    ledger.extraColumns.end()) {
                    record.extra.try_emplace(name, value);
                }
                break;
            }
            }
        }
        for (const auto& column : ledger.extraColumns) {
            record.extra.try_emplace(column, "");
        }

        auto existing = ledger.records.find(identity);
        if (existing == ledger.records.end()) {
            ledger.records.emplace(identity, std::move(record));
        } else {
            spdlog::warn("Ledger rows for {} merged", identity);
            mergeRecord(existing->second, record);
        }
    }
    return ledger;
}

std::string LedgerFile::serialize(const core::Ledger& ledger) {
    std::vector<CsvRow> rows;
    rows.reserve(ledger.size() + 1);
    rows.push_back(ledger.header());

    for (const auto* record : ledger.sortedByIp()) {
        std::vector<std::string> ips(record->ips.begin(), record->ips.end());
        std::sort(ips.begin(), ips.end(), [](const auto& a, const auto& b) {
            return core::ipSortKey(a) < core::ipSortKey(b);
        });
        std::vector<std::string> hostnames(record->hostnames.begin(), record->hostnames.end());
        std::vector<std::string> ports;
        for (auto port : record->ports) {
            ports.push_back(std::to_string(port));
        }

        CsvRow row = {record->identity,
                      join(ips),
                      join(hostnames),
                      record->alive ? "1" : "0",
                      join(ports),
                      std::to_string(record->failedPings)};
        for (const auto& column : ledger.extraColumns) {
            auto it = record->extra.find(column);
            row.push_back(it != record->extra.end() ? it->second : "");
        }
        rows.push_back(std::move(row));
    }
    return Csv::format(rows);
}

} // namespace netledger::infra
