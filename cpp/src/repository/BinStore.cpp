#include "cardforge/repository/BinStore.hpp"

#include <utility>

namespace cardforge::repository {

InMemoryBinStore::InMemoryBinStore(std::vector<model::BinRecord> records) {
    for (auto& record : records) {
        add(std::move(record));
    }
}

void InMemoryBinStore::add(model::BinRecord record) {
    auto key = record.prefix;
    records_.insert_or_assign(std::move(key), std::move(record));
}

std::optional<model::BinRecord> InMemoryBinStore::lookupBin(const std::string& prefix) {
    auto it = records_.find(prefix);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

InMemoryBlocklist::InMemoryBlocklist(std::vector<model::BlockedPrefix> entries) {
    for (auto& entry : entries) {
        add(std::move(entry));
    }
}

void InMemoryBlocklist::add(model::BlockedPrefix entry) {
    auto key = entry.prefix;
    entries_.insert_or_assign(std::move(key), std::move(entry));
}

std::optional<model::BlockedPrefix> InMemoryBlocklist::isBlocked(const std::string& prefix) {
    auto it = entries_.find(prefix);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LayeredBlocklist::LayeredBlocklist(std::vector<std::reference_wrapper<BlocklistStore>> layers)
    : layers_(std::move(layers)) {}

std::optional<model::BlockedPrefix> LayeredBlocklist::isBlocked(const std::string& prefix) {
    for (auto& layer : layers_) {
        if (auto hit = layer.get().isBlocked(prefix)) {
            return hit;
        }
    }
    return std::nullopt;
}

std::vector<model::BlockedPrefix> defaultTestRanges() {
    static const char* const kPrefixes[] = {
        "411111", "555555", "378734", "371449", "601111", "630495", "630490",
        "360000", "305693", "385200", "601100", "353011", "356600"};
    std::vector<model::BlockedPrefix> entries;
    for (const char* prefix : kPrefixes) {
        entries.push_back(model::BlockedPrefix{prefix, "test BIN"});
    }
    return entries;
}

} // namespace cardforge::repository
