#pragma once

#include "cardforge/model/BinRecord.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cardforge::repository {

// Read-only BIN metadata source.
class BinStore {
public:
    virtual ~BinStore() = default;
    virtual std::optional<model::BinRecord> lookupBin(const std::string& prefix) = 0;
};

// Deny-list of test and reserved prefixes.
class BlocklistStore {
public:
    virtual ~BlocklistStore() = default;
    virtual std::optional<model::BlockedPrefix> isBlocked(const std::string& prefix) = 0;
};

class InMemoryBinStore : public BinStore {
public:
    InMemoryBinStore() = default;
    explicit InMemoryBinStore(std::vector<model::BinRecord> records);

    void add(model::BinRecord record);
    std::optional<model::BinRecord> lookupBin(const std::string& prefix) override;
    std::size_t size() const noexcept { return records_.size(); }

private:
    std::unordered_map<std::string, model::BinRecord> records_;
};

class InMemoryBlocklist : public BlocklistStore {
public:
    InMemoryBlocklist() = default;
    explicit InMemoryBlocklist(std::vector<model::BlockedPrefix> entries);

    void add(model::BlockedPrefix entry);
    std::optional<model::BlockedPrefix> isBlocked(const std::string& prefix) override;
    std::size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<std::string, model::BlockedPrefix> entries_;
};

// Consults each layer in order; the first hit wins.
class LayeredBlocklist : public BlocklistStore {
public:
    explicit LayeredBlocklist(std::vector<std::reference_wrapper<BlocklistStore>> layers);

    std::optional<model::BlockedPrefix> isBlocked(const std::string& prefix) override;

private:
    std::vector<std::reference_wrapper<BlocklistStore>> layers_;
};

// Well-known network test ranges that are always refused.
std::vector<model::BlockedPrefix> defaultTestRanges();

} // namespace cardforge::repository
