#pragma once

#include "cardforge/repository/BinStore.hpp"
#include "cardforge/repository/MySqlConnectionPool.hpp"

#include <optional>
#include <string>

namespace cardforge::repository {

// Reads the `bin_data` table.
class MySqlBinRepository : public BinStore {
public:
    explicit MySqlBinRepository(MySqlConnectionPool& pool);

    std::optional<model::BinRecord> lookupBin(const std::string& prefix) override;

private:
    MySqlConnectionPool& pool_;
};

// Reads the `blocked_bins` table.
class MySqlBlocklistRepository : public BlocklistStore {
public:
    explicit MySqlBlocklistRepository(MySqlConnectionPool& pool);

    std::optional<model::BlockedPrefix> isBlocked(const std::string& prefix) override;

private:
    MySqlConnectionPool& pool_;
};

} // namespace cardforge::repository
