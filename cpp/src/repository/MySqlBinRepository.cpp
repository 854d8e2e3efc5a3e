#include "cardforge/repository/MySqlBinRepository.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <mysqlx/xdevapi.h>

#include <exception>
#include <sstream>

namespace cardforge::repository {
namespace {

std::string readString(const mysqlx::Value& value) {
    if (value.isNull()) {
        return {};
    }
    try {
        return value.get<std::string>();
    } catch (const std::exception& ex) {
        std::ostringstream oss;
        value.print(oss);
        auto text = oss.str();
        if (text.empty()) {
            util::log(util::LogLevel::warn, std::string{"Read string column failed: "} + ex.what());
        }
        return text;
    }
}

std::optional<std::string> readOptionalString(const mysqlx::Value& value) {
    if (value.isNull()) {
        return std::nullopt;
    }
    auto text = readString(value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

model::BinRecord mapBinRecord(mysqlx::Row row) {
    model::BinRecord record;
    std::size_t index = 0;
    record.prefix = readString(row[index++]);
    record.brand = readString(row[index++]);
    record.issuer = readString(row[index++]);
    record.category = model::categoryFromName(readString(row[index++]));
    record.level = readOptionalString(row[index++]);
    record.country = util::toUpper(readString(row[index++]));
    record.countryName = readString(row[index++]);
    return record;
}

} // namespace

MySqlBinRepository::MySqlBinRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

std::optional<model::BinRecord> MySqlBinRepository::lookupBin(const std::string& prefix) {
    auto session = pool_.acquire();
    try {
        mysqlx::Schema schema = session->getSchema(pool_.schemaName());
        mysqlx::Table table = schema.getTable("bin_data");
        mysqlx::RowResult rows = table
                                     .select("bin", "brand", "issuer", "type", "level", "country_code", "country_name")
                                     .where("bin = :bin")
                                     .bind("bin", prefix)
                                     .limit(1)
                                     .execute();
        for (mysqlx::Row row : rows) {
            return mapBinRecord(std::move(row));
        }
        return std::nullopt;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"BIN lookup failed: "} + err.what());
        throw;
    }
}

MySqlBlocklistRepository::MySqlBlocklistRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

std::optional<model::BlockedPrefix> MySqlBlocklistRepository::isBlocked(const std::string& prefix) {
    auto session = pool_.acquire();
    try {
        mysqlx::Schema schema = session->getSchema(pool_.schemaName());
        mysqlx::Table table = schema.getTable("blocked_bins");
        mysqlx::RowResult rows = table.select("bin", "reason")
                                     .where("bin = :bin")
                                     .bind("bin", prefix)
                                     .limit(1)
                                     .execute();
        for (mysqlx::Row row : rows) {
            model::BlockedPrefix entry{readString(row[0]), readString(row[1])};
            if (entry.reason.empty()) {
                entry.reason = "blocked";
            }
            return entry;
        }
        return std::nullopt;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"Blocklist lookup failed: "} + err.what());
        throw;
    }
}

} // namespace cardforge::repository
