#include "cardforge/io/JsonCatalog.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <exception>
#include <fstream>
#include <iterator>
#include <string>

namespace cardforge::io {
namespace {
std::optional<boost::json::value> readJsonFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        util::log(util::LogLevel::warn, "Catalog file not found: " + path.string());
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        util::log(util::LogLevel::warn, "Cannot open catalog file: " + path.string());
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    try {
        return util::parseJson(content);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "Failed to parse catalog " + path.string() + ": " + ex.what());
        return std::nullopt;
    }
}

bool isPrefix(const std::string& value) {
    return value.size() == 6 && util::isAllDigits(value);
}
} // namespace

std::optional<model::BinRecord> parseBinRecord(const boost::json::object& json) {
    auto bin = util::readString(json, "bin");
    if (!bin || !isPrefix(util::trim(*bin))) {
        return std::nullopt;
    }

    model::BinRecord record;
    record.prefix = util::trim(*bin);
    record.brand = util::readString(json, "brand").value_or("");
    record.category = model::categoryFromName(util::readString(json, "type").value_or(""));
    record.issuer = util::readString(json, "issuer").value_or("");
    record.country = util::toUpper(util::readString(json, "country_code").value_or(""));
    record.countryName = util::readString(json, "country_name").value_or("");
    record.level = util::readString(json, "level");
    return record;
}

std::vector<model::BinRecord> parseBinCatalog(const boost::json::value& json) {
    std::vector<model::BinRecord> records;
    if (!json.is_array()) {
        util::log(util::LogLevel::warn, "BIN catalog must be a JSON array");
        return records;
    }
    for (const auto& item : json.as_array()) {
        if (!item.is_object()) {
            continue;
        }
        if (auto record = parseBinRecord(item.as_object())) {
            records.push_back(std::move(*record));
        } else {
            util::log(util::LogLevel::warn, "Skipping BIN catalog entry without a 6-digit bin: " +
                                                util::stringifyJson(item));
        }
    }
    return records;
}

std::vector<model::BlockedPrefix> parseBlocklist(const boost::json::value& json) {
    std::vector<model::BlockedPrefix> entries;
    if (!json.is_array()) {
        util::log(util::LogLevel::warn, "Blocklist must be a JSON array");
        return entries;
    }
    for (const auto& item : json.as_array()) {
        if (!item.is_object()) {
            continue;
        }
        const auto& obj = item.as_object();
        auto bin = util::readString(obj, "bin");
        if (!bin || !isPrefix(util::trim(*bin))) {
            util::log(util::LogLevel::warn, "Skipping blocklist entry without a 6-digit bin: " +
                                                util::stringifyJson(item));
            continue;
        }
        entries.push_back(model::BlockedPrefix{util::trim(*bin), util::readString(obj, "reason").value_or("blocked")});
    }
    return entries;
}

std::vector<model::BinRecord> loadBinCatalog(const std::filesystem::path& path) {
    auto json = readJsonFile(path);
    if (!json) {
        return {};
    }
    auto records = parseBinCatalog(*json);
    util::log(util::LogLevel::info, "Loaded " + std::to_string(records.size()) + " BIN records from " + path.string());
    return records;
}

std::vector<model::BlockedPrefix> loadBlocklist(const std::filesystem::path& path) {
    auto json = readJsonFile(path);
    if (!json) {
        return {};
    }
    auto entries = parseBlocklist(*json);
    util::log(util::LogLevel::info, "Loaded " + std::to_string(entries.size()) + " blocked prefixes from " + path.string());
    return entries;
}

} // namespace cardforge::io
