#pragma once

#include "cardforge/model/BinRecord.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace cardforge::io {

// Entry shape: {"bin", "brand", "type", "issuer", "country_code",
// "country_name", "level"}. Entries without a 6-digit "bin" are rejected.
std::optional<model::BinRecord> parseBinRecord(const boost::json::object& json);

std::vector<model::BinRecord> parseBinCatalog(const boost::json::value& json);
std::vector<model::BlockedPrefix> parseBlocklist(const boost::json::value& json);

// File loaders log and return what they could read; a missing file is empty.
std::vector<model::BinRecord> loadBinCatalog(const std::filesystem::path& path);
std::vector<model::BlockedPrefix> loadBlocklist(const std::filesystem::path& path);

} // namespace cardforge::io
