#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cardforge::util {

boost::json::value parseJson(const std::string& payload);
std::string stringifyJson(const boost::json::value& value);

// Lenient field readers: numbers may arrive as strings and booleans as
// "true"/"1". A missing or mistyped field yields nullopt.
std::optional<std::string> readString(const boost::json::object& object, std::string_view key);
std::optional<std::int64_t> readInt64(const boost::json::object& object, std::string_view key);
std::optional<bool> readBool(const boost::json::object& object, std::string_view key);

} // namespace cardforge::util
