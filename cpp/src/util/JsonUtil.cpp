#include "cardforge/util/JsonUtil.hpp"

#include <cmath>
#include <exception>
#include <limits>

namespace cardforge::util {

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

std::string stringifyJson(const boost::json::value& value) {
    return boost::json::serialize(value);
}

std::optional<std::string> readString(const boost::json::object& object, std::string_view key) {
    auto it = object.if_contains(key);
    if (!it || !it->is_string()) {
        return std::nullopt;
    }
    return std::string(it->as_string().c_str());
}

std::optional<std::int64_t> readInt64(const boost::json::object& object, std::string_view key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_int64()) {
        return it->as_int64();
    }
    if (it->is_uint64()) {
        const auto value = it->as_uint64();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_double()) {
        // Only finite whole numbers inside [-2^63, 2^63) convert exactly.
        const double value = it->as_double();
        constexpr double kLowest = -9223372036854775808.0;
        if (!std::isfinite(value) || value != std::trunc(value) || value < kLowest || value >= -kLowest) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_string()) {
        const std::string text(it->as_string().c_str());
        try {
            std::size_t consumed = 0;
            const auto value = std::stoll(text, &consumed);
            if (consumed != text.size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> readBool(const boost::json::object& object, std::string_view key) {
    auto it = object.if_contains(key);
    if (!it) {
        return std::nullopt;
    }
    if (it->is_bool()) {
        return it->as_bool();
    }
    if (it->is_string()) {
        auto str = std::string(it->as_string().c_str());
        if (str == "true" || str == "1") {
            return true;
        }
        if (str == "false" || str == "0") {
            return false;
        }
    }
    return std::nullopt;
}

} // namespace cardforge::util
