#include "cardforge/config/AppConfig.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/Logging.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

namespace cardforge::config {
namespace {
constexpr std::int64_t kIntMax = std::numeric_limits<int>::max();
constexpr std::int64_t kPortMax = std::numeric_limits<std::uint16_t>::max();
// Upper bound for every configured duration.
constexpr std::int64_t kMaxSeconds = 366LL * 24 * 3600;

// Values outside [low, high] are ignored with a warning.
std::optional<std::int64_t> readInRange(const boost::json::object& json,
                                        std::string_view key,
                                        std::int64_t low,
                                        std::int64_t high) {
    auto value = util::readInt64(json, key);
    if (!value) {
        return std::nullopt;
    }
    if (*value < low || *value > high) {
        util::log(util::LogLevel::warn, "Ignoring out-of-range configuration value " + std::string(key) + "=" +
                                            std::to_string(*value));
        return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> envInRange(const char* name, const char* text, std::int64_t low, std::int64_t high) {
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || value < low || value > high) {
        util::log(util::LogLevel::warn, std::string{"Ignoring invalid "} + name + "=" + text);
        return std::nullopt;
    }
    return value;
}

quota::QuotaPolicy parsePolicy(const boost::json::object& json, quota::QuotaPolicy policy) {
    if (auto value = readInRange(json, "requests", 0, kIntMax)) {
        policy.limit = static_cast<int>(*value);
    }
    if (auto value = readInRange(json, "window", 1, kMaxSeconds)) {
        policy.window = std::chrono::seconds(*value);
    }
    if (auto value = readInRange(json, "burst", 0, kIntMax)) {
        policy.burst = static_cast<int>(*value);
    }
    if (auto value = readInRange(json, "burstWindow", 1, kMaxSeconds)) {
        policy.burstWindow = std::chrono::seconds(*value);
    }
    return policy;
}

void parseQuota(const boost::json::object& json, AppConfig& config) {
    if (auto value = util::readString(json, "backend")) config.quotaBackend = *value;
    if (auto value = readInRange(json, "baseDelaySeconds", 1, kMaxSeconds)) {
        config.quota.baseDelay = std::chrono::seconds(*value);
    }
    if (auto value = readInRange(json, "maxMultiplier", 1, 1 << 16)) {
        config.quota.maxMultiplier = static_cast<int>(*value);
    }
    if (auto value = readInRange(json, "violationTtlSeconds", 1, kMaxSeconds)) {
        config.quota.violationTtl = std::chrono::seconds(*value);
    }
    if (auto value = readInRange(json, "fallbackCooldownSeconds", 0, kMaxSeconds)) {
        config.quota.fallbackCooldown = std::chrono::seconds(*value);
    }
    if (auto it = json.if_contains("policies"); it && it->is_object()) {
        for (const auto& [action, policyJson] : it->as_object()) {
            if (!policyJson.is_object()) {
                util::log(util::LogLevel::warn, "Ignoring quota policy that is not an object: " + std::string(action));
                continue;
            }
            const std::string name(action);
            config.quota.policies[name] = parsePolicy(policyJson.as_object(), config.quota.policyFor(name));
        }
    }
}
} // namespace

repository::DatabaseConfig loadDatabaseConfig(const boost::json::object& json, repository::DatabaseConfig base) {
    if (auto value = util::readString(json, "host")) base.host = *value;
    if (auto value = readInRange(json, "port", 1, kPortMax)) base.port = static_cast<std::uint16_t>(*value);
    if (auto value = util::readString(json, "user")) base.user = *value;
    if (auto value = util::readString(json, "password")) base.password = *value;
    if (auto value = util::readString(json, "database")) base.database = *value;
    if (auto value = util::readString(json, "charset")) base.charset = *value;
    if (auto value = readInRange(json, "poolSize", 1, 1024)) base.poolSize = static_cast<unsigned int>(*value);
    return base;
}

AppConfig parseAppConfig(const boost::json::object& json, AppConfig base) {
    if (auto it = json.if_contains("server"); it && it->is_object()) {
        const auto& server = it->as_object();
        if (auto value = util::readString(server, "host")) base.server.host = *value;
        if (auto value = readInRange(server, "port", 1, kPortMax)) {
            base.server.port = static_cast<std::uint16_t>(*value);
        }
        if (auto value = readInRange(server, "threads", 0, 1024)) {
            base.server.threads = static_cast<unsigned int>(*value);
        }
        if (auto value = readInRange(server, "bodyLimitBytes", 1, kIntMax)) {
            base.server.bodyLimitBytes = static_cast<std::uint64_t>(*value);
        }
        if (auto value = readInRange(server, "readTimeoutSeconds", 1, kMaxSeconds)) {
            base.server.readTimeout = std::chrono::seconds(*value);
        }
    }
    if (auto value = util::readString(json, "logLevel")) {
        if (auto level = util::parseLogLevel(*value)) {
            base.logLevel = *level;
        } else {
            util::log(util::LogLevel::warn, "Unknown log level in configuration: " + *value);
        }
    }
    if (auto it = json.if_contains("storage"); it && it->is_object()) {
        const auto& storage = it->as_object();
        if (auto value = util::readString(storage, "backend")) base.storage.backend = *value;
        if (auto value = util::readString(storage, "binCatalog")) base.storage.binCatalog = *value;
        if (auto value = util::readString(storage, "blocklist")) base.storage.blocklist = *value;
    }
    if (auto it = json.if_contains("database"); it && it->is_object()) {
        base.database = loadDatabaseConfig(it->as_object(), base.database);
    }
    if (auto it = json.if_contains("quota"); it && it->is_object()) {
        parseQuota(it->as_object(), base);
    }
    if (auto it = json.if_contains("generation"); it && it->is_object()) {
        const auto& generation = it->as_object();
        if (auto value = readInRange(generation, "maxReshuffleAttempts", 0, kIntMax)) {
            base.generation.maxReshuffles = static_cast<int>(*value);
        }
        if (auto value = readInRange(generation, "maxBatchSize", 1, kIntMax)) {
            base.generation.maxBatchSize = static_cast<int>(*value);
        }
    }
    return base;
}

void applyEnvironment(AppConfig& config, const EnvLookup& lookup) {
    if (const char* value = lookup("CARDFORGE_HOST")) config.server.host = value;
    if (const char* value = lookup("CARDFORGE_PORT")) {
        if (auto port = envInRange("CARDFORGE_PORT", value, 1, kPortMax)) {
            config.server.port = static_cast<std::uint16_t>(*port);
        }
    }
    if (const char* value = lookup("CARDFORGE_LOG_LEVEL")) {
        if (auto level = util::parseLogLevel(value)) {
            config.logLevel = *level;
        }
    }
    if (const char* value = lookup("CARDFORGE_STORAGE")) config.storage.backend = value;
    if (const char* value = lookup("CARDFORGE_BIN_CATALOG")) config.storage.binCatalog = value;
    if (const char* value = lookup("CARDFORGE_BLOCKLIST")) config.storage.blocklist = value;
    if (const char* value = lookup("CARDFORGE_DB_HOST")) config.database.host = value;
    if (const char* value = lookup("CARDFORGE_DB_PORT")) {
        if (auto port = envInRange("CARDFORGE_DB_PORT", value, 1, kPortMax)) {
            config.database.port = static_cast<std::uint16_t>(*port);
        }
    }
    if (const char* value = lookup("CARDFORGE_DB_USER")) config.database.user = value;
    if (const char* value = lookup("CARDFORGE_DB_PASSWORD")) config.database.password = value;
    if (const char* value = lookup("CARDFORGE_DB_NAME")) config.database.database = value;
    if (const char* value = lookup("CARDFORGE_DB_CHARSET")) config.database.charset = value;
    if (const char* value = lookup("CARDFORGE_DB_POOL")) {
        if (auto size = envInRange("CARDFORGE_DB_POOL", value, 1, 1024)) {
            config.database.poolSize = static_cast<unsigned int>(*size);
        }
    }
    if (const char* value = lookup("CARDFORGE_QUOTA_BACKEND")) config.quotaBackend = value;
}

AppConfig loadAppConfig(const std::filesystem::path& path) {
    AppConfig config;
    if (std::filesystem::exists(path)) {
        std::ifstream ifs(path);
        if (ifs.is_open()) {
            std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            if (!content.empty()) {
                try {
                    auto json = util::parseJson(content);
                    if (json.is_object()) {
                        config = parseAppConfig(json.as_object(), std::move(config));
                    } else {
                        util::log(util::LogLevel::warn, "Configuration root is not an object: " + path.string());
                    }
                } catch (const std::exception& ex) {
                    util::log(util::LogLevel::warn,
                              "Failed to parse configuration " + path.string() + ": " + ex.what());
                }
            }
        }
    } else {
        util::log(util::LogLevel::info, "No configuration at " + path.string() + ", using defaults");
    }

    applyEnvironment(config, [](const char* name) { return std::getenv(name); });
    return config;
}

} // namespace cardforge::config
