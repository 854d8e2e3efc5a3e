#pragma once

#include "cardforge/quota/QuotaPolicy.hpp"
#include "cardforge/repository/DatabaseConfig.hpp"
#include "cardforge/service/CardService.hpp"
#include "cardforge/util/Logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace cardforge::config {

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    unsigned int threads{0};
    std::uint64_t bodyLimitBytes{64 * 1024};
    std::chrono::seconds readTimeout{30};
};

struct StorageConfig {
    std::string backend{"file"};
    std::string binCatalog{"data/bins.json"};
    std::string blocklist{"data/blocked_bins.json"};
};

struct AppConfig {
    ServerConfig server;
    util::LogLevel logLevel{util::LogLevel::info};
    StorageConfig storage;
    repository::DatabaseConfig database;
    std::string quotaBackend{"memory"};
    quota::QuotaSettings quota{quota::QuotaSettings::withDefaults()};
    service::CardServiceSettings generation;
};

using EnvLookup = std::function<const char*(const char*)>;

repository::DatabaseConfig loadDatabaseConfig(const boost::json::object& json,
                                              repository::DatabaseConfig base = {});

// Overlays the fields present in `json` on top of `base`.
AppConfig parseAppConfig(const boost::json::object& json, AppConfig base = {});

// CARDFORGE_* variables win over the file.
void applyEnvironment(AppConfig& config, const EnvLookup& lookup);

// Missing or unreadable files leave the defaults in place.
AppConfig loadAppConfig(const std::filesystem::path& path);

} // namespace cardforge::config
