#pragma once

#include <cstdint>
#include <string>

namespace cardforge::repository {

struct DatabaseConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{33060};
    std::string user{"root"};
    std::string password;
    std::string database{"cardforge"};
    std::string charset{"utf8mb4"};
    unsigned int poolSize{8};
};

} // namespace cardforge::repository
