#pragma once

#include "cardforge/repository/DatabaseConfig.hpp"

#include <mysqlx/xdevapi.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cardforge::repository {

class MySqlConnectionPool {
public:
    explicit MySqlConnectionPool(DatabaseConfig config,
                                 std::chrono::milliseconds acquireTimeout = std::chrono::seconds(5));

    // Idle sessions are pinged before reuse. Throws std::runtime_error when
    // no session frees up within the timeout and rethrows connect failures.
    std::shared_ptr<mysqlx::Session> acquire();

    const std::string& schemaName() const noexcept { return config_.database; }

private:
    struct SessionDeleter {
        MySqlConnectionPool* pool;
        void operator()(mysqlx::Session* session) const noexcept;
    };

    std::unique_ptr<mysqlx::Session> connect() const;
    static bool isAlive(mysqlx::Session& session);
    void release(mysqlx::Session* session);
    void forfeitSlot();

    DatabaseConfig config_;
    std::chrono::milliseconds acquireTimeout_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<mysqlx::Session>> idle_;
    // Sessions handed out plus idle ones.
    unsigned int open_{};
};

} // namespace cardforge::repository
