#include "cardforge/repository/MySqlConnectionPool.hpp"
#include "cardforge/util/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace cardforge::repository {

MySqlConnectionPool::MySqlConnectionPool(DatabaseConfig config, std::chrono::milliseconds acquireTimeout)
    : config_(std::move(config))
    , acquireTimeout_(acquireTimeout) {
    if (config_.database.empty()) {
        throw std::invalid_argument("MySQL schema name is empty");
    }
    if (config_.host.empty()) {
        config_.host = "127.0.0.1";
    }
    if (config_.poolSize == 0) {
        config_.poolSize = 1;
    }
}

std::unique_ptr<mysqlx::Session> MySqlConnectionPool::connect() const {
    try {
        auto session = std::make_unique<mysqlx::Session>(
            mysqlx::SessionOption::HOST, config_.host,
            mysqlx::SessionOption::PORT, static_cast<unsigned int>(config_.port),
            mysqlx::SessionOption::USER, config_.user,
            mysqlx::SessionOption::PWD, config_.password,
            mysqlx::SessionOption::DB, config_.database);
        if (!config_.charset.empty()) {
            session->sql("SET NAMES '" + config_.charset + "'").execute();
        }
        return session;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, "MySQL connect to " + config_.host + ":" + std::to_string(config_.port) +
                                             " failed: " + err.what());
        throw;
    }
}

bool MySqlConnectionPool::isAlive(mysqlx::Session& session) {
    try {
        session.sql("SELECT 1").execute();
        return true;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::warn, std::string{"Dropping stale MySQL session: "} + err.what());
        return false;
    }
}

void MySqlConnectionPool::SessionDeleter::operator()(mysqlx::Session* session) const noexcept {
    if (pool && session) {
        pool->release(session);
    }
}

std::shared_ptr<mysqlx::Session> MySqlConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(lock, acquireTimeout_, [this] {
        return !idle_.empty() || open_ < config_.poolSize;
    });
    if (!ready) {
        throw std::runtime_error("No MySQL session became free within " +
                                 std::to_string(acquireTimeout_.count()) + "ms");
    }

    std::unique_ptr<mysqlx::Session> session;
    if (!idle_.empty()) {
        session = std::move(idle_.back());
        idle_.pop_back();
    } else {
        ++open_;
    }
    lock.unlock();

    // Connecting and pinging happen outside the lock; the slot is already held.
    try {
        if (session && !isAlive(*session)) {
            session.reset();
        }
        if (!session) {
            session = connect();
        }
    } catch (const mysqlx::Error&) {
        forfeitSlot();
        throw;
    }
    return std::shared_ptr<mysqlx::Session>(session.release(), SessionDeleter{this});
}

void MySqlConnectionPool::release(mysqlx::Session* session) {
    std::unique_ptr<mysqlx::Session> owned(session);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(std::move(owned));
    }
    cv_.notify_one();
}

void MySqlConnectionPool::forfeitSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --open_;
    }
    cv_.notify_one();
}

} // namespace cardforge::repository
