#include "cardforge/quota/MySqlQuotaStore.hpp"
#include "cardforge/util/Logging.hpp"

#include <mysqlx/xdevapi.h>

#include <cstdint>

namespace cardforge::quota {
namespace {

std::int64_t toMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::int64_t toMillis(std::chrono::seconds duration) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::int64_t readInt64(const mysqlx::Value& value) {
    if (value.isNull()) {
        return 0;
    }
    return value.get<std::int64_t>();
}

WindowUsage countMarkers(mysqlx::Session& session, const std::string& key, TimePoint now, const QuotaPolicy& policy) {
    auto row = session
                   .sql("SELECT COUNT(*), CAST(COALESCE(SUM(recorded_at_ms > ?), 0) AS SIGNED), MIN(recorded_at_ms) "
                        "FROM quota_markers WHERE quota_key = ? AND recorded_at_ms > ?")
                   .bind(toMillis(now - policy.burstWindow))
                   .bind(key)
                   .bind(toMillis(now - policy.window))
                   .execute()
                   .fetchOne();

    WindowUsage usage;
    if (!row) {
        return usage;
    }
    usage.inWindow = static_cast<int>(readInt64(row[0]));
    usage.inBurst = static_cast<int>(readInt64(row[1]));
    if (!row[2].isNull()) {
        usage.oldest = TimePoint{std::chrono::milliseconds(readInt64(row[2]))};
    }
    return usage;
}

} // namespace

MySqlQuotaStore::MySqlQuotaStore(repository::MySqlConnectionPool& pool)
    : pool_(pool) {}

template <typename Fn>
auto MySqlQuotaStore::inTransaction(const char* operation, Fn&& fn) {
    auto session = pool_.acquire();
    try {
        session->startTransaction();
        auto result = fn(*session);
        session->commit();
        return result;
    } catch (const mysqlx::Error& err) {
        util::log(util::LogLevel::error, std::string{"Quota store "} + operation + " failed: " + err.what());
        try {
            session->rollback();
        } catch (const mysqlx::Error& rollbackErr) {
            util::log(util::LogLevel::warn, std::string{"Quota store rollback failed: "} + rollbackErr.what());
        }
        throw;
    }
}

RecordOutcome MySqlQuotaStore::tryRecord(const std::string& key, TimePoint now, const QuotaPolicy& policy) {
    return inTransaction("tryRecord", [&](mysqlx::Session& session) {
        session.sql("INSERT INTO quota_keys (quota_key, window_ms) VALUES (?, ?) "
                    "ON DUPLICATE KEY UPDATE window_ms = VALUES(window_ms)")
            .bind(key)
            .bind(toMillis(policy.window))
            .execute();
        session.sql("SELECT quota_key FROM quota_keys WHERE quota_key = ? FOR UPDATE").bind(key).execute();
        session.sql("DELETE FROM quota_markers WHERE quota_key = ? AND recorded_at_ms <= ?")
            .bind(key)
            .bind(toMillis(now - policy.window))
            .execute();

        RecordOutcome outcome;
        outcome.usage = countMarkers(session, key, now, policy);
        if (outcome.usage.inWindow >= policy.limit) {
            return outcome;
        }
        if (outcome.usage.inBurst >= policy.burst) {
            outcome.burstExceeded = true;
            return outcome;
        }

        session.sql("INSERT INTO quota_markers (quota_key, recorded_at_ms) VALUES (?, ?)")
            .bind(key)
            .bind(toMillis(now))
            .execute();
        outcome.admitted = true;
        ++outcome.usage.inWindow;
        ++outcome.usage.inBurst;
        if (!outcome.usage.oldest) {
            outcome.usage.oldest = now;
        }
        return outcome;
    });
}

WindowUsage MySqlQuotaStore::usage(const std::string& key, TimePoint now, const QuotaPolicy& policy) {
    return inTransaction("usage", [&](mysqlx::Session& session) {
        return countMarkers(session, key, now, policy);
    });
}

int MySqlQuotaStore::addViolation(const std::string& identity, TimePoint now, std::chrono::seconds ttl) {
    return inTransaction("addViolation", [&](mysqlx::Session& session) {
        // violation_count is assigned first so it still sees the old expiry.
        session.sql("INSERT INTO quota_violations (identity, violation_count, expires_at_ms) VALUES (?, 1, ?) "
                    "ON DUPLICATE KEY UPDATE "
                    "violation_count = IF(expires_at_ms <= ?, 1, violation_count + 1), "
                    "expires_at_ms = VALUES(expires_at_ms)")
            .bind(identity)
            .bind(toMillis(now + ttl))
            .bind(toMillis(now))
            .execute();
        auto row = session.sql("SELECT violation_count FROM quota_violations WHERE identity = ?")
                       .bind(identity)
                       .execute()
                       .fetchOne();
        return row ? static_cast<int>(readInt64(row[0])) : 1;
    });
}

int MySqlQuotaStore::violations(const std::string& identity, TimePoint now) {
    return inTransaction("violations", [&](mysqlx::Session& session) {
        auto row = session.sql("SELECT violation_count FROM quota_violations WHERE identity = ? AND expires_at_ms > ?")
                       .bind(identity)
                       .bind(toMillis(now))
                       .execute()
                       .fetchOne();
        return row ? static_cast<int>(readInt64(row[0])) : 0;
    });
}

void MySqlQuotaStore::purgeExpired(TimePoint now) {
    inTransaction("purgeExpired", [&](mysqlx::Session& session) {
        const auto nowMs = toMillis(now);
        session.sql("DELETE m FROM quota_markers m JOIN quota_keys k ON m.quota_key = k.quota_key "
                    "WHERE m.recorded_at_ms <= ? - k.window_ms")
            .bind(nowMs)
            .execute();
        session.sql("DELETE FROM quota_keys WHERE NOT EXISTS "
                    "(SELECT 1 FROM quota_markers m WHERE m.quota_key = quota_keys.quota_key)")
            .execute();
        session.sql("DELETE FROM quota_violations WHERE expires_at_ms <= ?").bind(nowMs).execute();
        return 0;
    });
}

} // namespace cardforge::quota
