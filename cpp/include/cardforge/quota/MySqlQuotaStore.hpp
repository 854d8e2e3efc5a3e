#pragma once

#include "cardforge/quota/QuotaStore.hpp"
#include "cardforge/repository/MySqlConnectionPool.hpp"

namespace cardforge::quota {

// Shared store backed by the quota_keys, quota_markers and quota_violations
// tables. Every operation runs in one transaction; tryRecord serializes on
// the quota_keys row of its key. mysqlx::Error propagates to the caller
// after the transaction is rolled back.
class MySqlQuotaStore : public QuotaStore {
public:
    explicit MySqlQuotaStore(repository::MySqlConnectionPool& pool);

    RecordOutcome tryRecord(const std::string& key, TimePoint now, const QuotaPolicy& policy) override;
    WindowUsage usage(const std::string& key, TimePoint now, const QuotaPolicy& policy) override;
    int addViolation(const std::string& identity, TimePoint now, std::chrono::seconds ttl) override;
    int violations(const std::string& identity, TimePoint now) override;
    void purgeExpired(TimePoint now) override;

private:
    template <typename Fn>
    auto inTransaction(const char* operation, Fn&& fn);

    repository::MySqlConnectionPool& pool_;
};

} // namespace cardforge::quota
