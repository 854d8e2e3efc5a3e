#pragma once

#include <string>

namespace cardforge::service {

struct RequestFacts {
    std::string identity;
    std::string sourceAddress;
    std::string userAgent;
    std::string path;
};

enum class RiskLevel {
    Low,
    Medium,
    High
};

struct RiskVerdict {
    bool allow{true};
    RiskLevel level{RiskLevel::Low};
    double score{};
    std::string reason;
};

// Upstream risk scoring. Callers may consult it before admission control;
// the generator itself never does.
class RiskVerdictProvider {
public:
    virtual ~RiskVerdictProvider() = default;
    virtual RiskVerdict assess(const RequestFacts& facts) = 0;
};

class PermissiveRiskVerdictProvider : public RiskVerdictProvider {
public:
    RiskVerdict assess(const RequestFacts& /*facts*/) override { return {}; }
};

} // namespace cardforge::service
