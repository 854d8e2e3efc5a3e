#include "cardforge/quota/QuotaPolicy.hpp"

namespace cardforge::quota {

QuotaSettings QuotaSettings::withDefaults() {
    using std::chrono::seconds;
    QuotaSettings settings;
    settings.policies = {
        {kDefaultAction, {60, seconds{60}, 10, seconds{60}}},
        {"bin_lookup", {100, seconds{60}, 15, seconds{60}}},
        {"card_generation", {20, seconds{60}, 5, seconds{60}}},
        {"auth", {10, seconds{300}, 3, seconds{60}}},
        {"export", {30, seconds{60}, 8, seconds{60}}},
    };
    return settings;
}

const QuotaPolicy& QuotaSettings::policyFor(const std::string& action) const {
    if (auto it = policies.find(action); it != policies.end()) {
        return it->second;
    }
    if (auto it = policies.find(kDefaultAction); it != policies.end()) {
        return it->second;
    }
    static const QuotaPolicy fallback{};
    return fallback;
}

} // namespace cardforge::quota
