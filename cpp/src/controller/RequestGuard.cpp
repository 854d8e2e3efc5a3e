#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"
#include "cardforge/util/TimeFormat.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

namespace cardforge::controller {
namespace http = boost::beast::http;

service::Caller callerFrom(const server::RequestContext& ctx) {
    service::Caller caller;
    if (auto it = ctx.request.find("X-Api-Key"); it != ctx.request.end()) {
        caller.identity = util::trim(std::string_view(it->value().data(), it->value().size()));
    }
    if (auto it = ctx.request.find("X-Forwarded-For"); it != ctx.request.end()) {
        std::string_view forwarded(it->value().data(), it->value().size());
        caller.sourceAddress = util::trim(forwarded.substr(0, forwarded.find(',')));
    }
    if (caller.sourceAddress.empty()) {
        caller.sourceAddress = ctx.remoteAddress;
    }
    return caller;
}

std::string quotaIdentity(const service::Caller& caller) {
    if (!caller.identity.empty()) {
        return "user:" + caller.identity;
    }
    if (!caller.sourceAddress.empty()) {
        return "ip:" + caller.sourceAddress;
    }
    return "anonymous";
}

http::status statusFor(service::ErrorCode error) {
    switch (error) {
    case service::ErrorCode::None:
        return http::status::ok;
    case service::ErrorCode::InvalidFormat:
    case service::ErrorCode::UnsupportedAvsCountry:
    case service::ErrorCode::InvalidRequest:
        return http::status::bad_request;
    case service::ErrorCode::Blocked:
        return http::status::forbidden;
    case service::ErrorCode::NotFound:
        return http::status::not_found;
    case service::ErrorCode::QuotaExceeded:
        return http::status::too_many_requests;
    case service::ErrorCode::StoreUnavailable:
        return http::status::service_unavailable;
    case service::ErrorCode::InvariantViolation:
    case service::ErrorCode::Internal:
        return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

void writeServiceError(server::RequestContext& ctx, service::ErrorCode error, const std::string& message) {
    server::writeError(ctx, statusFor(error), service::toString(error), message);
}

RequestGuard::RequestGuard(service::AdmissionController& admission, service::RiskVerdictProvider& risk)
    : admission_(admission)
    , risk_(risk) {}

bool RequestGuard::admit(server::RequestContext& ctx, const std::string& action) {
    auto caller = callerFrom(ctx);

    service::RequestFacts facts;
    facts.identity = caller.identity;
    facts.sourceAddress = caller.sourceAddress;
    facts.path = std::string(ctx.request.target());
    if (auto it = ctx.request.find(http::field::user_agent); it != ctx.request.end()) {
        facts.userAgent = std::string(it->value());
    }
    auto verdict = risk_.assess(facts);
    if (!verdict.allow) {
        util::log(util::LogLevel::warn, "Risk verdict refused " + facts.sourceAddress + ": " + verdict.reason);
        server::writeError(ctx, http::status::forbidden, "risk_denied", verdict.reason);
        return false;
    }

    auto decision = admission_.checkAndRecord(caller, action);
    if (decision.admitted) {
        ctx.response.set("X-RateLimit-Limit", std::to_string(decision.limit));
        ctx.response.set("X-RateLimit-Remaining", std::to_string(decision.remaining));
        return true;
    }

    boost::json::object details;
    details["retry_after"] = decision.retryAfterSeconds;
    details["violation_count"] = decision.violationCount;
    details["limit"] = decision.limit;
    details["reset_at"] = util::formatIsoTimestamp(decision.resetAt);
    server::writeError(ctx, http::status::too_many_requests,
                       service::toString(service::ErrorCode::QuotaExceeded), decision.reason, details);
    ctx.response.set(http::field::retry_after, std::to_string(decision.retryAfterSeconds));
    return false;
}

} // namespace cardforge::controller
