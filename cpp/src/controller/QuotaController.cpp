#include "cardforge/controller/QuotaController.hpp"
#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/util/TimeFormat.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

namespace cardforge::controller {

QuotaController::QuotaController(service::AdmissionController& admission)
    : admission_(admission) {}

void QuotaController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/api/quota/:action", [this](auto& ctx) { handleQuota(ctx); });
}

void QuotaController::handleQuota(server::RequestContext& ctx) {
    const auto action = server::urlDecode(ctx.pathParameters["action"]);
    const auto identity = quotaIdentity(callerFrom(ctx));
    auto decision = admission_.peek(identity, action);
    const auto& policy = admission_.settings().policyFor(action);

    boost::json::object payload;
    payload["action"] = action;
    payload["identity"] = identity;
    payload["limit"] = decision.limit;
    payload["remaining"] = decision.remaining;
    payload["window_seconds"] = policy.window.count();
    payload["burst"] = policy.burst;
    payload["violations"] = decision.violationCount;
    payload["penalty_multiplier"] = admission_.penaltyMultiplier(decision.violationCount);
    payload["reset_at"] = util::formatIsoTimestamp(decision.resetAt);
    payload["shared_store"] = !admission_.usingFallback();
    server::writeJson(ctx, boost::beast::http::status::ok, payload);
}

} // namespace cardforge::controller
