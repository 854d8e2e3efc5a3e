#pragma once

#include "cardforge/server/RequestContext.hpp"
#include "cardforge/service/AdmissionController.hpp"
#include "cardforge/service/ErrorCode.hpp"
#include "cardforge/service/RiskVerdictProvider.hpp"

#include <boost/beast/http/status.hpp>

#include <string>

namespace cardforge::controller {

// Caller identity from X-Api-Key; address from the first X-Forwarded-For
// hop, falling back to the peer endpoint.
service::Caller callerFrom(const server::RequestContext& ctx);

// The key used for quota introspection: "user:<id>" when authenticated,
// otherwise "ip:<address>".
std::string quotaIdentity(const service::Caller& caller);

boost::beast::http::status statusFor(service::ErrorCode error);

void writeServiceError(server::RequestContext& ctx, service::ErrorCode error, const std::string& message);

// Consults the risk provider and then admission control. On refusal the
// response is already written and false is returned.
class RequestGuard {
public:
    RequestGuard(service::AdmissionController& admission, service::RiskVerdictProvider& risk);

    bool admit(server::RequestContext& ctx, const std::string& action);

private:
    service::AdmissionController& admission_;
    service::RiskVerdictProvider& risk_;
};

} // namespace cardforge::controller
