#pragma once

#include "cardforge/server/Router.hpp"
#include "cardforge/service/AdmissionController.hpp"

namespace cardforge::controller {

// Read-only view of the caller's quota for one action.
class QuotaController {
public:
    explicit QuotaController(service::AdmissionController& admission);

    void registerRoutes(server::Router& router);

private:
    void handleQuota(server::RequestContext& ctx);

    service::AdmissionController& admission_;
};

} // namespace cardforge::controller
