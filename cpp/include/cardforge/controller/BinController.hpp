#pragma once

#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/server/Router.hpp"
#include "cardforge/service/BinClassifier.hpp"

#include <boost/json.hpp>

namespace cardforge::controller {

boost::json::object binRecordToJson(const model::BinRecord& record);

class BinController {
public:
    BinController(service::BinClassifier& classifier, RequestGuard& guard);

    void registerRoutes(server::Router& router);

private:
    void handleLookup(server::RequestContext& ctx);

    service::BinClassifier& classifier_;
    RequestGuard& guard_;
};

} // namespace cardforge::controller
