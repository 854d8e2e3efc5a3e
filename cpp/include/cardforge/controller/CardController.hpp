#pragma once

#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/io/CardExporter.hpp"
#include "cardforge/server/Router.hpp"
#include "cardforge/service/CardService.hpp"

#include <boost/json.hpp>

#include <optional>

namespace cardforge::controller {

class CardController {
public:
    CardController(service::CardService& cardService, RequestGuard& guard);

    void registerRoutes(server::Router& router);

private:
    void handleGenerateByPath(server::RequestContext& ctx);
    void handleGenerate(server::RequestContext& ctx);
    void handleBulk(server::RequestContext& ctx);
    void handleExport(server::RequestContext& ctx);
    void handleAvsCountries(server::RequestContext& ctx);

    void respondWithCard(server::RequestContext& ctx, const std::string& bin, const service::GenerateOptions& options);
    std::optional<boost::json::object> readBody(server::RequestContext& ctx);
    // Absent means 1. Writes the error response and returns nullopt when invalid.
    std::optional<int> readCount(server::RequestContext& ctx, const boost::json::object& body);

    service::CardService& cardService_;
    RequestGuard& guard_;
    io::CardExporter exporter_;
};

} // namespace cardforge::controller
