#include "cardforge/controller/BinController.hpp"
#include "cardforge/generator/CardLayout.hpp"
#include "cardforge/server/HttpUtil.hpp"

#include <boost/beast/http.hpp>

namespace cardforge::controller {

boost::json::object binRecordToJson(const model::BinRecord& record) {
    boost::json::object obj;
    obj["bin"] = record.prefix;
    obj["brand"] = record.brand;
    obj["type"] = std::string(model::toString(record.category));
    obj["issuer"] = record.issuer;
    obj["country_code"] = record.country;
    obj["country_name"] = record.countryName;
    if (record.level) {
        obj["level"] = *record.level;
    } else {
        obj["level"] = nullptr;
    }
    obj["card_length"] = generator::cardLengthFor(model::brandFromName(record.brand), record.category, record.prefix);
    return obj;
}

BinController::BinController(service::BinClassifier& classifier, RequestGuard& guard)
    : classifier_(classifier)
    , guard_(guard) {}

void BinController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/api/bins/:bin", [this](auto& ctx) { handleLookup(ctx); });
}

void BinController::handleLookup(server::RequestContext& ctx) {
    if (!guard_.admit(ctx, "bin_lookup")) {
        return;
    }
    auto result = classifier_.classify(server::urlDecode(ctx.pathParameters["bin"]));
    if (!result.success) {
        writeServiceError(ctx, result.error, result.message);
        return;
    }
    server::writeJson(ctx, boost::beast::http::status::ok, binRecordToJson(*result.record));
}

} // namespace cardforge::controller
