#include "cardforge/controller/CardController.hpp"
#include "cardforge/controller/BinController.hpp"
#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/Logging.hpp"

#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>

namespace cardforge::controller {
namespace http = boost::beast::http;
namespace {

bool flagValue(const std::string& text) {
    return text == "1" || text == "true" || text == "TRUE" || text == "yes";
}

service::GenerateOptions optionsFromQuery(const std::unordered_map<std::string, std::string>& query) {
    service::GenerateOptions options;
    if (auto it = query.find("avs"); it != query.end()) {
        options.includeAvs = flagValue(it->second);
    }
    if (auto it = query.find("country"); it != query.end()) {
        options.avsCountry = it->second;
    }
    if (auto it = query.find("seeded_cvv"); it != query.end()) {
        options.seededCvv = flagValue(it->second);
    }
    return options;
}

service::GenerateOptions optionsFromBody(const boost::json::object& body) {
    service::GenerateOptions options;
    options.includeAvs = util::readBool(body, "avs").value_or(false);
    options.avsCountry = util::readString(body, "country").value_or("");
    options.seededCvv = util::readBool(body, "seeded_cvv").value_or(true);
    return options;
}

boost::json::object cardPayload(const model::GeneratedCard& card) {
    auto obj = io::cardToJson(card);
    obj["formatted"] = model::formatCardNumber(card.number);
    return obj;
}

} // namespace

CardController::CardController(service::CardService& cardService, RequestGuard& guard)
    : cardService_(cardService)
    , guard_(guard) {}

void CardController::registerRoutes(server::Router& router) {
    router.addRoute("GET", "/api/cards/generate/:bin", [this](auto& ctx) { handleGenerateByPath(ctx); });
    router.addRoute("POST", "/api/cards/generate", [this](auto& ctx) { handleGenerate(ctx); });
    router.addRoute("POST", "/api/cards/bulk", [this](auto& ctx) { handleBulk(ctx); });
    router.addRoute("POST", "/api/cards/export/:format", [this](auto& ctx) { handleExport(ctx); });
    router.addRoute("GET", "/api/avs/countries", [this](auto& ctx) { handleAvsCountries(ctx); });
}

std::optional<boost::json::object> CardController::readBody(server::RequestContext& ctx) {
    try {
        auto parsed = util::parseJson(ctx.request.body());
        if (parsed.is_object()) {
            return parsed.as_object();
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, std::string{"Rejecting request body: "} + ex.what());
    }
    writeServiceError(ctx, service::ErrorCode::InvalidRequest, "Request body must be a JSON object");
    return std::nullopt;
}

std::optional<int> CardController::readCount(server::RequestContext& ctx, const boost::json::object& body) {
    const auto maxBatch = cardService_.settings().maxBatchSize;
    std::int64_t count = 1;
    if (body.contains("count")) {
        auto value = util::readInt64(body, "count");
        if (!value) {
            writeServiceError(ctx, service::ErrorCode::InvalidRequest, "Count must be a whole number");
            return std::nullopt;
        }
        count = *value;
    }
    if (count < 1 || count > maxBatch) {
        writeServiceError(ctx, service::ErrorCode::InvalidRequest,
                          "Count must be between 1 and " + std::to_string(maxBatch));
        return std::nullopt;
    }
    return static_cast<int>(count);
}

void CardController::respondWithCard(server::RequestContext& ctx,
                                     const std::string& bin,
                                     const service::GenerateOptions& options) {
    auto result = cardService_.generate(bin, options);
    if (!result.success) {
        writeServiceError(ctx, result.error, result.message);
        return;
    }
    server::writeJson(ctx, http::status::ok, cardPayload(*result.card));
}

void CardController::handleGenerateByPath(server::RequestContext& ctx) {
    if (!guard_.admit(ctx, "card_generation")) {
        return;
    }
    respondWithCard(ctx, server::urlDecode(ctx.pathParameters["bin"]), optionsFromQuery(ctx.queryParameters));
}

void CardController::handleGenerate(server::RequestContext& ctx) {
    if (!guard_.admit(ctx, "card_generation")) {
        return;
    }
    auto body = readBody(ctx);
    if (!body) {
        return;
    }
    respondWithCard(ctx, util::readString(*body, "bin").value_or(""), optionsFromBody(*body));
}

void CardController::handleBulk(server::RequestContext& ctx) {
    if (!guard_.admit(ctx, "card_generation")) {
        return;
    }
    auto body = readBody(ctx);
    if (!body) {
        return;
    }
    auto count = readCount(ctx, *body);
    if (!count) {
        return;
    }
    auto batch = cardService_.generateBatch(util::readString(*body, "bin").value_or(""), *count,
                                            optionsFromBody(*body));
    if (!batch.success) {
        writeServiceError(ctx, batch.error, batch.message);
        return;
    }

    boost::json::array cards;
    cards.reserve(batch.cards.size());
    for (const auto& card : batch.cards) {
        cards.push_back(cardPayload(card));
    }
    boost::json::object payload;
    payload["bin"] = binRecordToJson(*batch.record);
    payload["count"] = batch.cards.size();
    payload["cards"] = std::move(cards);
    server::writeJson(ctx, http::status::ok, payload);
}

void CardController::handleExport(server::RequestContext& ctx) {
    if (!guard_.admit(ctx, "export")) {
        return;
    }
    auto format = io::parseExportFormat(ctx.pathParameters["format"]);
    if (!format) {
        writeServiceError(ctx, service::ErrorCode::InvalidRequest,
                          "Unsupported export format: " + ctx.pathParameters["format"]);
        return;
    }
    auto body = readBody(ctx);
    if (!body) {
        return;
    }
    auto count = readCount(ctx, *body);
    if (!count) {
        return;
    }
    auto batch = cardService_.generateBatch(util::readString(*body, "bin").value_or(""), *count,
                                            optionsFromBody(*body));
    if (!batch.success) {
        writeServiceError(ctx, batch.error, batch.message);
        return;
    }

    auto document = exporter_.exportCards(batch.cards, *format, std::chrono::system_clock::now());
    server::writeRaw(ctx, http::status::ok, io::contentType(*format), std::move(document));
    ctx.response.set(http::field::content_disposition,
                     "attachment; filename=\"cards_" + batch.record->prefix + "." +
                         std::string(io::fileExtension(*format)) + "\"");
}

void CardController::handleAvsCountries(server::RequestContext& ctx) {
    boost::json::object payload;
    for (const auto& country : cardService_.avs().supportedCountries()) {
        boost::json::array codes;
        for (const auto& code : cardService_.avs().postalCodesFor(country)) {
            codes.emplace_back(code);
        }
        payload[country] = std::move(codes);
    }
    server::writeJson(ctx, http::status::ok, payload);
}

} // namespace cardforge::controller
