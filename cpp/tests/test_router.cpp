#include <gtest/gtest.h>

#include "TestSupport.hpp"

#include "cardforge/controller/BinController.hpp"
#include "cardforge/controller/CardController.hpp"
#include "cardforge/controller/QuotaController.hpp"
#include "cardforge/controller/RequestGuard.hpp"
#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/server/Router.hpp"
#include "cardforge/util/JsonUtil.hpp"

#include <boost/beast/http.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace cardforge;
namespace http = boost::beast::http;
using namespace std::chrono_literals;

namespace {

class DenyingRiskProvider : public service::RiskVerdictProvider {
public:
    service::RiskVerdict assess(const service::RequestFacts& facts) override {
        lastFacts = facts;
        service::RiskVerdict verdict;
        verdict.allow = false;
        verdict.level = service::RiskLevel::High;
        verdict.score = 0.97;
        verdict.reason = "velocity anomaly";
        return verdict;
    }

    service::RequestFacts lastFacts;
};

quota::QuotaSettings apiQuota() {
    auto settings = quota::QuotaSettings::withDefaults();
    settings.policies["bin_lookup"] = {3, 60s, 10, 60s};
    return settings;
}

server::RequestContext makeContext(http::verb method,
                                   const std::string& target,
                                   std::string body = {},
                                   std::vector<std::pair<std::string, std::string>> headers = {}) {
    server::RequestContext ctx;
    ctx.request.method(method);
    ctx.request.target(target);
    ctx.request.version(11);
    for (const auto& [name, value] : headers) {
        ctx.request.set(name, value);
    }
    ctx.request.body() = std::move(body);
    ctx.request.prepare_payload();
    ctx.remoteAddress = "192.0.2.10";
    ctx.queryParameters = server::parseQueryParameters(target);
    return ctx;
}

boost::json::object bodyOf(const server::RequestContext& ctx) {
    return util::parseJson(ctx.response.body()).as_object();
}

class ApiTest : public ::testing::Test {
protected:
    ApiTest()
        : bins_(test_support::sampleRecords())
        , testRanges_(repository::defaultTestRanges())
        , blocklist_({testRanges_})
        , classifier_(bins_, blocklist_)
        , cardService_(classifier_, service::CardServiceSettings{},
                       [] { return test_support::fixedNow(); })
        , admission_(apiQuota())
        , guard_(admission_, risk_)
        , binController_(classifier_, guard_)
        , cardController_(cardService_, guard_)
        , quotaController_(admission_) {
        binController_.registerRoutes(router_);
        cardController_.registerRoutes(router_);
        quotaController_.registerRoutes(router_);
    }

    server::RequestContext dispatch(http::verb method,
                                    const std::string& target,
                                    std::string body = {},
                                    std::vector<std::pair<std::string, std::string>> headers = {}) {
        auto ctx = makeContext(method, target, std::move(body), std::move(headers));
        auto verb = http::to_string(method);
        auto match = router_.resolve(std::string(verb.data(), verb.size()), target);
        if (!match) {
            ADD_FAILURE() << "no route for " << target;
            return ctx;
        }
        ctx.pathParameters = match.params;
        match.handler(ctx);
        return ctx;
    }

    repository::InMemoryBinStore bins_;
    repository::InMemoryBlocklist testRanges_;
    repository::LayeredBlocklist blocklist_;
    service::BinClassifier classifier_;
    service::CardService cardService_;
    service::AdmissionController admission_;
    service::PermissiveRiskVerdictProvider risk_;
    controller::RequestGuard guard_;
    controller::BinController binController_;
    controller::CardController cardController_;
    controller::QuotaController quotaController_;
    server::Router router_;
};

} // namespace

TEST(Router, CapturesPathParametersAndIgnoresQuery) {
    server::Router router;
    std::string seen;
    router.addRoute("GET", "/api/cards/generate/:bin", [&seen](server::RequestContext& ctx) {
        seen = ctx.pathParameters["bin"];
    });

    auto match = router.resolve("get", "/api/cards/generate/424242?avs=true&country=US");
    ASSERT_TRUE(match);
    EXPECT_EQ(match.params.at("bin"), "424242");

    server::RequestContext ctx;
    ctx.pathParameters = match.params;
    match.handler(ctx);
    EXPECT_EQ(seen, "424242");
}

TEST(Router, ReportsAllowedMethodsOnMismatch) {
    server::Router router;
    router.addRoute("POST", "/api/cards/bulk", [](server::RequestContext&) {});
    router.addRoute("PUT", "/api/cards/bulk", [](server::RequestContext&) {});

    auto wrongMethod = router.resolve("GET", "/api/cards/bulk");
    EXPECT_FALSE(wrongMethod);
    EXPECT_EQ(wrongMethod.allowedMethods, (std::vector<std::string>{"POST", "PUT"}));

    auto unknownPath = router.resolve("POST", "/api/cards/bulk/extra");
    EXPECT_FALSE(unknownPath);
    EXPECT_TRUE(unknownPath.allowedMethods.empty());

    EXPECT_TRUE(router.resolve("POST", "/api/cards/bulk/"));
}

TEST(Router, LiteralSegmentsAreNotPatterns) {
    server::Router router;
    router.addRoute("GET", "/api/v1.0/ping", [](server::RequestContext&) {});
    EXPECT_TRUE(router.resolve("GET", "/api/v1.0/ping"));
    EXPECT_FALSE(router.resolve("GET", "/api/v1x0/ping"));
}

TEST(HttpUtil, EnvelopesWrapPayloads) {
    auto ok = server::successEnvelope(boost::json::object{{"bin", "424242"}}, "/api/bins/424242");
    EXPECT_TRUE(ok.at("success").as_bool());
    EXPECT_EQ(ok.at("path").as_string(), "/api/bins/424242");
    EXPECT_EQ(ok.at("data").at("bin").as_string(), "424242");

    auto failed = server::errorEnvelope(
        boost::json::object{{"code", "blocked"}, {"message", "test BIN"}}, "/api/bins/411111");
    EXPECT_FALSE(failed.at("success").as_bool());
    EXPECT_EQ(failed.at("error").at("code").as_string(), "blocked");
    EXPECT_FALSE(failed.at("error").as_object().contains("details"));

    auto plain = server::errorEnvelope(boost::json::string("upstream exploded"), "/x");
    EXPECT_EQ(plain.at("error").at("message").as_string(), "upstream exploded");
}

TEST(HttpUtil, DecodesQueryParameters) {
    auto params = server::parseQueryParameters("/x?country=United%20Kingdom&flag&name=a+b");
    EXPECT_EQ(params.at("country"), "United Kingdom");
    EXPECT_EQ(params.at("flag"), "");
    EXPECT_EQ(params.at("name"), "a b");
    EXPECT_TRUE(server::parseQueryParameters("/x").empty());
    EXPECT_EQ(server::urlDecode("42%2F42"), "42/42");
}

TEST(RequestGuard, CallerPrefersApiKeyAndForwardedAddress) {
    auto ctx = makeContext(http::verb::get, "/", {},
                           {{"X-Api-Key", " key-1 "}, {"X-Forwarded-For", "203.0.113.5, 10.0.0.1"}});
    auto caller = controller::callerFrom(ctx);
    EXPECT_EQ(caller.identity, "key-1");
    EXPECT_EQ(caller.sourceAddress, "203.0.113.5");
    EXPECT_EQ(controller::quotaIdentity(caller), "user:key-1");

    auto anonymous = controller::callerFrom(makeContext(http::verb::get, "/"));
    EXPECT_TRUE(anonymous.identity.empty());
    EXPECT_EQ(anonymous.sourceAddress, "192.0.2.10");
    EXPECT_EQ(controller::quotaIdentity(anonymous), "ip:192.0.2.10");
    EXPECT_EQ(controller::quotaIdentity(service::Caller{}), "anonymous");
}

TEST(RequestGuard, MapsServiceErrorsToStatus) {
    using service::ErrorCode;
    EXPECT_EQ(controller::statusFor(ErrorCode::InvalidFormat), http::status::bad_request);
    EXPECT_EQ(controller::statusFor(ErrorCode::UnsupportedAvsCountry), http::status::bad_request);
    EXPECT_EQ(controller::statusFor(ErrorCode::Blocked), http::status::forbidden);
    EXPECT_EQ(controller::statusFor(ErrorCode::NotFound), http::status::not_found);
    EXPECT_EQ(controller::statusFor(ErrorCode::QuotaExceeded), http::status::too_many_requests);
    EXPECT_EQ(controller::statusFor(ErrorCode::StoreUnavailable), http::status::service_unavailable);
    EXPECT_EQ(controller::statusFor(ErrorCode::InvariantViolation), http::status::internal_server_error);
}

TEST(RequestGuard, RiskDenialShortCircuitsAdmission) {
    service::AdmissionController admission{apiQuota()};
    DenyingRiskProvider risk;
    controller::RequestGuard guard{admission, risk};

    auto ctx = makeContext(http::verb::get, "/api/bins/424242", {}, {{"User-Agent", "probe/1.0"}});
    EXPECT_FALSE(guard.admit(ctx, "bin_lookup"));
    EXPECT_EQ(ctx.response.result(), http::status::forbidden);
    EXPECT_EQ(bodyOf(ctx).at("code").as_string(), "risk_denied");
    EXPECT_EQ(risk.lastFacts.userAgent, "probe/1.0");
    EXPECT_EQ(admission.peek("ip:192.0.2.10", "bin_lookup").remaining, 3);
}

TEST_F(ApiTest, BinLookupReturnsRecord) {
    auto ctx = dispatch(http::verb::get, "/api/bins/424242");
    EXPECT_EQ(ctx.response.result(), http::status::ok);
    auto body = bodyOf(ctx);
    EXPECT_EQ(body.at("brand").as_string(), "VISA");
    EXPECT_EQ(body.at("card_length").to_number<int>(), 16);
    EXPECT_EQ(ctx.response["X-RateLimit-Limit"], "3");
    EXPECT_EQ(ctx.response["X-RateLimit-Remaining"], "2");
}

TEST_F(ApiTest, BinLookupRefusesTestRange) {
    auto ctx = dispatch(http::verb::get, "/api/bins/411111");
    EXPECT_EQ(ctx.response.result(), http::status::forbidden);
    EXPECT_EQ(bodyOf(ctx).at("code").as_string(), "blocked");
}

TEST_F(ApiTest, BinLookupUnknownAndMalformed) {
    EXPECT_EQ(dispatch(http::verb::get, "/api/bins/999999").response.result(), http::status::not_found);
    EXPECT_EQ(dispatch(http::verb::get, "/api/bins/42a242").response.result(), http::status::bad_request);
}

TEST_F(ApiTest, QuotaDenialCarriesRetryAfter) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(dispatch(http::verb::get, "/api/bins/424242").response.result(), http::status::ok);
    }
    auto ctx = dispatch(http::verb::get, "/api/bins/424242");
    EXPECT_EQ(ctx.response.result(), http::status::too_many_requests);
    EXPECT_EQ(ctx.response[http::field::retry_after], "60");
    auto body = bodyOf(ctx);
    EXPECT_EQ(body.at("code").as_string(), "quota_exceeded");
    const auto& details = body.at("details").as_object();
    EXPECT_EQ(details.at("retry_after").to_number<int>(), 60);
    EXPECT_EQ(details.at("violation_count").to_number<int>(), 1);
    EXPECT_EQ(details.at("limit").to_number<int>(), 3);

    auto quota = bodyOf(dispatch(http::verb::get, "/api/quota/bin_lookup"));
    EXPECT_EQ(quota.at("remaining").to_number<int>(), 0);
    EXPECT_EQ(quota.at("violations").to_number<int>(), 1);
}

TEST_F(ApiTest, GeneratesCardFromPathWithAvs) {
    auto ctx = dispatch(http::verb::get, "/api/cards/generate/424242?avs=true&country=US");
    ASSERT_EQ(ctx.response.result(), http::status::ok);
    auto body = bodyOf(ctx);
    EXPECT_EQ(body.at("number").as_string().size(), 16u);
    EXPECT_EQ(body.at("bin").as_string(), "424242");
    EXPECT_TRUE(body.at("postal_code").is_string());
    EXPECT_EQ(body.at("formatted").as_string().size(), 19u);
}

TEST_F(ApiTest, GenerateRejectsUnsupportedAvsCountry) {
    auto ctx = dispatch(http::verb::post, "/api/cards/generate",
                        R"({"bin": "424242", "avs": true, "country": "ZZ"})");
    EXPECT_EQ(ctx.response.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(ctx).at("code").as_string(), "unsupported_avs_country");
}

TEST_F(ApiTest, GenerateRejectsMalformedBody) {
    auto ctx = dispatch(http::verb::post, "/api/cards/generate", "{not json");
    EXPECT_EQ(ctx.response.result(), http::status::bad_request);
    EXPECT_EQ(bodyOf(ctx).at("code").as_string(), "invalid_request");
}

TEST_F(ApiTest, BulkGeneratesRequestedCount) {
    auto ctx = dispatch(http::verb::post, "/api/cards/bulk", R"({"bin": "378282", "count": 4})");
    ASSERT_EQ(ctx.response.result(), http::status::ok);
    auto body = bodyOf(ctx);
    EXPECT_EQ(body.at("count").to_number<int>(), 4);
    for (const auto& card : body.at("cards").as_array()) {
        EXPECT_EQ(card.at("number").as_string().size(), 15u);
        EXPECT_EQ(card.at("cvv").as_string().size(), 4u);
    }

    auto tooMany = dispatch(http::verb::post, "/api/cards/bulk", R"({"bin": "378282", "count": 5000})");
    EXPECT_EQ(tooMany.response.result(), http::status::bad_request);
}

TEST_F(ApiTest, BulkRejectsNonIntegralCounts) {
    for (const char* body : {R"({"bin": "378282", "count": 1e300})", R"({"bin": "378282", "count": -1e300})",
                             R"({"bin": "378282", "count": 2.5})"}) {
        auto ctx = dispatch(http::verb::post, "/api/cards/bulk", body);
        EXPECT_EQ(ctx.response.result(), http::status::bad_request) << body;
        EXPECT_EQ(bodyOf(ctx).at("code").as_string(), "invalid_request") << body;
    }
}

TEST_F(ApiTest, ExportReturnsRawDocument) {
    auto ctx = dispatch(http::verb::post, "/api/cards/export/csv", R"({"bin": "510510", "count": 2})");
    ASSERT_EQ(ctx.response.result(), http::status::ok);
    EXPECT_EQ(ctx.response[http::field::content_type], "text/csv");
    EXPECT_EQ(ctx.response["X-Api-Envelope"], "skip");
    EXPECT_EQ(ctx.response[http::field::content_disposition], "attachment; filename=\"cards_510510.csv\"");
    EXPECT_EQ(ctx.response.body().rfind("number,cvv,expiry", 0), 0u);

    auto unknown = dispatch(http::verb::post, "/api/cards/export/pdf", R"({"bin": "510510"})");
    EXPECT_EQ(unknown.response.result(), http::status::bad_request);
}

TEST_F(ApiTest, ListsAvsCountries) {
    auto body = bodyOf(dispatch(http::verb::get, "/api/avs/countries"));
    ASSERT_TRUE(body.contains("IT"));
    EXPECT_EQ(body.at("IT").as_array().size(), 5u);
}
