#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/TimeFormat.hpp"

#include <cstdlib>

namespace cardforge::server {

std::string urlDecode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            std::string hex(value.substr(i + 1, 2));
            result.push_back(static_cast<char>(std::strtol(hex.c_str(), nullptr, 16)));
            i += 2;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

std::unordered_map<std::string, std::string> parseQueryParameters(std::string_view target) {
    std::unordered_map<std::string, std::string> params;
    auto pos = target.find('?');
    if (pos == std::string_view::npos) {
        return params;
    }
    auto query = target.substr(pos + 1);
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string_view::npos) {
            end = query.size();
        }
        auto token = query.substr(start, end - start);
        auto eq = token.find('=');
        if (eq != std::string_view::npos) {
            params.emplace(urlDecode(token.substr(0, eq)), urlDecode(token.substr(eq + 1)));
        } else if (!token.empty()) {
            params.emplace(urlDecode(token), "");
        }
        start = end + 1;
    }
    return params;
}

void writeJson(RequestContext& ctx, boost::beast::http::status status, const boost::json::value& payload) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = util::stringifyJson(payload);
    ctx.response.prepare_payload();
}

void writeError(RequestContext& ctx,
                boost::beast::http::status status,
                std::string_view code,
                std::string_view message,
                const boost::json::value& details) {
    boost::json::object obj;
    obj["code"] = code;
    obj["message"] = message;
    if (!details.is_null()) {
        obj["details"] = details;
    }
    writeJson(ctx, status, obj);
}

boost::json::object successEnvelope(const boost::json::value& data, std::string_view path) {
    boost::json::object envelope;
    envelope["success"] = true;
    envelope["timestamp"] = util::makeIsoTimestamp();
    envelope["path"] = path;
    envelope["data"] = data;
    return envelope;
}

boost::json::object errorEnvelope(const boost::json::value& body, std::string_view path) {
    boost::json::object error;
    if (body.is_object()) {
        const auto& object = body.as_object();
        error["code"] = util::readString(object, "code").value_or("error");
        error["message"] = util::readString(object, "message").value_or("");
        if (auto details = object.if_contains("details"); details && !details->is_null()) {
            error["details"] = *details;
        }
    } else {
        error["code"] = "error";
        error["message"] = body.is_string() ? body.as_string() : boost::json::string(util::stringifyJson(body));
    }

    boost::json::object envelope;
    envelope["success"] = false;
    envelope["timestamp"] = util::makeIsoTimestamp();
    envelope["path"] = path;
    envelope["error"] = std::move(error);
    return envelope;
}

void writeRaw(RequestContext& ctx,
              boost::beast::http::status status,
              std::string_view contentType,
              std::string body) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, contentType);
    ctx.response.set("X-Api-Envelope", "skip");
    ctx.response.body() = std::move(body);
    ctx.response.prepare_payload();
}

} // namespace cardforge::server
