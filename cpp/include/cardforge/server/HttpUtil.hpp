#pragma once

#include "cardforge/server/RequestContext.hpp"

#include <boost/beast/http/status.hpp>
#include <boost/json.hpp>

#include <string>
#include <string_view>
#include <unordered_map>

namespace cardforge::server {

std::string urlDecode(std::string_view value);
std::unordered_map<std::string, std::string> parseQueryParameters(std::string_view target);

// Bodies written here are wrapped into the response envelope by the session.
void writeJson(RequestContext& ctx, boost::beast::http::status status, const boost::json::value& payload);
void writeError(RequestContext& ctx,
                boost::beast::http::status status,
                std::string_view code,
                std::string_view message,
                const boost::json::value& details = nullptr);

// {"success": true, "timestamp", "path", "data"}.
boost::json::object successEnvelope(const boost::json::value& data, std::string_view path);

// {"success": false, "timestamp", "path", "error": {"code", "message", "details"?}}.
// A body that is not an error object is carried as the message.
boost::json::object errorEnvelope(const boost::json::value& body, std::string_view path);

// Sent as-is; the envelope is skipped.
void writeRaw(RequestContext& ctx,
              boost::beast::http::status status,
              std::string_view contentType,
              std::string body);

} // namespace cardforge::server
