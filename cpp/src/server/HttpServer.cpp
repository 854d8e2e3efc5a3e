#include "cardforge/server/HttpServer.hpp"
#include "cardforge/server/HttpUtil.hpp"
#include "cardforge/server/RequestContext.hpp"
#include "cardforge/server/Router.hpp"
#include "cardforge/util/JsonUtil.hpp"
#include "cardforge/util/Logging.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace cardforge::server {
namespace {
namespace http = boost::beast::http;

bool isJson(const RequestContext::HttpResponse& response) {
    auto it = response.find(http::field::content_type);
    if (it == response.end()) {
        return false;
    }
    return util::toUpper(std::string(it->value())).find("APPLICATION/JSON") != std::string::npos;
}

// One request/response exchange at a time per connection.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Router> router, const ServerOptions& options)
        : stream_(std::move(socket))
        , router_(std::move(router))
        , bodyLimit_(options.bodyLimit)
        , readTimeout_(options.readTimeout) {}

    void start() {
        boost::system::error_code ec;
        auto endpoint = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remoteAddress_ = endpoint.address().to_string();
        }
        readRequest();
    }

private:
    void readRequest() {
        parser_.emplace();
        parser_->body_limit(bodyLimit_);
        stream_.expires_after(readTimeout_);
        http::async_read(stream_, buffer_, *parser_,
            [self = shared_from_this()](boost::system::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(boost::system::error_code ec) {
        if (ec == http::error::body_limit) {
            RequestContext ctx = newContext(parser_->release());
            writeError(ctx, http::status::payload_too_large, "payload_too_large",
                       "Request body exceeds " + std::to_string(bodyLimit_) + " bytes");
            ctx.response.keep_alive(false);
            finish(ctx);
            return;
        }
        if (ec) {
            if (ec != http::error::end_of_stream) {
                util::log(util::LogLevel::debug, "Read from " + remoteAddress_ + " ended: " + ec.message());
            }
            doClose();
            return;
        }
        RequestContext ctx = newContext(parser_->release());
        dispatch(ctx);
        finish(ctx);
    }

    RequestContext newContext(RequestContext::HttpRequest request) const {
        RequestContext ctx;
        ctx.startedAt = std::chrono::steady_clock::now();
        ctx.request = std::move(request);
        ctx.remoteAddress = remoteAddress_;
        ctx.response.version(ctx.request.version());
        ctx.response.keep_alive(ctx.request.keep_alive());
        auto target = ctx.request.target();
        ctx.queryParameters = parseQueryParameters(std::string_view(target.data(), target.size()));
        return ctx;
    }

    void dispatch(RequestContext& ctx) {
        const std::string method(ctx.request.method_string());
        const std::string target(ctx.request.target());
        auto match = router_->resolve(method, target);
        if (!match) {
            if (match.allowedMethods.empty()) {
                writeError(ctx, http::status::not_found, "not_found", "No route for " + method + " " + target);
            } else {
                std::string allow;
                for (const auto& verb : match.allowedMethods) {
                    allow += (allow.empty() ? "" : ", ") + verb;
                }
                writeError(ctx, http::status::method_not_allowed, "method_not_allowed",
                           method + " is not supported here");
                ctx.response.set(http::field::allow, allow);
            }
            return;
        }

        ctx.pathParameters = std::move(match.params);
        try {
            match.handler(ctx);
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::error, "Handler for " + method + " " + target + " failed: " + ex.what());
            writeError(ctx, http::status::internal_server_error, "internal", "internal error");
        }
        if (ctx.response.result() == http::status::unknown) {
            ctx.response.result(http::status::no_content);
            ctx.response.prepare_payload();
        }
    }

    void finish(RequestContext& ctx) {
        const std::string target(ctx.request.target());
        applyEnvelope(ctx.response, target.substr(0, target.find('?')));

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.startedAt);
        util::log(util::LogLevel::debug, remoteAddress_ + " " + std::string(ctx.request.method_string()) + " " +
                                             target + " -> " + std::to_string(ctx.response.result_int()) + " (" +
                                             std::to_string(elapsed.count()) + "ms)");

        auto response = std::make_shared<RequestContext::HttpResponse>(std::move(ctx.response));
        http::async_write(stream_, *response,
            [self = shared_from_this(), response](boost::system::error_code ec, std::size_t) {
                if (ec || !response->keep_alive()) {
                    self->doClose();
                    return;
                }
                self->readRequest();
            });
    }

    static void applyEnvelope(RequestContext::HttpResponse& response, const std::string& path) {
        if (auto header = response.find("X-Api-Envelope"); header != response.end()) {
            response.erase(header);
            return;
        }
        if (response.body().empty() || !isJson(response)) {
            return;
        }

        boost::json::value body;
        try {
            body = util::parseJson(response.body());
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Response for " + path + " is not valid JSON: " + ex.what());
            body = boost::json::string(response.body());
        }

        const auto status = response.result_int();
        auto envelope = status < 400 ? successEnvelope(body, path) : errorEnvelope(body, path);
        response.body() = util::stringifyJson(envelope);
        response.set(http::field::content_type, "application/json; charset=utf-8");
        response.prepare_payload();
    }

    void doClose() {
        boost::system::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<Router> router_;
    std::uint64_t bodyLimit_;
    std::chrono::seconds readTimeout_;
    std::string remoteAddress_;
};

} // namespace

HttpServer::HttpServer(boost::asio::io_context& io, std::shared_ptr<Router> router, ServerOptions options)
    : io_(io)
    , acceptor_(io)
    , router_(std::move(router))
    , options_(std::move(options)) {}

void HttpServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::make_address(options_.host), options_.port};
    try {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    } catch (const boost::system::system_error&) {
        running_ = false;
        throw;
    }

    util::log(util::LogLevel::info, "Listening on " + options_.host + ":" + std::to_string(options_.port) +
                                        " (body limit " + std::to_string(options_.bodyLimit) + " bytes)");
    doAccept();
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    util::log(util::LogLevel::info, "Listener closed");
}

void HttpServer::doAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [self = shared_from_this()](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (!self->running_) {
                return;
            }
            if (ec) {
                util::log(util::LogLevel::warn, "Accept failed: " + ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), self->router_, self->options_)->start();
            }
            self->doAccept();
        });
}

} // namespace cardforge::server
