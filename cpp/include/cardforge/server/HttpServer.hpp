#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace cardforge::server {

class Router;

struct ServerOptions {
    std::string host{"0.0.0.0"};
    unsigned short port{8080};
    // Larger bodies are answered with 413 and the connection is closed.
    std::uint64_t bodyLimit{64 * 1024};
    std::chrono::seconds readTimeout{30};
};

// Accepts connections and hands each one to a session that resolves requests
// through the router and wraps JSON bodies into the API envelope.
class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(boost::asio::io_context& io, std::shared_ptr<Router> router, ServerOptions options);

    // Throws boost::system::system_error when the endpoint cannot be bound.
    void start();
    void stop();

private:
    void doAccept();

    boost::asio::io_context& io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<Router> router_;
    ServerOptions options_;
    std::atomic<bool> running_{false};
};

} // namespace cardforge::server
