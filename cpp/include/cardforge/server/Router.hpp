#pragma once

#include "cardforge/server/RequestContext.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cardforge::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    struct Match {
        Handler handler;
        std::unordered_map<std::string, std::string> params;
        // Set when the path exists under other methods only.
        std::vector<std::string> allowedMethods;

        explicit operator bool() const noexcept { return static_cast<bool>(handler); }
    };

    // `:name` segments capture into RequestContext::pathParameters; every
    // other segment is matched literally.
    void addRoute(std::string method, const std::string& path, Handler handler);

    // The query string and a trailing slash are ignored when matching.
    Match resolve(const std::string& method, const std::string& target) const;

    std::size_t size() const noexcept { return routes_.size(); }

private:
    struct Route {
        std::string method;
        std::regex pattern;
        std::vector<std::string> paramNames;
        Handler handler;
    };

    std::vector<Route> routes_;
};

} // namespace cardforge::server
