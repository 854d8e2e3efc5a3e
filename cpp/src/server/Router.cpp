#include "cardforge/server/Router.hpp"
#include "cardforge/util/StringUtil.hpp"

#include <algorithm>

namespace cardforge::server {
namespace {
std::string escapeLiteral(const std::string& segment) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(segment.size());
    for (char ch : segment) {
        if (kSpecial.find(ch) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

std::string pathOf(const std::string& target) {
    auto path = target.substr(0, target.find('?'));
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path.empty() ? std::string{"/"} : path;
}
} // namespace

void Router::addRoute(std::string method, const std::string& path, Handler handler) {
    Route route;
    route.method = util::toUpper(std::move(method));
    route.handler = std::move(handler);

    std::string expression;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        auto segment = path.substr(start, end - start);
        if (!segment.empty()) {
            expression += '/';
            if (segment.front() == ':') {
                route.paramNames.push_back(segment.substr(1));
                expression += "([^/]+)";
            } else {
                expression += escapeLiteral(segment);
            }
        }
        start = end + 1;
    }
    if (expression.empty()) {
        expression = "/";
    }
    route.pattern = std::regex(expression);
    routes_.push_back(std::move(route));
}

Router::Match Router::resolve(const std::string& method, const std::string& target) const {
    const auto verb = util::toUpper(method);
    const auto path = pathOf(target);

    Match result;
    for (const auto& route : routes_) {
        std::smatch captures;
        if (!std::regex_match(path, captures, route.pattern)) {
            continue;
        }
        if (route.method != verb) {
            if (std::find(result.allowedMethods.begin(), result.allowedMethods.end(), route.method) ==
                result.allowedMethods.end()) {
                result.allowedMethods.push_back(route.method);
            }
            continue;
        }
        for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
            result.params.emplace(route.paramNames[i], captures[i + 1].str());
        }
        result.handler = route.handler;
        result.allowedMethods.clear();
        return result;
    }
    return result;
}

} // namespace cardforge::server
