#include "tradestats/server/Router.hpp"
#include "tradestats/util/JsonResponse.hpp"
#include "tradestats/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>

namespace tradestats::server {
namespace {
std::string normalizeMethod(std::string method) {
    std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return method;
}

std::string escapeRegex(const std::string& token) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(token.size());
    for (char c : token) {
        if (special.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string stripQuery(const std::string& target) {
    auto queryPos = target.find('?');
    if (queryPos == std::string::npos) {
        return target;
    }
    auto path = target.substr(0, queryPos);
    return path.empty() ? std::string{"/"} : path;
}
}

void Router::addRoute(std::string method, std::string path, Handler handler) {
    RouteEntry entry;
    entry.method = normalizeMethod(std::move(method));
    entry.path = std::move(path);
    entry.handler = std::move(handler);

    std::string token;
    std::ostringstream regexBuilder;
    regexBuilder << '^';

    std::istringstream iss(entry.path);
    while (std::getline(iss, token, '/')) {
        if (token.empty()) {
            continue;
        }
        regexBuilder << '/' << escapeRegex(token);
    }

    regexBuilder << "/?$";
    entry.pattern = std::regex(regexBuilder.str());

    routes_.push_back(std::move(entry));
}

Router::Handler Router::resolve(const std::string& method, const std::string& target) const {
    auto normalized = normalizeMethod(method);
    auto path = stripQuery(target);
    for (const auto& entry : routes_) {
        if (entry.method != normalized) {
            continue;
        }

        if (std::regex_match(path, entry.pattern)) {
            return entry.handler;
        }
    }

    return nullptr;
}

void Router::dispatch(RequestContext& ctx) const {
    std::string method(ctx.request.method_string());
    std::string target(ctx.request.target());

    auto handler = resolve(method, target);

    if (!handler) {
        util::sendError(ctx, boost::beast::http::status::not_found,
                        "Cannot " + method + " " + stripQuery(target));
        return;
    }

    try {
        handler(ctx);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Unhandled error on " + method + " " + target + ": " + ex.what());
        util::sendError(ctx, boost::beast::http::status::internal_server_error, ex.what());
    }
}

} // namespace tradestats::server
