#pragma once

#include "tradestats/server/RequestContext.hpp"

#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace tradestats::server {

class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    // Literal path segments only; a trailing slash on the request still matches.
    void addRoute(std::string method, std::string path, Handler handler);

    // Matching is case-sensitive on the path and ignores the query string. Returns an
    // empty handler when nothing matches.
    Handler resolve(const std::string& method, const std::string& target) const;

    // Runs the matching handler, or writes a JSON 404 when there is none.
    void dispatch(RequestContext& ctx) const;

private:
    struct RouteEntry {
        std::string method;
        std::string path;
        std::regex pattern;
        Handler handler;
    };

    std::vector<RouteEntry> routes_;
};

} // namespace tradestats::server
