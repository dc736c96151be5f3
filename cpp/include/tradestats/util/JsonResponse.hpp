#pragma once

#include "tradestats/server/RequestContext.hpp"
#include "tradestats/util/JsonUtil.hpp"

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <string>

namespace tradestats::util {

inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";

inline void sendJson(server::RequestContext& ctx,
                     const boost::json::value& value,
                     boost::beast::http::status status = boost::beast::http::status::ok) {
    ctx.response.result(status);
    ctx.response.set(boost::beast::http::field::content_type, kJsonContentType);
    ctx.response.body() = stringifyJson(value);
    ctx.response.prepare_payload();
}

inline boost::json::object makeErrorBody(const std::string& message) {
    boost::json::object body;
    body["error"] = message;
    return body;
}

inline void sendError(server::RequestContext& ctx,
                      boost::beast::http::status status,
                      const std::string& message) {
    sendJson(ctx, makeErrorBody(message), status);
}

} // namespace tradestats::util
