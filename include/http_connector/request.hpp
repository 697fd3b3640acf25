#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "host.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace http_connector {

    /// @brief What the caller asks for. Everything is optional; the defaults
    /// produce "GET <host base path or />".
    struct RequestParams {
        HttpMethod method{HttpMethod::Get};
        std::string path;
        QueryParams query;
        Headers headers;
        std::optional<std::string> body;
    };

    /// @brief Wire parameters derived from a Host and RequestParams.
    struct RequestTarget {
        HttpMethod method{HttpMethod::Get};
        Protocol protocol{Protocol::Http};
        std::string hostname;
        std::uint16_t port{0};
        /// @brief Base path + request path, with "?query" appended when the
        /// merged query is non-empty.
        std::string path;
        Headers headers;
    };

    /// @brief One completed attempt, as handed to the trace sink.
    struct RequestTrace {
        HttpMethod method{HttpMethod::Get};
        RequestTarget target;
        std::optional<std::string> request_body;
        std::optional<std::string> response_body;
        int status{0};
    };

    /// @brief Build wire parameters from the host defaults and the request.
    RequestTarget make_request_target(const Host& host, Protocol protocol,
                                      const RequestParams& params);

    /// @brief Build the Beast request. Content-Length is always set: the body
    /// byte length, or 0 without a body.
    boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const RequestTarget& target,
                          const std::optional<std::string>& body,
                          std::string_view user_agent, bool keep_alive);

}  // namespace http_connector
