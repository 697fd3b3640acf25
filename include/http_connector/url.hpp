#pragma once

#include <map>
#include <string>
#include <string_view>

#include "result.hpp"

namespace http_connector {

    /// @brief Query parameters, kept sorted so the encoded query is stable.
    using QueryParams = std::map<std::string, std::string>;

    /// @brief Pieces of an absolute URL. The scheme is kept verbatim (lower
    /// cased, without "://") so unsupported schemes can be reported by the
    /// transport rather than by the parser.
    struct UrlComponents {
        std::string scheme;
        std::string host;
        std::string port;  ///< Empty when the URL names no port.
        std::string path;  ///< Path without query, may be empty.
        QueryParams query;
    };

    namespace url_utils {

        /// @brief Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
        std::string url_encode(std::string_view s);

        /// @brief Decode %XX escapes and '+' (as space) in a query component.
        std::string url_decode(std::string_view s);

        /// @brief Encode a query map as "k1=v1&k2=v2".
        std::string encode_query(const QueryParams& query);

        /// @brief Parse "a=1&b=2" into a map. Later duplicates win.
        QueryParams parse_query(std::string_view query);

        /// @brief Concatenate a base path and a request path; "/" when both
        /// are empty.
        std::string join_path(std::string_view base, std::string_view path);

    }  // namespace url_utils

    /// @brief Parse "scheme://host[:port][/path][?query]".
    Result<UrlComponents> parse_url(std::string_view url);

}  // namespace http_connector
