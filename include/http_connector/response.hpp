#pragma once

#include <boost/beast/http/fields.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "error.hpp"

namespace http_connector {

    /// @brief Response headers keyed by lower-cased name.
    using ResponseHeaders = std::map<std::string, std::string>;

    /**
     * @brief Completion callback: (error, body, status, headers).
     *
     * Fires exactly once per request. On failure body is empty and status
     * and headers hold whatever had been received (0 and empty when the
     * failure came before the response head).
     */
    using CompletionHandler =
        std::function<void(std::optional<Error> error,
                           std::optional<std::string> body, int status,
                           ResponseHeaders headers)>;

    /// @brief Returned by HttpConnector::request. Idempotent.
    using CancelFn = std::function<void()>;

    /// @brief Copy Beast response headers, lower-casing names. Repeated
    /// headers are joined with ", ".
    ResponseHeaders copy_response_headers(const boost::beast::http::fields& in);

}  // namespace http_connector
