#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core/string.hpp>

#include "url.hpp"

namespace http_connector {

    /// @brief Supported schemes. Anything else is rejected with
    /// UnsupportedProtocolError.
    enum class Protocol { Http, Https };

    /// @brief Map a protocol string ("http", "https:", "HTTPS", ...) to a
    /// Protocol.
    /// @throws UnsupportedProtocolError for every other scheme.
    Protocol parse_protocol(std::string_view protocol);

    inline constexpr std::string_view to_string(Protocol p) {
        return p == Protocol::Https ? "https" : "http";
    }

    /// @brief Case-insensitive ordering so header maps merge the way HTTP
    /// header names compare.
    struct HeaderNameLess {
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return boost::beast::iless{}(
                boost::beast::string_view(a.data(), a.size()),
                boost::beast::string_view(b.data(), b.size()));
        }
        using is_transparent = void;
    };

    using Headers = std::map<std::string, std::string, HeaderNameLess>;

    /**
     * @brief TLS settings passed through to the pool when the scheme is
     * https. Paths are read by OpenSSL at pool construction.
     */
    struct TlsOptions {
        /** @brief PEM file with trusted CA certificates. */
        std::optional<std::string> ca_file;
        /** @brief Trusted CA certificates as PEM text. */
        std::optional<std::string> ca;
        /** @brief Client certificate chain (PEM file). */
        std::optional<std::string> cert_file;
        /** @brief Client private key (PEM file). */
        std::optional<std::string> key_file;
        /** @brief Passphrase for an encrypted private key. */
        std::optional<std::string> passphrase;
        /** @brief OpenSSL cipher list string. */
        std::optional<std::string> ciphers;
        /** @brief SNI name, defaults to the host name. */
        std::optional<std::string> servername;
        /** @brief Verify the server certificate chain. */
        bool reject_unauthorized{true};
    };

    /**
     * @brief Describes the one node a connector talks to.
     *
     * The connector keeps a reference; the Host must outlive it.
     */
    class Host {
       public:
        std::string protocol{"http"};
        std::string host{"localhost"};
        /// @brief 0 selects the scheme default (80 or 443).
        std::uint16_t port{0};
        std::string path;
        Headers headers;
        QueryParams query;
        TlsOptions ssl;

        Host() = default;

        /// @brief Build a Host from "http://localhost:9200/prefix?pretty=true".
        /// The scheme is not validated here.
        static Result<Host> from_url(std::string_view url);

        /// @brief Host headers merged with per-request overrides, request
        /// values winning on conflict.
        Headers get_headers(const Headers& overrides = {}) const;

        /// @brief Host query merged with per-request overrides; nullopt when
        /// the merged query is empty.
        std::optional<QueryParams> get_query(
            const QueryParams& overrides = {}) const;

        /// @brief Port actually dialed.
        std::uint16_t effective_port() const;

        /// @brief Pool bookkeeping key, "host:port:".
        std::string key() const;
    };

}  // namespace http_connector
