#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "host.hpp"
#include "request.hpp"

namespace http_connector {

    class Agent;
    class HttpConnector;
    struct ConnectorConfiguration;

    /// @brief Sentinel for "no limit" on max_sockets.
    inline constexpr std::size_t unbounded_sockets =
        std::numeric_limits<std::size_t>::max();

    /**
     * @brief Replaces the built-in pool construction entirely. Receives the
     * connector (for its executor, host and agent options) and the
     * configuration with defaults applied.
     */
    using AgentFactory = std::function<std::shared_ptr<Agent>(
        HttpConnector&, const ConnectorConfiguration&)>;

    /// @brief Receives one entry per completed attempt.
    using TraceSink = std::function<void(const RequestTrace&)>;

    /**
     * @brief Configuration for an HttpConnector. Copied at construction.
     */
    struct ConnectorConfiguration {
        /** @brief Maximum concurrent sockets to the host. */
        std::size_t max_sockets{unbounded_sockets};

        /** @brief Reuse idle sockets across requests. */
        bool keep_alive{true};

        /** @brief Legacy alias; when set it overrides keep_alive. */
        std::optional<bool> forever;

        /** @brief Idle time before TCP keep-alive packets on pooled sockets. */
        std::chrono::milliseconds keep_alive_interval{1000};

        /** @brief Maximum idle sockets retained by a keep-alive pool. */
        std::size_t keep_alive_max_free_sockets{256};

        /** @brief Idle sockets are destroyed after this long unused. */
        std::chrono::milliseconds keep_alive_free_socket_timeout{60000};

        /** @brief Largest response body accepted, in bytes on the wire. */
        std::uint64_t max_body_bytes{std::numeric_limits<std::uint64_t>::max()};

        /** @brief User-Agent header; empty sends none. */
        std::string user_agent;

        /** @brief Full override for pool construction. */
        AgentFactory create_agent;

        /** @brief Request trace sink; the spdlog logger is used when unset. */
        TraceSink trace;
    };

    /**
     * @brief Effective options of one pool, derived from the configuration.
     */
    struct AgentOptions {
        bool keep_alive{true};
        std::chrono::milliseconds keep_alive_interval{1000};
        std::size_t max_sockets{unbounded_sockets};
        std::size_t max_free_sockets{256};
        std::chrono::milliseconds free_socket_timeout{60000};

        /// @brief Only set for https hosts.
        std::optional<TlsOptions> tls;
    };

}  // namespace http_connector
