#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <memory>

#include "agent.hpp"
#include "config.hpp"
#include "host.hpp"
#include "request.hpp"
#include "response.hpp"

namespace http_connector {

    /// @brief Lifecycle status of a connector, driven by its owner.
    enum class ConnectionStatus { Alive, Dead, Closed };

    inline const char* to_string(ConnectionStatus status) {
        switch (status) {
            case ConnectionStatus::Alive:
                return "alive";
            case ConnectionStatus::Dead:
                return "dead";
            case ConnectionStatus::Closed:
                return "closed";
        }
        return "unknown";
    }

    /**
     * @brief HTTP transport to a single node.
     *
     * Owns one Agent (socket pool) for the node described by the Host.
     * Every request() borrows a socket from it, and set_status(Closed)
     * drains it for good.
     *
     * All calls must be made on the event loop behind the executor, except
     * the CancelFn returned by request(), which may be called from any
     * thread.
     *
     * Usage:
     * @code
     *   boost::asio::io_context ioc;
     *   auto host = Host::from_url("http://localhost:9200").value();
     *   HttpConnector connector(ioc.get_executor(), host, {});
     *   connector.request({}, [](auto err, auto body, int status, auto) {
     *       // ...
     *   });
     *   ioc.run();
     * @endcode
     */
    class HttpConnector {
       public:
        using executor_type = boost::asio::any_io_executor;

        /**
         * @param ex Event loop all requests run on.
         * @param host Node description, kept by reference. Must outlive the
         * connector.
         * @param config Copied. create_agent, when set, replaces the
         * built-in pool.
         * @throws UnsupportedProtocolError when host.protocol is neither
         * http nor https.
         * @throws InvalidTlsOptionsError when the built-in https pool cannot
         * apply host.tls.
         */
        HttpConnector(executor_type ex, const Host& host,
                      ConnectorConfiguration config);

        HttpConnector(const HttpConnector&) = delete;
        HttpConnector& operator=(const HttpConnector&) = delete;

        /// @brief Drains the agent.
        ~HttpConnector();

        /**
         * @brief Issue a request. Returns immediately.
         * @param params Method, path, query, headers and body.
         * @param done Invoked exactly once on the executor.
         * @return Cancels the request; idempotent, a no-op after completion.
         */
        CancelFn request(RequestParams params, CompletionHandler done);

        /// @brief Wire parameters this connector would use for params.
        RequestTarget make_request_target(const RequestParams& params) const;

        /// @brief Change status. The first transition to Closed drains the
        /// agent; it is never reopened.
        void set_status(ConnectionStatus status);
        ConnectionStatus status() const noexcept { return status_; }

        /// @brief Options the built-in pool is created with: configuration
        /// limits, plus the host's TLS options for https.
        AgentOptions make_agent_options() const;

        const std::shared_ptr<Agent>& agent() const noexcept { return agent_; }
        executor_type get_executor() const noexcept { return ex_; }
        const Host& host() const noexcept { return host_; }
        Protocol protocol() const noexcept { return protocol_; }
        const ConnectorConfiguration& config() const noexcept {
            return config_;
        }

       private:
        std::shared_ptr<Agent> create_agent();

        executor_type ex_;
        const Host& host_;
        Protocol protocol_;
        ConnectorConfiguration config_;
        std::shared_ptr<Agent> agent_;
        ConnectionStatus status_{ConnectionStatus::Alive};
    };

}  // namespace http_connector
