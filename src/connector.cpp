#include "http_connector/connector.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include "http_connector/logging.hpp"
#include "http_connector/pending_request.hpp"

namespace http_connector {

    HttpConnector::HttpConnector(executor_type ex, const Host& host,
                                 ConnectorConfiguration config)
        : ex_(std::move(ex)),
          host_(host),
          protocol_(parse_protocol(host.protocol)),
          config_(std::move(config)) {
        if (config_.forever) config_.keep_alive = *config_.forever;

        if (config_.create_agent) {
            agent_ = config_.create_agent(*this, config_);
        } else {
            agent_ = create_agent();
        }

        HTTP_CONNECTOR_LOG_DEBUG(
            "connector for {}://{}:{} ready (keep_alive={}, max_sockets={})",
            to_string(protocol_), host_.host, host_.effective_port(),
            config_.keep_alive, agent_ ? agent_->max_sockets() : 0);
    }

    HttpConnector::~HttpConnector() {
        if (agent_) agent_->drain();
    }

    AgentOptions HttpConnector::make_agent_options() const {
        AgentOptions options;
        options.keep_alive = config_.keep_alive;
        options.keep_alive_interval = config_.keep_alive_interval;
        options.max_sockets = config_.max_sockets;
        options.max_free_sockets = config_.keep_alive_max_free_sockets;
        options.free_socket_timeout = config_.keep_alive_free_socket_timeout;
        if (protocol_ == Protocol::Https) options.tls = host_.ssl;
        return options;
    }

    std::shared_ptr<Agent> HttpConnector::create_agent() {
        auto options = make_agent_options();
        if (options.keep_alive) {
            return std::make_shared<KeepAliveAgent>(
                ex_, host_.host, host_.effective_port(), std::move(options));
        }
        return std::make_shared<Agent>(ex_, host_.host,
                                       host_.effective_port(),
                                       std::move(options));
    }

    RequestTarget HttpConnector::make_request_target(
        const RequestParams& params) const {
        return http_connector::make_request_target(host_, protocol_, params);
    }

    void HttpConnector::set_status(ConnectionStatus status) {
        if (status_ == status) return;
        // Closed is final.
        if (status_ == ConnectionStatus::Closed) return;

        HTTP_CONNECTOR_LOG_DEBUG("{}:{} status {} -> {}", host_.host,
                                 host_.effective_port(), to_string(status_),
                                 to_string(status));
        status_ = status;
        if (status == ConnectionStatus::Closed && agent_) agent_->drain();
    }

    CancelFn HttpConnector::request(RequestParams params,
                                    CompletionHandler done) {
        if (status_ == ConnectionStatus::Closed || !agent_ ||
            agent_->closed()) {
            boost::asio::post(ex_, [done = std::move(done)]() {
                if (done) {
                    done(Error{Error::Code::PoolClosed,
                               "Connection is closed"},
                         std::nullopt, 0, {});
                }
            });
            return [] {};
        }

        PendingRequest::Options options;
        options.user_agent = config_.user_agent;
        options.keep_alive_interval = config_.keep_alive_interval;
        options.max_body_bytes = config_.max_body_bytes;
        options.trace = config_.trace;

        auto pending = std::make_shared<PendingRequest>(
            agent_, host_.key(), make_request_target(params),
            std::move(params.body), std::move(options), std::move(done));
        pending->start();

        std::weak_ptr<PendingRequest> weak = pending;
        auto ex = ex_;
        return [weak, ex]() {
            boost::asio::dispatch(ex, [weak]() {
                if (auto p = weak.lock()) p->abort();
            });
        };
    }

}  // namespace http_connector
