#pragma once

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "agent.hpp"
#include "config.hpp"
#include "error.hpp"
#include "request.hpp"
#include "response.hpp"

namespace http_connector {

    /**
     * @brief One request/response cycle on a socket borrowed from an Agent.
     *
     * State machine:
     *   Created -> Sent -> Receiving -> {Complete | Failed | Aborted}
     * Failed and Aborted are reachable from every non-terminal state.
     *
     * The completion handler is posted to the executor exactly once, when
     * the first terminal state is entered. Cleanup (returning the lease,
     * dropping the waiter) runs on that same transition and never again.
     *
     * Must be driven from the agent's event loop; abort() in particular is
     * not thread-safe.
     */
    class PendingRequest
        : public std::enable_shared_from_this<PendingRequest> {
       public:
        enum class State { Created, Sent, Receiving, Complete, Failed, Aborted };

        struct Options {
            std::string user_agent;
            std::chrono::milliseconds keep_alive_interval{1000};
            std::uint64_t max_body_bytes{
                std::numeric_limits<std::uint64_t>::max()};
            TraceSink trace;
        };

        PendingRequest(std::shared_ptr<Agent> agent, std::string key,
                       RequestTarget target, std::optional<std::string> body,
                       Options options, CompletionHandler done);

        PendingRequest(const PendingRequest&) = delete;
        PendingRequest& operator=(const PendingRequest&) = delete;

        /// @brief Spawn the request on the agent's executor.
        void start();

        /**
         * @brief Cancel the request.
         *
         * Destroys the socket (it is never reused) and delivers one Aborted
         * error. No-op once a terminal state was reached, so calling it
         * twice is harmless.
         */
        void abort();

        State state() const noexcept { return state_; }

        bool terminal() const noexcept {
            return state_ == State::Complete || state_ == State::Failed ||
                   state_ == State::Aborted;
        }

       private:
        boost::asio::awaitable<void> run();

        void fail(Error error);
        void finish(State terminal_state, std::optional<Error> error);
        void trace() const;

        std::shared_ptr<Agent> agent_;
        std::string key_;
        RequestTarget target_;
        std::optional<std::string> request_body_;
        Options options_;
        CompletionHandler done_;

        std::shared_ptr<Agent::Waiter> waiter_;
        Agent::Lease lease_;

        State state_{State::Created};
        int status_{0};
        ResponseHeaders headers_;
        std::string body_;
    };

    inline const char* to_string(PendingRequest::State state) {
        switch (state) {
            case PendingRequest::State::Created:
                return "Created";
            case PendingRequest::State::Sent:
                return "Sent";
            case PendingRequest::State::Receiving:
                return "Receiving";
            case PendingRequest::State::Complete:
                return "Complete";
            case PendingRequest::State::Failed:
                return "Failed";
            case PendingRequest::State::Aborted:
                return "Aborted";
        }
        return "Unknown";
    }

}  // namespace http_connector
