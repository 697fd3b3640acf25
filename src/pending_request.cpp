#include "http_connector/pending_request.hpp"

#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/field.hpp>
#include <exception>

#include "http_connector/content_decoder.hpp"
#include "http_connector/logging.hpp"

namespace http_connector {

    namespace http = boost::beast::http;

    namespace {
        constexpr std::size_t chunk_size = 8 * 1024;

        std::string describe(const boost::system::error_code& ec) {
            return ec.message() + " (" + ec.category().name() + ":" +
                   std::to_string(ec.value()) + ")";
        }
    }  // namespace

    PendingRequest::PendingRequest(std::shared_ptr<Agent> agent,
                                   std::string key, RequestTarget target,
                                   std::optional<std::string> body,
                                   Options options, CompletionHandler done)
        : agent_(std::move(agent)),
          key_(std::move(key)),
          target_(std::move(target)),
          request_body_(std::move(body)),
          options_(std::move(options)),
          done_(std::move(done)),
          waiter_(std::make_shared<Agent::Waiter>(agent_->get_executor())) {}

    void PendingRequest::start() {
        auto self = shared_from_this();
        boost::asio::co_spawn(
            agent_->get_executor(),
            [self]() -> boost::asio::awaitable<void> {
                try {
                    co_await self->run();
                } catch (const std::exception& e) {
                    if (self->terminal()) {
                        HTTP_CONNECTOR_LOG_ERROR(
                            "exception after request finished: {}", e.what());
                    } else {
                        self->fail(Error{Error::Code::Unknown, e.what()});
                    }
                }
            },
            boost::asio::detached);
    }

    boost::asio::awaitable<void> PendingRequest::run() {
        // Cancelled before the coroutine got to run.
        if (terminal()) co_return;

        if (to_beast_verb(target_.method) == http::verb::unknown) {
            fail(Error{Error::Code::InvalidRequest, "Unsupported HTTP method"});
            co_return;
        }

        auto acquired = co_await agent_->acquire(key_, waiter_);
        if (terminal()) co_return;
        if (!acquired) {
            fail(std::move(acquired).error());
            co_return;
        }
        lease_ = std::move(acquired).value();

        // The lease may be handed back by abort() while we are suspended;
        // this reference keeps the Socket alive until we return.
        auto socket = lease_.get();

        if (auto ec = co_await socket->connect()) {
            if (terminal()) co_return;
            // An open TLS socket means TCP got through and the handshake
            // did not.
            const bool tls_failed = socket->https() && socket->is_open();
            lease_.mark_bad();
            fail(Error{tls_failed ? Error::Code::TlsHandshakeFailed
                                  : Error::Code::ConnectionFailed,
                       "Connect to " + target_.hostname + ":" +
                           std::to_string(target_.port) +
                           " failed: " + describe(ec)});
            co_return;
        }
        if (terminal()) co_return;

        if (auto ec = socket->set_no_delay(true)) {
            HTTP_CONNECTOR_LOG_DEBUG("socket {}: no-delay failed: {}",
                                     socket->id(), ec.message());
        }
        if (auto ec = socket->set_keep_alive(true,
                                             options_.keep_alive_interval)) {
            HTTP_CONNECTOR_LOG_DEBUG("socket {}: keep-alive failed: {}",
                                     socket->id(), ec.message());
        }

        auto req = prepare_beast_request(target_, request_body_,
                                         options_.user_agent,
                                         agent_->keep_alive());

        if (auto ec = co_await socket->write(req)) {
            if (terminal()) co_return;
            lease_.mark_bad();
            fail(Error{Error::Code::SendFailed,
                       "Failed to send request: " + describe(ec)});
            co_return;
        }
        if (terminal()) co_return;
        state_ = State::Sent;

        Socket::response_parser parser;
        parser.body_limit(options_.max_body_bytes);
        if (target_.method == HttpMethod::Head) parser.skip(true);

        if (auto ec = co_await socket->read_header(parser)) {
            if (terminal()) co_return;
            lease_.mark_bad();
            fail(Error{Error::Code::ReceiveFailed,
                       "Failed to read response: " + describe(ec)});
            co_return;
        }
        if (terminal()) co_return;

        state_ = State::Receiving;
        status_ = static_cast<int>(parser.get().result_int());
        headers_ = copy_response_headers(parser.get().base());

        auto encoding = parser.get()[http::field::content_encoding];
        auto decoder = ContentDecoder::for_encoding(
            std::string_view(encoding.data(), encoding.size()));

        std::array<char, chunk_size> chunk{};
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();

            auto ec = co_await socket->read_some(parser);
            if (terminal()) co_return;
            if (ec) {
                lease_.mark_bad();
                fail(Error{Error::Code::ReceiveFailed,
                           "Failed to read response body: " + describe(ec)});
                co_return;
            }

            const std::size_t n = chunk.size() - parser.get().body().size;
            if (n == 0) continue;

            auto fed = decoder.feed(std::string_view(chunk.data(), n), body_);
            if (!fed) {
                lease_.mark_bad();
                fail(std::move(fed).error());
                co_return;
            }
        }

        if (auto fin = decoder.finish(body_); !fin) {
            fail(std::move(fin).error());
            co_return;
        }

        if (!parser.keep_alive()) lease_.mark_bad();
        finish(State::Complete, std::nullopt);
    }

    void PendingRequest::abort() {
        if (terminal()) return;

        HTTP_CONNECTOR_LOG_DEBUG("aborting {} {} in state {}",
                                 to_string(target_.method), target_.path,
                                 to_string(state_));
        waiter_->cancel();
        // A half-used socket is never trusted again.
        lease_.mark_bad();
        finish(State::Aborted,
               Error{Error::Code::Aborted, "Request aborted"});
    }

    void PendingRequest::fail(Error error) {
        HTTP_CONNECTOR_LOG_DEBUG("{} {} failed: {} ({})",
                                 to_string(target_.method), target_.path,
                                 error.message, to_string(error.code));
        finish(State::Failed, std::move(error));
    }

    void PendingRequest::finish(State terminal_state,
                                std::optional<Error> error) {
        if (terminal()) return;
        state_ = terminal_state;

        // Cleanup, exactly once.
        lease_.reset();
        waiter_.reset();

        if (terminal_state == State::Complete) trace();

        auto done = std::move(done_);
        done_ = nullptr;
        if (!done) return;

        std::optional<std::string> body;
        if (!error) {
            body = std::move(body_);
        }
        boost::asio::post(
            agent_->get_executor(),
            [done = std::move(done), error = std::move(error),
             body = std::move(body), status = status_,
             headers = std::move(headers_)]() mutable {
                done(std::move(error), std::move(body), status,
                     std::move(headers));
            });
    }

    void PendingRequest::trace() const {
        if (options_.trace) {
            RequestTrace entry;
            entry.method = target_.method;
            entry.target = target_;
            entry.request_body = request_body_;
            entry.response_body = body_;
            entry.status = status_;
            options_.trace(entry);
            return;
        }
        HTTP_CONNECTOR_LOG_TRACE("{} {}://{}:{}{} -> {} ({} bytes)",
                                 to_string(target_.method),
                                 to_string(target_.protocol),
                                 target_.hostname, target_.port, target_.path,
                                 status_, body_.size());
    }

}  // namespace http_connector
