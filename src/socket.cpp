#include "http_connector/socket.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>

#include <atomic>
#include <cerrno>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace http_connector {

    namespace http = boost::beast::http;
    using boost::asio::redirect_error;
    using boost::asio::use_awaitable;

    namespace {
        std::uint64_t next_socket_id() {
            static std::atomic<std::uint64_t> counter{0};
            return ++counter;
        }
    }  // namespace

    Socket::Socket(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context* ssl_ctx, std::string host,
                   std::uint16_t port, std::optional<std::string> servername,
                   bool verify_host)
        : m_ex(std::move(executor)),
          m_ssl_ctx(ssl_ctx),
          m_host(std::move(host)),
          m_port(port),
          m_servername(std::move(servername)),
          m_verify_host(verify_host),
          m_id(next_socket_id()) {}

    Socket::~Socket() noexcept { destroy(); }

    Socket::tcp::socket* Socket::lowest_socket() noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return &s->socket();
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &boost::beast::get_lowest_layer(*s).socket();
        return nullptr;
    }

    const Socket::tcp::socket* Socket::lowest_socket() const noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return &s->socket();
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &boost::beast::get_lowest_layer(*s).socket();
        return nullptr;
    }

    bool Socket::is_open() const noexcept {
        const auto* s = lowest_socket();
        return s != nullptr && s->is_open();
    }

    void Socket::destroy() noexcept {
        if (m_destroyed) return;
        m_destroyed = true;

        if (auto* s = lowest_socket(); s && s->is_open()) {
            boost::system::error_code ec;
            // No TLS close_notify, just drop the TCP connection.
            s->shutdown(tcp::socket::shutdown_both, ec);
            s->close(ec);
        }
    }

    void Socket::async_wait_idle(
        std::function<void(boost::system::error_code)> handler) {
        auto* s = lowest_socket();
        if (!s || !s->is_open()) {
            boost::asio::post(m_ex, [handler = std::move(handler)] {
                handler(boost::asio::error::not_connected);
            });
            return;
        }
        s->async_wait(tcp::socket::wait_read, std::move(handler));
    }

    void Socket::cancel_idle_wait() noexcept {
        if (auto* s = lowest_socket(); s && s->is_open()) {
            boost::system::error_code ec;
            s->cancel(ec);
        }
    }

    boost::asio::awaitable<boost::system::error_code> Socket::connect() {
        if (m_destroyed) {
            co_return boost::asio::error::make_error_code(
                boost::asio::error::bad_descriptor);
        }
        if (is_open()) co_return boost::system::error_code{};

        if (m_ssl_ctx) co_return co_await connect_https();
        co_return co_await connect_http();
    }

    boost::asio::awaitable<boost::system::error_code> Socket::connect_http() {
        boost::system::error_code ec;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            m_host, std::to_string(m_port), redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        if (m_destroyed) co_return boost::asio::error::operation_aborted;

        m_stream.emplace<HttpStream>(m_ex);
        auto& s = std::get<HttpStream>(m_stream);

        co_await s.async_connect(results, redirect_error(use_awaitable, ec));
        if (!ec && m_destroyed) ec = boost::asio::error::operation_aborted;
        co_return ec;
    }

    boost::asio::awaitable<boost::system::error_code> Socket::connect_https() {
        boost::system::error_code ec;

        tcp::resolver resolver(m_ex);
        auto results = co_await resolver.async_resolve(
            m_host, std::to_string(m_port), redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        if (m_destroyed) co_return boost::asio::error::operation_aborted;

        m_stream.emplace<HttpsStream>(m_ex, *m_ssl_ctx);
        auto& s = std::get<HttpsStream>(m_stream);

        co_await boost::beast::get_lowest_layer(s).async_connect(
            results, redirect_error(use_awaitable, ec));
        if (ec) co_return ec;
        if (m_destroyed) co_return boost::asio::error::operation_aborted;

        const std::string& sni = m_servername ? *m_servername : m_host;
        if (!SSL_set_tlsext_host_name(s.native_handle(), sni.c_str())) {
            co_return boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
        }
        if (m_verify_host) {
            s.set_verify_callback(
                boost::asio::ssl::host_name_verification(sni), ec);
            if (ec) co_return ec;
        }

        co_await s.async_handshake(boost::asio::ssl::stream_base::client,
                                   redirect_error(use_awaitable, ec));
        co_return ec;
    }

    boost::system::error_code Socket::set_no_delay(bool enable) noexcept {
        boost::system::error_code ec;
        if (auto* s = lowest_socket()) {
            s->set_option(tcp::no_delay(enable), ec);
        } else {
            ec = boost::asio::error::not_connected;
        }
        return ec;
    }

    boost::system::error_code Socket::set_keep_alive(
        bool enable, std::chrono::milliseconds initial_delay) noexcept {
        boost::system::error_code ec;
        auto* s = lowest_socket();
        if (!s) return boost::asio::error::not_connected;

        s->set_option(boost::asio::socket_base::keep_alive(enable), ec);
        if (ec || !enable) return ec;

#ifdef TCP_KEEPIDLE
        // Kernel granularity is seconds; never go below one.
        int idle = static_cast<int>((initial_delay.count() + 999) / 1000);
        if (idle < 1) idle = 1;
        if (::setsockopt(s->native_handle(), IPPROTO_TCP, TCP_KEEPIDLE, &idle,
                         sizeof(idle)) != 0) {
            ec.assign(errno, boost::system::system_category());
        }
#else
        (void)initial_delay;
#endif
        return ec;
    }

    boost::asio::awaitable<boost::system::error_code> Socket::write(
        http::request<http::string_body>& req) {
        boost::system::error_code ec;
        ++m_requests;

        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            co_await http::async_write(*s, req,
                                       redirect_error(use_awaitable, ec));
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            co_await http::async_write(*s, req,
                                       redirect_error(use_awaitable, ec));
        } else {
            ec = boost::asio::error::not_connected;
        }
        co_return ec;
    }

    boost::asio::awaitable<boost::system::error_code> Socket::read_header(
        response_parser& parser) {
        boost::system::error_code ec;

        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            co_await http::async_read_header(*s, m_buffer, parser,
                                             redirect_error(use_awaitable, ec));
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            co_await http::async_read_header(*s, m_buffer, parser,
                                             redirect_error(use_awaitable, ec));
        } else {
            ec = boost::asio::error::not_connected;
        }
        co_return ec;
    }

    boost::asio::awaitable<boost::system::error_code> Socket::read_some(
        response_parser& parser) {
        boost::system::error_code ec;

        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            co_await http::async_read(*s, m_buffer, parser,
                                      redirect_error(use_awaitable, ec));
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            co_await http::async_read(*s, m_buffer, parser,
                                      redirect_error(use_awaitable, ec));
        } else {
            ec = boost::asio::error::not_connected;
        }

        if (ec == http::error::need_buffer) ec = {};
        co_return ec;
    }

}  // namespace http_connector
