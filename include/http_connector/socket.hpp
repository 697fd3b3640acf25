#pragma once

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace http_connector {

    /**
     * @brief One transport-level connection to a host, plain TCP or TLS.
     *
     * Created unconnected by an Agent; connect() is lazy and reused while
     * the stream stays open. destroy() closes the lowest layer immediately,
     * so any pending read or write completes with operation_aborted. The
     * stream objects themselves live until the Socket is destroyed, which
     * keeps in-flight composed operations valid.
     */
    class Socket {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        using response_parser =
            boost::beast::http::response_parser<boost::beast::http::buffer_body>;

        /**
         * @brief Constructs a Socket.
         * @param executor The executor all I/O runs on.
         * @param ssl_ctx TLS context, or nullptr for plain http.
         * @param host Host name to resolve (and SNI name for TLS).
         * @param port Port to dial.
         * @param servername SNI name when it differs from host.
         * @param verify_host Check the certificate names the host (TLS only).
         */
        Socket(boost::asio::any_io_executor executor,
               boost::asio::ssl::context* ssl_ctx, std::string host,
               std::uint16_t port, std::optional<std::string> servername = {},
               bool verify_host = true);

        Socket(const Socket&) = delete;
        Socket& operator=(const Socket&) = delete;

        ~Socket() noexcept;

        std::uint64_t id() const noexcept { return m_id; }
        bool https() const noexcept { return m_ssl_ctx != nullptr; }

        /// @brief Resolve, connect and handshake unless already open.
        boost::asio::awaitable<boost::system::error_code> connect();

        /// @brief Disable Nagle's algorithm.
        boost::system::error_code set_no_delay(bool enable) noexcept;

        /// @brief SO_KEEPALIVE plus the TCP idle time before the first
        /// keep-alive packet (rounded up to whole seconds).
        boost::system::error_code set_keep_alive(
            bool enable, std::chrono::milliseconds initial_delay) noexcept;

        boost::asio::awaitable<boost::system::error_code> write(
            boost::beast::http::request<boost::beast::http::string_body>&
                req);

        boost::asio::awaitable<boost::system::error_code> read_header(
            response_parser& parser);

        /// @brief Read the next body piece into parser.get().body(). A full
        /// caller buffer (need_buffer) is not reported as an error.
        boost::asio::awaitable<boost::system::error_code> read_some(
            response_parser& parser);

        /**
         * @brief Watch an idle connection for the peer closing it.
         *
         * The handler runs once the socket turns readable (EOF, reset or
         * unsolicited bytes) or fails; cancel_idle_wait() completes it with
         * operation_aborted. Never connected sockets report not_connected.
         */
        void async_wait_idle(
            std::function<void(boost::system::error_code)> handler);

        /// @brief Stop a pending async_wait_idle().
        void cancel_idle_wait() noexcept;

        /// @brief Forcibly close the connection. Idempotent, never throws.
        void destroy() noexcept;

        bool destroyed() const noexcept { return m_destroyed; }

        /// @brief True while the underlying TCP socket is open.
        bool is_open() const noexcept;

        /// @brief Number of requests written on this socket.
        std::size_t requests_served() const noexcept { return m_requests; }

        const std::string& host() const noexcept { return m_host; }
        std::uint16_t port() const noexcept { return m_port; }

       private:
        boost::asio::awaitable<boost::system::error_code> connect_http();
        boost::asio::awaitable<boost::system::error_code> connect_https();

        tcp::socket* lowest_socket() noexcept;
        const tcp::socket* lowest_socket() const noexcept;

        boost::asio::any_io_executor m_ex;
        boost::asio::ssl::context* m_ssl_ctx;

        std::string m_host;
        std::uint16_t m_port;
        std::optional<std::string> m_servername;
        bool m_verify_host;

        std::uint64_t m_id;
        bool m_destroyed{false};
        std::size_t m_requests{0};

        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
    };

}  // namespace http_connector
