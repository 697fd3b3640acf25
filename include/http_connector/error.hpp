#pragma once
#include <stdexcept>
#include <string>

namespace http_connector {
    /**
     * @brief Represents an error that ended a request.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            ConnectionFailed,   /**< DNS resolution or TCP connect failed. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            SendFailed,         /**< Failed to write the request. */
            ReceiveFailed,      /**< Socket error while reading the response. */
            DecodingFailed,     /**< Malformed gzip/deflate payload. */
            Aborted,            /**< The request was cancelled by the caller. */
            PoolClosed,         /**< The connection pool has been drained. */
            InvalidRequest,     /**< The request could not be built. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief True for the network-level failures reported as TransportError.
    inline constexpr bool is_transport_error(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::PoolClosed:
                return true;
            default:
                return false;
        }
    }

    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::DecodingFailed:
                return "DecodingFailed";
            case Error::Code::Aborted:
                return "Aborted";
            case Error::Code::PoolClosed:
                return "PoolClosed";
            case Error::Code::InvalidRequest:
                return "InvalidRequest";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /**
     * @brief Thrown when a Host names a scheme other than http or https.
     *
     * Like InvalidTlsOptionsError, it only leaves the public API from
     * construction.
     */
    class UnsupportedProtocolError : public std::invalid_argument {
       public:
        explicit UnsupportedProtocolError(const std::string& protocol)
            : std::invalid_argument("Invalid protocol \"" + protocol +
                                    "\", expected one of http, https"),
              protocol_(protocol) {}

        const std::string& protocol() const noexcept { return protocol_; }

       private:
        std::string protocol_;
    };

    /// @brief Thrown at construction when OpenSSL rejects an https option
    /// (unreadable CA or key file, unknown cipher list).
    class InvalidTlsOptionsError : public std::invalid_argument {
       public:
        using std::invalid_argument::invalid_argument;
    };
}  // namespace http_connector
