#pragma once

#include <boost/asio/ssl/context.hpp>

#include "error.hpp"
#include "host.hpp"

namespace http_connector {

    /**
     * @brief Apply TlsOptions to a client context: system CA paths plus any
     * supplied CA, client certificate/key, cipher list and verify mode.
     * @throws InvalidTlsOptionsError when OpenSSL rejects a file or
     * setting.
     */
    void configure_tls_context(boost::asio::ssl::context& ctx,
                               const TlsOptions& tls);

}  // namespace http_connector
