#include "http_connector/tls.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/buffer.hpp>
#include <boost/system/system_error.hpp>
#include <string>

#include "http_connector/logging.hpp"

namespace http_connector {

    void configure_tls_context(boost::asio::ssl::context& ctx,
                               const TlsOptions& tls) {
        namespace ssl = boost::asio::ssl;

        try {
            ctx.set_default_verify_paths();

            if (tls.ca_file) ctx.load_verify_file(*tls.ca_file);
            if (tls.ca) {
                ctx.add_certificate_authority(
                    boost::asio::buffer(tls.ca->data(), tls.ca->size()));
            }

            if (tls.passphrase) {
                std::string pass = *tls.passphrase;
                ctx.set_password_callback(
                    [pass](std::size_t, ssl::context::password_purpose) {
                        return pass;
                    });
            }
            if (tls.cert_file) ctx.use_certificate_chain_file(*tls.cert_file);
            if (tls.key_file)
                ctx.use_private_key_file(*tls.key_file, ssl::context::pem);
        } catch (const boost::system::system_error& e) {
            throw InvalidTlsOptionsError(std::string("Invalid TLS options: ") +
                                         e.what());
        }

        if (tls.ciphers &&
            SSL_CTX_set_cipher_list(ctx.native_handle(),
                                    tls.ciphers->c_str()) != 1) {
            ::ERR_clear_error();
            throw InvalidTlsOptionsError("Invalid cipher list \"" +
                                         *tls.ciphers + "\"");
        }

        ctx.set_verify_mode(tls.reject_unauthorized ? ssl::verify_peer
                                                    : ssl::verify_none);
        if (!tls.reject_unauthorized) {
            HTTP_CONNECTOR_LOG_WARN(
                "TLS certificate verification is disabled");
        }
    }

}  // namespace http_connector
