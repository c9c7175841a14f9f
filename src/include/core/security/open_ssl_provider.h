/**
 * @file open_ssl_provider.h
 * @brief OpenSSL library initialization and TLS client context construction
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <string>
#include <string_view>

namespace streamfetch::core {

class OpenSSLProvider {
private:
    OpenSSLProvider() = default;
    OpenSSLProvider(const OpenSSLProvider&) = delete;
    OpenSSLProvider& operator=(const OpenSSLProvider&) = delete;

    static OpenSSLProvider& instance();
    static std::string createSessionId(std::string_view prefix);

    bool initialized_ = false;

public:
    /**
     * @brief Initialize OpenSSL library
     * 
     * Safe to call multiple times, only the first call does any work.
     * Throws std::runtime_error when the library cannot be initialized.
     */
    static void InitOpenSSL();

    /**
     * @brief Build a client SSL context that trusts the system certificate store
     * 
     * @param verify_peer Whether the server certificate chain must verify
     * @return boost::asio::ssl::context SSL context configured for client use
     */
    static boost::asio::ssl::context BuildClientContext(bool verify_peer = true);

    /**
     * @brief Set the SNI hostname and the name the server certificate is checked against
     * 
     * @param ssl SSL connection object
     * @param hostname Hostname to set
     * @return bool True if hostname was set successfully, false otherwise
     */
    static bool SetHostname(SSL* ssl, std::string_view hostname);
};

} // namespace streamfetch::core
