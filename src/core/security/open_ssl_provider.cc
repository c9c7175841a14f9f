#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/security/open_ssl_provider.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ssl = boost::asio::ssl;
namespace uuids = boost::uuids;

namespace streamfetch::core {

OpenSSLProvider& OpenSSLProvider::instance() {
    static OpenSSLProvider instance;
    return instance;
}

std::string OpenSSLProvider::createSessionId(std::string_view prefix) {
    uuids::random_generator gen;
    uuids::uuid id = gen();
    std::string uuid_str = uuids::to_string(id);
    return std::string(prefix) + "_" + uuid_str;
}

void OpenSSLProvider::InitOpenSSL() {
    if (!instance().initialized_) {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            != 1) {
            spdlog::error("OPENSSL_init_ssl failed");
            throw std::runtime_error("Failed to initialize OpenSSL");
        }
        instance().initialized_ = true;
    }
}

ssl::context OpenSSLProvider::BuildClientContext(bool verify_peer) {
    InitOpenSSL();

    ssl::context ctx(ssl::context::tls_client);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::no_tlsv1
                    | ssl::context::no_tlsv1_1);

    SSL_CTX_set_session_cache_mode(ctx.native_handle(), SSL_SESS_CACHE_CLIENT);
    SSL_CTX_sess_set_cache_size(ctx.native_handle(), 128);

    std::string session_id_context = createSessionId("sf").substr(0, SSL_MAX_SID_CTX_LENGTH);
    if (SSL_CTX_set_session_id_context(ctx.native_handle(),
                                       reinterpret_cast<const unsigned char*>(
                                           session_id_context.c_str()),
                                       session_id_context.length())
        != 1) {
        spdlog::warn("Failed to set TLS session id context");
    }

    if (verify_peer) {
        boost::system::error_code ec;
        ctx.set_default_verify_paths(ec);
        if (ec) {
            spdlog::warn("Failed to load system trust store: {}", ec.message());
        }
        ctx.set_verify_mode(ssl::verify_peer);
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    return ctx;
}

bool OpenSSLProvider::SetHostname(SSL* ssl, std::string_view hostname) {
    std::string host(hostname);
    if (!ssl || !SSL_set_tlsext_host_name(ssl, host.c_str())) {
        return false;
    }
    // Checked during the handshake when the context verifies the peer
    return SSL_set1_host(ssl, host.c_str()) == 1;
}

} // namespace streamfetch::core
