#include "tlsmint/core/tls/TlsContext.h"
#include "tlsmint/core/tls/Errors.h"
#include "tlsmint/core/util/Logger.h"
#include <fmt/format.h>

namespace tlsmint::core::tls {
ServerCredential TlsContext::context_for(const std::string& host) {
    auto issued = ca_.issue_for(host);
    auto fail = [&](const char* step) {
        std::string what = fmt::format("{} failed for {} ({})", step, host, openssl_errors());
        util::log_error(what);
        throw IssuanceError(what);
    };

    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_server_method()), SSL_CTX_free);
    if (!ctx) fail("SSL_CTX_new");
    // intercepted legacy peers may still need insecure renegotiation
    SSL_CTX_set_options(ctx.get(), SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_ALLOW_UNSAFE_LEGACY_RENEGOTIATION | SSL_OP_LEGACY_SERVER_CONNECT);

    if (SSL_CTX_use_certificate(ctx.get(), issued.leaf->cert.get()) != 1) fail("SSL_CTX_use_certificate");
    if (SSL_CTX_use_PrivateKey(ctx.get(), issued.keys->serverKey.get()) != 1) fail("SSL_CTX_use_PrivateKey");
    if (SSL_CTX_check_private_key(ctx.get()) != 1) fail("server key check");
    return ServerCredential{ std::move(ctx), std::move(issued.leaf) };
}
}
