#include "network/tls_context.hpp"
#include <functional>
#include <mutex>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TLSContext::TLSContext(bool verifyPeer) : _sessionCache()
// Construct the TLS Context
{
    initOpenSSL();

    // Set to TLS
    auto method = TLS_client_method();

    // Set up the context
    _ctx = SSL_CTX_new(method);
    if (!_ctx)
        throw runtime_error("Could not create the tls context: " + lastError());
    SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION);

    if (verifyPeer) {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            auto error = lastError();
            SSL_CTX_free(_ctx);
            throw runtime_error("Could not load the trusted certificates: " + error);
        }
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Servers that close without close_notify end the body like a plain close
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    // Enable session cache
    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_CLIENT);
}
//---------------------------------------------------------------------------
TLSContext::~TLSContext()
// The desturctor
{
    // Remove all sessions
    for (auto& entry : _sessionCache) {
        if (entry.second) {
            SSL_SESSION_free(entry.second);
            entry.second = nullptr;
        }
    }

    // Destroy context
    if (_ctx)
        SSL_CTX_free(_ctx);
}
//---------------------------------------------------------------------------
void TLSContext::initOpenSSL()
// Inits the openssl algos
{
    static once_flag initialized;
    call_once(initialized, [] {
        // Load algos
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}
//---------------------------------------------------------------------------
string TLSContext::lastError()
// The last OpenSSL error
{
    auto error = ERR_get_error();
    if (!error)
        return "unknown error";
    char buffer[256];
    ERR_error_string_n(error, buffer, sizeof(buffer));
    ERR_clear_error();
    return buffer;
}
//---------------------------------------------------------------------------
uint64_t TLSContext::slot(string_view peer) noexcept
// The cache slot
{
    return hash<string_view>{}(peer) & cacheMask;
}
//---------------------------------------------------------------------------
bool TLSContext::cacheSession(string_view peer, SSL* ssl)
// Caches the SSL session
{
    // Is the session already cached?
    if (SSL_session_reused(ssl))
        return false;

    auto session = SSL_get1_session(ssl);
    if (!session)
        return false;
    auto& entry = _sessionCache[slot(peer)];
    if (entry.second)
        SSL_SESSION_free(entry.second);
    entry = {string(peer), session};
    return true;
}
//---------------------------------------------------------------------------
bool TLSContext::dropSession(string_view peer)
// Drop the SSL session from cache
{
    auto& entry = _sessionCache[slot(peer)];
    if (entry.second && entry.first == peer) {
        SSL_SESSION_free(entry.second);
        entry = {string(), nullptr};
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
bool TLSContext::reuseSession(string_view peer, SSL* ssl)
// Reuses the SSL session
{
    auto& entry = _sessionCache[slot(peer)];
    if (entry.second && entry.first == peer) {
        SSL_set_session(ssl, entry.second);
        return true;
    }
    return false;
}
//---------------------------------------------------------------------------
} // namespace urlblob::network
