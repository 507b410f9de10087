#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <openssl/ssl.h>
#include <openssl/types.h>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::network {
//---------------------------------------------------------------------------
// The context is owned by one client, sessions are cached per host and port.
// This avoids locking and keeps resumption tied to the server name.
class TLSContext {
    /// The ssl context
    SSL_CTX* _ctx;
    /// The cache size as power of 2
    static constexpr uint8_t cachePower = 6;
    /// The cache mask
    static constexpr uint64_t cacheMask = (~0ull) >> (64 - cachePower);
    /// The session cache
    std::array<std::pair<std::string, SSL_SESSION*>, 1ull << cachePower> _sessionCache;

    /// Get the cache slot of a peer
    static uint64_t slot(std::string_view peer) noexcept;

    public:
    /// The constructor, throws std::runtime_error if no context can be created
    explicit TLSContext(bool verifyPeer);
    /// The destructor
    ~TLSContext();
    /// No copies of the owned context
    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /// Get the raw context
    [[nodiscard]] SSL_CTX* get() const noexcept { return _ctx; }

    /// Caches the SSL session
    bool cacheSession(std::string_view peer, SSL* ssl);
    /// Drops the SSL session
    bool dropSession(std::string_view peer);
    /// Reuses a SSL session
    bool reuseSession(std::string_view peer, SSL* ssl);

    /// Init the OpenSSL algos and errors
    static void initOpenSSL();
    /// The description of the last OpenSSL error
    [[nodiscard]] static std::string lastError();
};
//---------------------------------------------------------------------------
} // namespace urlblob::network
