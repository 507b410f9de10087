#pragma once
#include "network/config.hpp"
#include "network/http_client.hpp"
#include "network/resolver.hpp"
#include <memory>
#include <string_view>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::network {
//---------------------------------------------------------------------------
class TLSContext;
struct Url;
//---------------------------------------------------------------------------
/// The blocking http client on plain sockets.
/// Every exchange uses its own connection that is closed after the response,
/// the client itself is not thread safe.
class SocketClient : public HttpClient {
    /// A connected socket with an optional tls session
    class Connection;

    /// The config
    Config _config;
    /// The resolver
    Resolver _resolver;
    /// The tls context, created with the first https request
    std::unique_ptr<TLSContext> _context;

    /// Get the tls context
    TLSContext& context();
    /// Open a connection, retries failed connects
    int connect(const Url& url);
    /// Connect to one address, returns -1 and sets errno on failure
    int connectAddress(const addrinfo& addr);
    /// Performs the exchange, forwards a successful body if a callback is given
    HttpResponse perform(const HttpRequest& request, std::string_view body, const ChunkCallback* onChunk);

    public:
    /// The constructor
    explicit SocketClient(Config config = Config());
    /// The destructor
    ~SocketClient() noexcept override;

    /// Get the config
    [[nodiscard]] const Config& getConfig() const noexcept { return _config; }

    /// Performs the request and buffers the whole response body
    [[nodiscard]] HttpResponse request(const HttpRequest& request, std::string_view body = {}) override;
    /// Performs the request and forwards the body of a successful response
    [[nodiscard]] HttpResponse stream(const HttpRequest& request, const ChunkCallback& onChunk) override;
};
//---------------------------------------------------------------------------
} // namespace urlblob::network
