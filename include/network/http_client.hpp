#pragma once
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include <functional>
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
/// The transport that performs one http exchange per call.
/// Every exchange completes before the call returns, transport failures throw.
class HttpClient {
    public:
    /// The body consumer of streamed responses
    using ChunkCallback = std::function<void(std::string_view chunk)>;

    /// The destructor
    virtual ~HttpClient() noexcept = default;

    /// Performs the request and buffers the whole response body
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request, std::string_view body = {}) = 0;
    /// Performs the request and forwards the body of a successful response chunk by chunk.
    /// The body of a failed response is buffered in the result instead.
    [[nodiscard]] virtual HttpResponse stream(const HttpRequest& request, const ChunkCallback& onChunk) = 0;
};
//---------------------------------------------------------------------------
} // namespace urlblob::network
