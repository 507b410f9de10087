#pragma once
#include "cloud/blob.hpp"
#include "network/config.hpp"
#include "network/http_client.hpp"
#include <memory>
#include <optional>
#include <string>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob {
namespace cloud {
//---------------------------------------------------------------------------
/// Owns the http client and creates the blobs that share it.
/// The blobs borrow the client and must not outlive the manager.
class BlobManager {
    /// The client
    std::unique_ptr<network::HttpClient> _client;

    public:
    /// The constructor with the socket client
    explicit BlobManager(const network::Config& config = network::Config());
    /// The constructor with a custom client
    explicit BlobManager(std::unique_ptr<network::HttpClient> client);

    /// Create the blob of an url
    [[nodiscard]] Blob fromUrl(std::string url, std::optional<Provider::Type> type = std::nullopt);
    /// Get the client
    [[nodiscard]] network::HttpClient& getClient() const noexcept { return *_client; }
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
