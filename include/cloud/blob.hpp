#pragma once
#include "cloud/blob_stats.hpp"
#include "cloud/provider.hpp"
#include "cloud/range_codec.hpp"
#include "network/http_client.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
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
/// Implements the operations on one object behind an url.
/// Every operation builds its headers, performs the exchange and throws the classified
/// BlobError of a failed response. The client is borrowed.
class Blob {
    public:
    /// The chunk consumer
    using ChunkCallback = network::HttpClient::ChunkCallback;
    /// The line consumer
    using LineCallback = std::function<void(std::string_view line)>;

    private:
    /// The url
    std::string _url;
    /// The client
    network::HttpClient& _client;
    /// The provider type
    Provider::Type _type;

    /// Build a request
    [[nodiscard]] network::HttpRequest makeRequest(network::HttpRequest::Method method, Provider::Headers headers) const;
    /// Throws the classified error of a failed response
    void validate(const network::HttpResponse& response) const;
    /// Fetch the bytes of a range
    [[nodiscard]] std::string fetch(const ByteRange& range);

    public:
    /// The constructor, detects the provider type if none is given
    Blob(std::string url, network::HttpClient& client, std::optional<Provider::Type> type = std::nullopt);

    /// Get the url
    [[nodiscard]] const std::string& getUrl() const noexcept { return _url; }
    /// Get the provider type
    [[nodiscard]] Provider::Type getType() const noexcept { return _type; }

    /// Get the statistics, transfers a single byte
    [[nodiscard]] BlobStats stat();
    /// Download the range
    [[nodiscard]] std::string get(const RangeArgs& range = RangeArgs());
    /// Download the range and split it into lines, throws std::range_error on invalid UTF-8
    [[nodiscard]] std::vector<std::string> getLines(const RangeArgs& range = RangeArgs());
    /// Download the range as text, extends the range to complete cut code points
    [[nodiscard]] std::string growToValidString(const RangeArgs& range = RangeArgs());
    /// Download the range as text, drops cut code points at the edges
    [[nodiscard]] std::string shrinkToValidString(const RangeArgs& range = RangeArgs());
    /// Download the range chunk by chunk
    void stream(const ChunkCallback& onChunk, const RangeArgs& range = RangeArgs());
    /// Download the range line by line
    void streamLines(const LineCallback& onLine, const RangeArgs& range = RangeArgs());

    /// Upload the content
    void put(std::string_view content, const std::optional<std::string>& contentType = std::nullopt);
    /// Upload the lines separated by newlines
    void putLines(const std::vector<std::string>& lines, const std::optional<std::string>& contentType = std::nullopt);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
