#pragma once
#include "cloud/provider.hpp"
#include <cstdint>
#include <map>
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
/// The object statistics derived from response headers.
/// The plain accessors throw HeaderError if the header is absent.
class BlobStats {
    /// The response headers
    Provider::Headers _headers;

    public:
    /// The constructor
    explicit BlobStats(Provider::Headers headers) : _headers(std::move(headers)) {}

    /// Get the object size
    [[nodiscard]] uint64_t size() const;
    /// Get the object size if known
    [[nodiscard]] std::optional<uint64_t> sizeOrNone() const;
    /// Get the content type
    [[nodiscard]] std::string contentType() const;
    /// Get the content type if known
    [[nodiscard]] std::optional<std::string> contentTypeOrNone() const;
    /// Get the last modification date
    [[nodiscard]] std::string lastModified() const;
    /// Get the last modification date if known
    [[nodiscard]] std::optional<std::string> lastModifiedOrNone() const;

    /// The known statistics by name (size, content_type, last_modified)
    [[nodiscard]] std::map<std::string, std::string> toMap() const;
    /// Get the headers
    [[nodiscard]] const Provider::Headers& getHeaders() const noexcept { return _headers; }
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
