#pragma once
#include "utils/utils.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
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
/// Implements the storage provider conventions that govern headers and error formats of an url
class Provider {
    public:
    /// The provider type
    enum class Type : uint8_t {
        S3 = 0,
        GCP = 1,
        Azure = 2,
        Generic = 3
    };

    /// The header map
    using Headers = std::map<std::string, std::string, utils::CaseInsensitiveLess>;

    /// Get the type name
    static constexpr auto getTypeName(Type type) noexcept {
        switch (type) {
            case Type::S3: return "s3";
            case Type::GCP: return "gcp";
            case Type::Azure: return "azure";
            case Type::Generic: return "generic";
            default: return "unknown";
        }
    }

    /// Is the url served by an S3 compatible storage?
    [[nodiscard]] static bool isS3Compatible(std::string_view url);
    /// Is the url served by a GCP compatible storage?
    [[nodiscard]] static bool isGCPCompatible(std::string_view url);
    /// Is the url served by an Azure compatible storage?
    [[nodiscard]] static bool isAzureCompatible(std::string_view url);
    /// Detect the provider of an url, the first matching provider wins
    [[nodiscard]] static Type detect(std::string_view url);
    /// Parse a provider name or alias, throws std::invalid_argument for unknown names
    [[nodiscard]] static Type parseType(std::string_view name);

    /// Builds the headers for uploading an object
    [[nodiscard]] static Headers putHeaders(Type type, const std::optional<std::string>& contentType = std::nullopt);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
