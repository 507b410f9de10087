#pragma once
#include "cloud/blob_error.hpp"
#include "cloud/provider.hpp"
#include <cstdint>
#include <memory>
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
//---------------------------------------------------------------------------
namespace network {
struct HttpResponse;
} // namespace network
//---------------------------------------------------------------------------
namespace cloud {
//---------------------------------------------------------------------------
namespace test {
class ErrorClassifierTester;
} // namespace test
//---------------------------------------------------------------------------
/// Maps failed http exchanges to the blob error taxonomy, never throws itself
class ErrorClassifier {
    public:
    /// The fields of an S3 or Azure error document
    struct XmlError {
        /// The error code
        std::optional<std::string> code;
        /// The message
        std::optional<std::string> message;
        /// The Azure authentication detail
        std::optional<std::string> authenticationDetail;
    };

    /// Classify a failed response
    [[nodiscard]] static std::unique_ptr<BlobError> classify(Provider::Type type, uint16_t statusCode, std::optional<std::string_view> reason, std::string_view body);
    /// Classify a failed response
    [[nodiscard]] static std::unique_ptr<BlobError> classify(Provider::Type type, const network::HttpResponse& response);

    /// Parse an error document, nullopt if the body is not well-formed xml
    [[nodiscard]] static std::optional<XmlError> parseXmlError(std::string_view body);

    private:
    /// The S3 rules
    [[nodiscard]] static std::unique_ptr<BlobError> classifyS3(BlobError::Details details, std::string_view body);
    /// The Azure rules
    [[nodiscard]] static std::unique_ptr<BlobError> classifyAzure(BlobError::Details details, std::string_view body);
    /// The status code rules for GCP and generic urls
    [[nodiscard]] static std::unique_ptr<BlobError> classifyGeneric(BlobError::Details details);

    /// The length of the element or attribute name at the start of the text
    [[nodiscard]] static uint64_t nameLength(std::string_view text) noexcept;
    /// Skip the declaration at the start of the text, e.g., a doctype with an internal subset
    [[nodiscard]] static std::optional<uint64_t> declarationLength(std::string_view text) noexcept;
    /// Decode the entity and character references, nullopt if a reference is invalid
    [[nodiscard]] static std::optional<std::string> unescape(std::string_view text);

    friend test::ErrorClassifierTester;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
