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
namespace network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Important status codes
    enum class Code : uint16_t {
        OK_200 = 200,
        CREATED_201 = 201,
        NO_CONTENT_204 = 204,
        PARTIAL_CONTENT_206 = 206,
        NOT_MODIFIED_304 = 304,
        BAD_REQUEST_400 = 400,
        UNAUTHORIZED_401 = 401,
        FORBIDDEN_403 = 403,
        NOT_FOUND_404 = 404,
        CONFLICT_409 = 409,
        LENGTH_REQUIRED_411 = 411,
        RANGE_NOT_SATISFIABLE_416 = 416,
        TOO_MANY_REQUESTS_429 = 429,
        INTERNAL_SERVER_ERROR_500 = 500,
        SERVICE_UNAVAILABLE_503 = 503
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The header map, names compare case insensitive
    using Headers = std::map<std::string, std::string, utils::CaseInsensitiveLess>;

    /// The headers - need to be without trailing and leading whitespaces
    Headers headers;
    /// The body, empty when streamed
    std::string body;
    /// The reason phrase
    std::string reason;
    /// The status code
    uint16_t status = 0;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful operation 2xx operations
    static constexpr bool checkSuccess(uint16_t status) noexcept {
        return status >= 200 && status < 300;
    }
    /// Check if the result has no content
    static constexpr bool withoutContent(uint16_t status) noexcept {
        return static_cast<Code>(status) == Code::NO_CONTENT_204 || static_cast<Code>(status) == Code::NOT_MODIFIED_304 || status < 200;
    }

    /// Was the exchange successful?
    [[nodiscard]] bool success() const noexcept { return checkSuccess(status); }
    /// Get a header value
    [[nodiscard]] std::optional<std::string_view> getHeader(std::string_view name) const;

    /// Deserialize the status line and headers (up to the empty line)
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace urlblob
