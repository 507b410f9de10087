#pragma once
#include "utils/utils.hpp"
#include <cstdint>
#include <map>
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
/// Implements an helper to describe and serialize http requests
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        HEAD,
        PUT
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The header map, names compare case insensitive
    using Headers = std::map<std::string, std::string, utils::CaseInsensitiveLess>;

    /// The headers - need to be without trailing and leading whitespaces
    Headers headers;
    /// The absolute url including the query
    std::string url;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::HEAD: return "HEAD";
            case Method::PUT: return "PUT";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }
    /// Serialize the request line for the target and the headers, ends with the empty line
    [[nodiscard]] static std::string serialize(const HttpRequest& request, std::string_view target);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace urlblob
