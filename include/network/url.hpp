#pragma once
#include <cstdint>
#include <string>
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
/// The parts of an http url needed to reach the server
struct Url {
    /// Uses tls?
    bool tls = false;
    /// The hostname
    std::string host;
    /// The port
    uint32_t port = 80;
    /// The request target, path and query
    std::string target = "/";

    /// The host header value, includes non-default ports
    [[nodiscard]] std::string hostHeader() const;

    /// Parse an http or https url, throws std::runtime_error otherwise
    [[nodiscard]] static Url parse(std::string_view url);
};
//---------------------------------------------------------------------------
} // namespace urlblob::network
