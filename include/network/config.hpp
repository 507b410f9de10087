#pragma once
#include <cstdint>
#include <string>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::network {
//---------------------------------------------------------------------------
/// Config for the socket transport
struct Config {
    /// Default connect timeout in ms
    static constexpr unsigned defaultConnectTimeout = 10 * 1000;
    /// Default timeout of a single send or recv in ms
    static constexpr unsigned defaultIOTimeout = 30 * 1000;
    /// Default additional connect attempts
    static constexpr unsigned defaultConnectRetries = 2;
    /// Default size of a recv call, also the chunk size of streamed bodies
    static constexpr uint64_t defaultChunkSize = 64 * 1024;
    /// Default user agent
    static constexpr const char* defaultUserAgent = "urlblob";

    /// The connect timeout in ms
    unsigned connectTimeout = defaultConnectTimeout;
    /// The send and recv timeout in ms
    unsigned ioTimeout = defaultIOTimeout;
    /// Additional connect attempts after a failed connect
    unsigned connectRetries = defaultConnectRetries;
    /// The recv chunk size
    uint64_t chunkSize = defaultChunkSize;
    /// Verify the certificate chain and hostname of tls peers
    bool verifyPeer = true;
    /// The user agent header
    std::string userAgent = defaultUserAgent;
};
//---------------------------------------------------------------------------
} // namespace urlblob::network
