#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <netdb.h>
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
//---------------------------------------------------------------------------
/// The addr resolver and cacher, which is not thread safe
class Resolver {
    /// The number of lookups served by a cached entry
    static constexpr int reuseCount = 12;

    /// The addr info
    std::vector<std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>> _addr;
    /// The cached host and port with the remaining reuses
    std::vector<std::pair</*addrAndPort=*/std::string, /*cacheCtr=*/int>> _addrString;
    /// The ctr
    unsigned _addrCtr;

    public:
    /// The constructor
    explicit Resolver(unsigned entries = 8);

    /// The address resolving, throws std::runtime_error if the lookup fails
    const addrinfo* resolve(const std::string& hostname, uint32_t port, bool& oldAddress);
    /// Forget the cached addresses of a host
    void invalidate(const std::string& hostname, uint32_t port);
};
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace urlblob
