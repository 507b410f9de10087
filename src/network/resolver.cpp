#include "network/resolver.hpp"
#include <cstring>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/types.h>
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
using namespace std;
//---------------------------------------------------------------------------
Resolver::Resolver(unsigned entries)
// Constructor
{
    if (!entries)
        entries = 1;
    _addr.reserve(entries);
    for (auto i = 0u; i < entries; i++) {
        _addr.emplace_back(nullptr, &freeaddrinfo);
    }
    _addrString.resize(entries, {"", 0});
    _addrCtr = 0;
}
//---------------------------------------------------------------------------
const addrinfo* Resolver::resolve(const string& hostname, uint32_t port, bool& oldAddress)
// Resolve the request
{
    auto hostString = hostname + ":" + to_string(port);
    for (auto i = 0u; i < _addrString.size(); i++) {
        auto& entry = _addrString[i];
        if (entry.second > 0 && entry.first == hostString && _addr[i]) {
            entry.second--;
            oldAddress = true;
            return _addr[i].get();
        }
    }

    struct addrinfo hints = {};
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto portString = to_string(port);
    addrinfo* temp;
    if (auto error = getaddrinfo(hostname.c_str(), portString.c_str(), &hints, &temp); error != 0) {
        throw runtime_error("hostname getaddrinfo error for " + hostname + ": " + gai_strerror(error));
    }
    auto addrPos = _addrCtr++ % static_cast<unsigned>(_addrString.size());
    _addr[addrPos].reset(temp);
    _addrString[addrPos] = {move(hostString), reuseCount};
    oldAddress = false;
    return temp;
}
//---------------------------------------------------------------------------
void Resolver::invalidate(const string& hostname, uint32_t port)
// Forget the cached addresses
{
    auto hostString = hostname + ":" + to_string(port);
    for (auto& entry : _addrString)
        if (entry.first == hostString)
            entry.second = 0;
}
//---------------------------------------------------------------------------
}; // namespace network
//---------------------------------------------------------------------------
}; // namespace urlblob
