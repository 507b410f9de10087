#include "network/url.hpp"
#include "utils/utils.hpp"
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
string Url::hostHeader() const
// The host header value
{
    auto host = this->host.find(':') != string::npos ? "[" + this->host + "]" : this->host;
    if ((tls && port == 443) || (!tls && port == 80))
        return host;
    return host + ":" + to_string(port);
}
//---------------------------------------------------------------------------
Url Url::parse(string_view url)
// Split an url into scheme, host, port and target
{
    static constexpr string_view http = "http://";
    static constexpr string_view https = "https://";

    Url result;
    if (url.size() >= https.size() && utils::iequals(url.substr(0, https.size()), https)) {
        result.tls = true;
        result.port = 443;
        url.remove_prefix(https.size());
    } else if (url.size() >= http.size() && utils::iequals(url.substr(0, http.size()), http)) {
        result.tls = false;
        result.port = 80;
        url.remove_prefix(http.size());
    } else {
        throw runtime_error("Invalid url: Only http and https are supported!");
    }

    // the authority ends with the path, the query or the fragment
    auto authorityEnd = url.find_first_of("/?#");
    auto authority = url.substr(0, authorityEnd);
    auto rest = authorityEnd == url.npos ? string_view() : url.substr(authorityEnd);

    // drop user info
    if (auto at = authority.rfind('@'); at != authority.npos)
        authority = authority.substr(at + 1);

    string_view portString;
    if (authority.starts_with('[')) {
        // ipv6 literal
        auto close = authority.find(']');
        if (close == authority.npos)
            throw runtime_error("Invalid url: Unterminated ipv6 address!");
        result.host = string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (after.starts_with(':'))
            portString = after.substr(1);
        else if (!after.empty())
            throw runtime_error("Invalid url: Unexpected characters after ipv6 address!");
    } else if (auto colon = authority.find(':'); colon != authority.npos) {
        result.host = string(authority.substr(0, colon));
        portString = authority.substr(colon + 1);
    } else {
        result.host = string(authority);
    }
    if (result.host.empty())
        throw runtime_error("Invalid url: Missing host!");

    if (!portString.empty()) {
        auto port = utils::parseUnsigned(portString);
        if (!port || *port == 0 || *port > 65535)
            throw runtime_error("Invalid url: Invalid port!");
        result.port = static_cast<uint32_t>(*port);
    }

    // the fragment is never sent
    rest = rest.substr(0, rest.find('#'));
    if (rest.empty())
        result.target = "/";
    else if (rest.starts_with('?'))
        result.target = "/" + string(rest);
    else
        result.target = string(rest);
    return result;
}
//---------------------------------------------------------------------------
} // namespace urlblob::network
