#include "network/http_request.hpp"
#include <string>
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
string HttpRequest::serialize(const HttpRequest& request, string_view target)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " ";
    httpHeader += target;
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    return httpHeader;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace urlblob
