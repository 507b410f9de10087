#include "network/http_response.hpp"
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
optional<string_view> HttpResponse::getHeader(string_view name) const
// Get a header value
{
    auto it = headers.find(name);
    if (it == headers.end())
        return nullopt;
    return string_view(it->second);
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr char headerSeperator = ':';

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw runtime_error("Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw runtime_error("Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw runtime_error("Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            string_view httpType = getResponseType(response.type);
            line = line.substr(httpType.size());
            if (line.size() < 4 || line[0] != ' ')
                throw runtime_error("Invalid HttpResponse: Missing status code!");

            // the status code and the optional reason phrase
            auto status = utils::parseUnsigned(line.substr(1, 3));
            if (!status || *status < 100 || *status > 999)
                throw runtime_error("Invalid HttpResponse: Invalid status code!");
            response.status = static_cast<uint16_t>(*status);
            response.reason = string(utils::trim(line.substr(4)));
        } else {
            // headers
            auto keyPos = line.find(headerSeperator);
            if (keyPos == line.npos)
                throw runtime_error("Invalid HttpResponse: Headers need key and value!");
            auto key = utils::trim(line.substr(0, keyPos));
            auto value = utils::trim(line.substr(keyPos + 1));
            response.headers.emplace(key, value);
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace urlblob::network
