#include "network/http_helper.hpp"
#include "utils/utils.hpp"
#include <limits>
#include <stdexcept>
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
using namespace std;
//---------------------------------------------------------------------------
optional<uint64_t> HttpHelper::findHeaderEnd(string_view data) noexcept
// Find the end of the header
{
    static constexpr string_view headerEnd = "\r\n\r\n";
    auto end = data.find(headerEnd);
    if (end == data.npos)
        return nullopt;
    return end + headerEnd.size();
}
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, bool headRequest)
// Detect the protocol
{
    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";

    auto headerLength = findHeaderEnd(header);
    if (!headerLength)
        throw runtime_error("Invalid HttpResponse: Incomplete header!");

    Info info;
    info.response = HttpResponse::deserialize(header.substr(0, *headerLength));
    info.headerLength = *headerLength;

    if (headRequest || HttpResponse::withoutContent(info.response.status)) {
        info.encoding = Encoding::None;
        return info;
    }

    // Transfer-Encoding takes precedence over Content-Length
    if (auto encoding = info.response.getHeader(transferEncoding)) {
        auto value = utils::trim(*encoding);
        if (value.size() >= chunkedEncoding.size() && utils::iequals(value.substr(value.size() - chunkedEncoding.size()), chunkedEncoding)) {
            info.encoding = Encoding::ChunkedEncoding;
            return info;
        }
        info.encoding = Encoding::UntilClose;
        return info;
    }
    if (auto length = info.response.getHeader(contentLength)) {
        auto parsed = utils::parseUnsigned(*length);
        if (!parsed)
            throw runtime_error("Invalid HttpResponse: Invalid Content-Length!");
        info.encoding = Encoding::ContentLength;
        info.length = *parsed;
        return info;
    }
    info.encoding = Encoding::UntilClose;
    return info;
}
//---------------------------------------------------------------------------
bool HttpHelper::ChunkedDecoder::feed(string_view data, const function<void(string_view)>& onData)
// Decode the next part of the body
{
    uint64_t pos = 0;
    while (pos < data.size() && _state != State::Done) {
        switch (_state) {
            case State::Size: {
                auto c = data[pos++];
                if (c == ';') {
                    _state = State::Extension;
                } else if (c == '\r' || c == ' ' || c == '\t') {
                    // wait for the line feed
                } else if (c == '\n') {
                    if (!_sizeDigits)
                        throw runtime_error("Invalid chunked encoding: Missing chunk size!");
                    _state = _remaining ? State::Data : State::Trailer;
                    _sizeDigits = false;
                } else {
                    unsigned digit;
                    if (c >= '0' && c <= '9')
                        digit = static_cast<unsigned>(c - '0');
                    else if (c >= 'a' && c <= 'f')
                        digit = static_cast<unsigned>(c - 'a' + 10);
                    else if (c >= 'A' && c <= 'F')
                        digit = static_cast<unsigned>(c - 'A' + 10);
                    else
                        throw runtime_error("Invalid chunked encoding: Invalid chunk size!");
                    if (_remaining > (numeric_limits<uint64_t>::max() >> 4))
                        throw runtime_error("Invalid chunked encoding: Chunk size overflow!");
                    _remaining = (_remaining << 4) | digit;
                    _sizeDigits = true;
                }
                break;
            }
            case State::Extension: {
                if (data[pos++] == '\n') {
                    if (!_sizeDigits)
                        throw runtime_error("Invalid chunked encoding: Missing chunk size!");
                    _state = _remaining ? State::Data : State::Trailer;
                    _sizeDigits = false;
                }
                break;
            }
            case State::Data: {
                auto available = data.size() - pos;
                auto length = available < _remaining ? available : _remaining;
                onData(data.substr(pos, length));
                pos += length;
                _remaining -= length;
                if (!_remaining)
                    _state = State::DataEnd;
                break;
            }
            case State::DataEnd: {
                auto c = data[pos++];
                if (c == '\n')
                    _state = State::Size;
                else if (c != '\r')
                    throw runtime_error("Invalid chunked encoding: Missing chunk terminator!");
                break;
            }
            case State::Trailer: {
                auto c = data[pos++];
                if (c == '\n') {
                    if (!_lineLength)
                        _state = State::Done;
                    _lineLength = 0;
                } else if (c != '\r') {
                    _lineLength++;
                }
                break;
            }
            default: break;
        }
    }
    return _state == State::Done;
}
//---------------------------------------------------------------------------
} // namespace network
} // namespace urlblob
