#include "cloud/blob.hpp"
#include "cloud/boundary_resolver.hpp"
#include "cloud/error_classifier.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob {
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
using network::HttpRequest;
using network::HttpResponse;
//---------------------------------------------------------------------------
Blob::Blob(string url, network::HttpClient& client, optional<Provider::Type> type) : _url(move(url)), _client(client), _type(type ? *type : Provider::detect(_url))
// The constructor
{
}
//---------------------------------------------------------------------------
HttpRequest Blob::makeRequest(HttpRequest::Method method, Provider::Headers headers) const
// Build a request
{
    HttpRequest request;
    request.method = method;
    request.url = _url;
    request.headers = move(headers);
    return request;
}
//---------------------------------------------------------------------------
void Blob::validate(const HttpResponse& response) const
// Throws the classified error
{
    if (!response.success())
        ErrorClassifier::classify(_type, response)->raise();
}
//---------------------------------------------------------------------------
string Blob::fetch(const ByteRange& range)
// Fetch the bytes of a range
{
    auto response = _client.request(makeRequest(HttpRequest::Method::GET, RangeCodec::getHeaders(range)));
    validate(response);
    return move(response.body);
}
//---------------------------------------------------------------------------
BlobStats Blob::stat()
// Get the statistics
{
    // A single byte range makes every server report the total size in Content-Range
    auto response = _client.request(makeRequest(HttpRequest::Method::GET, RangeCodec::getHeaders(ByteRange{0, 0})));
    validate(response);
    return BlobStats(move(response.headers));
}
//---------------------------------------------------------------------------
string Blob::get(const RangeArgs& range)
// Download the range
{
    return fetch(RangeCodec::resolve(range));
}
//---------------------------------------------------------------------------
vector<string> Blob::getLines(const RangeArgs& range)
// Download the range and split it into lines
{
    auto text = utils::Utf8::decode(get(range));
    vector<string> lines;
    for (auto line : utils::splitLines(text))
        lines.emplace_back(line);
    return lines;
}
//---------------------------------------------------------------------------
string Blob::growToValidString(const RangeArgs& range)
// Download the range as text, extends the range
{
    auto byteRange = RangeCodec::resolve(range);
    auto fragment = fetch(byteRange);
    BoundaryResolver resolver(
        [this](uint64_t offset) { return fetch(ByteRange{offset, offset}); },
        [this]() { return stat().sizeOrNone(); });
    return resolver.grow(byteRange, fragment);
}
//---------------------------------------------------------------------------
string Blob::shrinkToValidString(const RangeArgs& range)
// Download the range as text, drops cut code points
{
    auto byteRange = RangeCodec::resolve(range);
    return BoundaryResolver::shrink(byteRange, fetch(byteRange));
}
//---------------------------------------------------------------------------
void Blob::stream(const ChunkCallback& onChunk, const RangeArgs& range)
// Download the range chunk by chunk
{
    auto request = makeRequest(HttpRequest::Method::GET, RangeCodec::getHeaders(RangeCodec::resolve(range)));
    auto response = _client.stream(request, onChunk);
    validate(response);
}
//---------------------------------------------------------------------------
void Blob::streamLines(const LineCallback& onLine, const RangeArgs& range)
// Download the range line by line
{
    utils::LineSplitter splitter([&onLine](string_view line) { onLine(utils::Utf8::decodeLossy(line)); });
    stream([&splitter](string_view chunk) { splitter.feed(chunk); }, range);
    splitter.finish();
}
//---------------------------------------------------------------------------
void Blob::put(string_view content, const optional<string>& contentType)
// Upload the content
{
    auto response = _client.request(makeRequest(HttpRequest::Method::PUT, Provider::putHeaders(_type, contentType)), content);
    validate(response);
}
//---------------------------------------------------------------------------
void Blob::putLines(const vector<string>& lines, const optional<string>& contentType)
// Upload the lines
{
    string content;
    for (auto& line : lines) {
        if (&line != &lines.front())
            content += '\n';
        content += line;
    }
    put(content, contentType);
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
