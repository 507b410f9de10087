#include "cloud/blob_stats.hpp"
#include "cloud/blob_error.hpp"
#include "cloud/range_codec.hpp"
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
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
optional<string> findHeader(const Provider::Headers& headers, const char* name)
// Get a header value
{
    auto it = headers.find(name);
    if (it == headers.end())
        return nullopt;
    return it->second;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
uint64_t BlobStats::size() const
// Get the object size
{
    auto size = sizeOrNone();
    if (!size)
        throw HeaderError("Content-Length header is not present or invalid");
    return *size;
}
//---------------------------------------------------------------------------
optional<uint64_t> BlobStats::sizeOrNone() const
// Get the object size if known
{
    return RangeCodec::decodeSize(_headers);
}
//---------------------------------------------------------------------------
string BlobStats::contentType() const
// Get the content type
{
    auto contentType = contentTypeOrNone();
    if (!contentType)
        throw HeaderError("Content-Type header is not present");
    return *contentType;
}
//---------------------------------------------------------------------------
optional<string> BlobStats::contentTypeOrNone() const
// Get the content type if known
{
    return findHeader(_headers, "Content-Type");
}
//---------------------------------------------------------------------------
string BlobStats::lastModified() const
// Get the last modification date
{
    auto lastModified = lastModifiedOrNone();
    if (!lastModified)
        throw HeaderError("Last-Modified header is not present");
    return *lastModified;
}
//---------------------------------------------------------------------------
optional<string> BlobStats::lastModifiedOrNone() const
// Get the last modification date if known
{
    return findHeader(_headers, "Last-Modified");
}
//---------------------------------------------------------------------------
map<string, string> BlobStats::toMap() const
// The known statistics by name
{
    map<string, string> result;
    if (auto size = sizeOrNone())
        result.emplace("size", to_string(*size));
    if (auto contentType = contentTypeOrNone())
        result.emplace("content_type", move(*contentType));
    if (auto lastModified = lastModifiedOrNone())
        result.emplace("last_modified", move(*lastModified));
    return result;
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
