#include "cloud/range_codec.hpp"
#include "cloud/blob_error.hpp"
#include "utils/utils.hpp"
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
namespace cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
ByteRange RangeCodec::resolve(const RangeArgs& args)
// Resolve the caller arguments
{
    if (args.relative && (args.start || args.end))
        throw ConflictingRangeError();

    if (!args.relative)
        return ByteRange{args.start, args.end};

    ByteRange range;
    range.start = args.relative->start.value_or(0);
    if (args.relative->stop) {
        // http ranges have an inclusive end
        if (*args.relative->stop == 0)
            throw InvalidRangeError("A range ending before byte 0 has no http representation");
        range.endInclusive = *args.relative->stop - 1;
    }
    return range;
}
//---------------------------------------------------------------------------
optional<string> RangeCodec::encode(const ByteRange& range)
// The Range header value
{
    if (range.unbounded())
        return nullopt;
    string value = "bytes=";
    value += to_string(range.start.value_or(0));
    value += '-';
    if (range.endInclusive)
        value += to_string(*range.endInclusive);
    return value;
}
//---------------------------------------------------------------------------
Provider::Headers RangeCodec::getHeaders(const ByteRange& range)
// The request headers of a ranged get
{
    Provider::Headers headers;
    if (auto value = encode(range))
        headers.emplace("Range", move(*value));
    return headers;
}
//---------------------------------------------------------------------------
optional<uint64_t> RangeCodec::decodeSize(const Provider::Headers& headers)
// The object size
{
    // A ranged response reports the fragment size in Content-Length, the total is only in Content-Range
    if (auto it = headers.find("Content-Range"); it != headers.end() && !utils::trim(it->second).empty()) {
        string_view value = it->second;
        auto total = utils::trim(value.substr(value.rfind('/') + 1));
        if (total == "*")
            return nullopt;
        auto size = utils::parseUnsigned(total);
        if (!size)
            throw HeaderError("Invalid Content-Range header: " + it->second);
        return size;
    }
    if (auto it = headers.find("Content-Length"); it != headers.end()) {
        auto size = utils::parseUnsigned(it->second);
        if (!size)
            throw HeaderError("Invalid Content-Length header: " + it->second);
        return size;
    }
    return nullopt;
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
