#pragma once
#include "cloud/provider.hpp"
#include <cstdint>
#include <optional>
#include <string>
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
/// A relative half-open range [start, stop)
struct Span {
    /// The first byte, defaults to 0
    std::optional<uint64_t> start;
    /// One past the last byte, open-ended if absent
    std::optional<uint64_t> stop;
};
//---------------------------------------------------------------------------
/// The range arguments of a blob operation, either a relative span or explicit inclusive bounds
struct RangeArgs {
    /// The relative span
    std::optional<Span> relative;
    /// The explicit start
    std::optional<uint64_t> start;
    /// The explicit inclusive end
    std::optional<uint64_t> end;

    /// No range at all?
    [[nodiscard]] bool empty() const noexcept { return !relative && !start && !end; }
};
//---------------------------------------------------------------------------
/// The canonical byte range with inclusive bounds
struct ByteRange {
    /// The first byte, from the beginning if absent
    std::optional<uint64_t> start;
    /// The last byte, to the end if absent
    std::optional<uint64_t> endInclusive;

    /// Is the whole object requested?
    [[nodiscard]] bool unbounded() const noexcept { return !start && !endInclusive; }
};
//---------------------------------------------------------------------------
/// Converts byte ranges to Range headers and sizes from response headers
class RangeCodec {
    public:
    /// Resolve the caller arguments, throws ConflictingRangeError or InvalidRangeError
    [[nodiscard]] static ByteRange resolve(const RangeArgs& args);
    /// The Range header value, nullopt if no bound is given
    [[nodiscard]] static std::optional<std::string> encode(const ByteRange& range);
    /// The request headers of a ranged get
    [[nodiscard]] static Provider::Headers getHeaders(const ByteRange& range);
    /// The object size, prefers the total of Content-Range over Content-Length.
    /// Throws HeaderError if the header value is malformed.
    [[nodiscard]] static std::optional<uint64_t> decodeSize(const Provider::Headers& headers);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
