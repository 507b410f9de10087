#pragma once
#include "cloud/range_codec.hpp"
#include <cstdint>
#include <functional>
#include <optional>
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
/// Turns a fetched byte range into valid UTF-8 text when the range cuts code points at its edges.
///
/// grow fetches single bytes left of the start and right of the end until the cut code points
/// are complete. At most maxExtension - 1 bytes are fetched per edge, the blob size is fetched
/// at most once. If the fragment cannot be completed the original fragment is decoded with
/// U+FFFD replacements, the bytes fetched so far are discarded.
///
/// shrink never fetches and drops the undecodable bytes at the edges instead.
class BoundaryResolver {
    public:
    /// Fetches the byte at the offset
    using FetchByte = std::function<std::string(uint64_t offset)>;
    /// Fetches the blob size, nullopt if the server does not report it
    using FetchSize = std::function<std::optional<uint64_t>()>;

    /// The bound of the extension counters, the maximum length of a code point
    static constexpr unsigned maxExtension = 4;

    private:
    /// The byte fetch
    FetchByte _fetchByte;
    /// The size fetch
    FetchSize _fetchSize;

    public:
    /// The constructor
    BoundaryResolver(FetchByte fetchByte, FetchSize fetchSize) : _fetchByte(std::move(fetchByte)), _fetchSize(std::move(fetchSize)) {}

    /// Decode the fragment of the range, extends the range outward to complete cut code points
    [[nodiscard]] std::string grow(const ByteRange& range, std::string_view fragment) const;
    /// Decode the fragment of the range, drops cut code points at the edges
    [[nodiscard]] static std::string shrink(const ByteRange& range, std::string_view fragment);
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
