#include "cloud/boundary_resolver.hpp"
#include "utils/utf8.hpp"
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
using utils::Utf8;
//---------------------------------------------------------------------------
string BoundaryResolver::grow(const ByteRange& range, string_view fragment) const
// Extend the fragment until it decodes
{
    // The whole object has no edge to extend past
    if (range.unbounded())
        return Utf8::decodeLossy(fragment);

    string current(fragment);
    unsigned leftExtension = 0;
    unsigned rightExtension = 0;
    optional<uint64_t> blobSize;
    bool sizeFetched = false;

    while (leftExtension < maxExtension && rightExtension < maxExtension) {
        auto failure = Utf8::validate(current);
        if (!failure)
            return current;

        if (failure->kind == Utf8::FailureKind::InvalidStart && failure->start == 0) {
            // The first byte continues a code point that begins before the range
            leftExtension++;
            if (!range.start || leftExtension > *range.start || leftExtension >= maxExtension)
                break;
            current.insert(0, _fetchByte(*range.start - leftExtension));
        } else if (failure->kind == Utf8::FailureKind::UnexpectedEnd && failure->end == current.size()) {
            // The last code point continues after the range
            rightExtension++;
            if (!range.endInclusive || rightExtension >= maxExtension)
                break;
            if (!sizeFetched) {
                blobSize = _fetchSize();
                sizeFetched = true;
            }
            if (!blobSize || *range.endInclusive + rightExtension + 1 >= *blobSize)
                break;
            current.append(_fetchByte(*range.endInclusive + rightExtension));
        } else {
            // A broken sequence inside the fragment is an encoding error
            break;
        }
    }
    return Utf8::decodeLossy(fragment);
}
//---------------------------------------------------------------------------
string BoundaryResolver::shrink(const ByteRange& range, string_view fragment)
// Drop the cut code points at the edges
{
    if (range.unbounded())
        return Utf8::decodeLossy(fragment);

    while (true) {
        auto failure = Utf8::validate(fragment);
        if (!failure)
            return string(fragment);
        if (failure->start == 0) {
            fragment.remove_prefix(failure->end);
        } else if (failure->end == fragment.size()) {
            fragment.remove_suffix(fragment.size() - failure->start);
        } else {
            return Utf8::decodeLossy(fragment);
        }
    }
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
