#include "utils/utf8.hpp"
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
optional<Utf8::Failure> Utf8::inspect(string_view bytes, uint64_t pos, uint64_t& length) noexcept
// Inspect one sequence following the well-formed byte table of the Unicode standard
{
    auto lead = static_cast<uint8_t>(bytes[pos]);
    if (lead < 0x80) {
        length = 1;
        return nullopt;
    }

    // The expected length and the allowed range of the second byte
    unsigned need = 0;
    uint8_t lower = 0x80, upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 2;
    } else if (lead == 0xE0) {
        need = 3;
        lower = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        need = 3;
    } else if (lead == 0xED) {
        // Surrogates are not allowed
        need = 3;
        upper = 0x9F;
    } else if (lead == 0xF0) {
        need = 4;
        lower = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 4;
    } else if (lead == 0xF4) {
        need = 4;
        upper = 0x8F;
    } else {
        return Failure{FailureKind::InvalidStart, pos, pos + 1};
    }

    for (auto i = 1u; i < need; i++) {
        if (pos + i >= bytes.size())
            return Failure{FailureKind::UnexpectedEnd, pos, bytes.size()};
        auto c = static_cast<uint8_t>(bytes[pos + i]);
        if (c < lower || c > upper)
            return Failure{FailureKind::InvalidContinuation, pos, pos + i};
        lower = 0x80;
        upper = 0xBF;
    }
    length = need;
    return nullopt;
}
//---------------------------------------------------------------------------
optional<Utf8::Failure> Utf8::validate(string_view bytes) noexcept
// Find the first decode failure
{
    uint64_t pos = 0;
    while (pos < bytes.size()) {
        uint64_t length = 0;
        if (auto failure = inspect(bytes, pos, length))
            return failure;
        pos += length;
    }
    return nullopt;
}
//---------------------------------------------------------------------------
string Utf8::decodeLossy(string_view bytes)
// Decode with replacement of the maximal invalid subparts
{
    string result;
    result.reserve(bytes.size());
    uint64_t pos = 0;
    while (pos < bytes.size()) {
        uint64_t length = 0;
        if (auto failure = inspect(bytes, pos, length)) {
            result += replacement;
            pos = failure->end;
        } else {
            result.append(bytes.substr(pos, length));
            pos += length;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string Utf8::decode(string_view bytes)
// Decode strictly
{
    if (auto failure = validate(bytes))
        throw range_error("utf-8 decode failed at position " + to_string(failure->start) + ": " + getFailureName(failure->kind));
    return string(bytes);
}
//---------------------------------------------------------------------------
optional<string> Utf8::encode(uint32_t codePoint)
// Encode a code point
{
    if ((codePoint >= 0xD800 && codePoint <= 0xDFFF) || codePoint > 0x10FFFF)
        return nullopt;

    string result;
    if (codePoint < 0x80) {
        result.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else if (codePoint < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        result.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace urlblob::utils
