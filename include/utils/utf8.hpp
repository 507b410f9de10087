#pragma once
#include <cstdint>
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
namespace urlblob::utils {
//---------------------------------------------------------------------------
/// Implements a strict UTF-8 decoder that reports where and why decoding stopped
class Utf8 {
    public:
    /// The failure kinds
    enum class FailureKind : uint8_t {
        /// The byte at start can never begin a code point (continuation byte or invalid lead)
        InvalidStart,
        /// The sequence beginning at start is broken by the byte at end
        InvalidContinuation,
        /// The input ends before the sequence beginning at start is complete
        UnexpectedEnd
    };

    /// The decode failure
    struct Failure {
        /// The kind
        FailureKind kind;
        /// The offset of the first byte of the broken sequence
        uint64_t start;
        /// One past the last byte that belongs to the broken sequence
        uint64_t end;
    };

    /// The replacement character U+FFFD
    static constexpr std::string_view replacement = "\xEF\xBF\xBD";
    /// The maximum length of an encoded code point
    static constexpr unsigned maxSequenceLength = 4;

    /// Find the first decode failure, nullopt if the input is valid
    [[nodiscard]] static std::optional<Failure> validate(std::string_view bytes) noexcept;
    /// Decode, replacing every maximal invalid subpart with U+FFFD
    [[nodiscard]] static std::string decodeLossy(std::string_view bytes);
    /// Decode strictly, throws std::range_error on the first failure
    [[nodiscard]] static std::string decode(std::string_view bytes);
    /// Encode a code point, nullopt for surrogates and values beyond U+10FFFF
    [[nodiscard]] static std::optional<std::string> encode(uint32_t codePoint);
    /// Get the failure kind name
    static constexpr auto getFailureName(FailureKind kind) noexcept {
        switch (kind) {
            case FailureKind::InvalidStart: return "invalid start byte";
            case FailureKind::InvalidContinuation: return "invalid continuation byte";
            case FailureKind::UnexpectedEnd: return "unexpected end of data";
            default: return "unknown";
        }
    }

    private:
    /// Inspect the sequence at pos, returns its length or a failure
    [[nodiscard]] static std::optional<Failure> inspect(std::string_view bytes, uint64_t pos, uint64_t& length) noexcept;
};
//---------------------------------------------------------------------------
} // namespace urlblob::utils
