#pragma once
#include "network/http_response.hpp"
#include <cstdint>
#include <functional>
#include <optional>
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
/// Implements an helper to frame http response bodies
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        /// No body at all
        None,
        ContentLength,
        ChunkedEncoding,
        /// The body ends when the server closes the connection
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The body length for content length encoding
        uint64_t length = 0;
        /// The header length
        uint64_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::None;
    };

    /// Incremental decoder of the chunked transfer coding
    class ChunkedDecoder {
        /// The decoder state
        enum class State : uint8_t {
            Size,
            Extension,
            Data,
            DataEnd,
            Trailer,
            Done
        };
        /// The state
        State _state = State::Size;
        /// The remaining bytes of the current chunk or the parsed size
        uint64_t _remaining = 0;
        /// Did the size line contain a digit?
        bool _sizeDigits = false;
        /// The length of the current trailer line
        uint64_t _lineLength = 0;

        public:
        /// Decode the next part of the body, returns true after the last chunk
        bool feed(std::string_view data, const std::function<void(std::string_view)>& onData);
        /// Was the last chunk seen?
        [[nodiscard]] bool finished() const noexcept { return _state == State::Done; }
    };

    /// Find the end of the header including the empty line
    [[nodiscard]] static std::optional<uint64_t> findHeaderEnd(std::string_view data) noexcept;
    /// Detect the body framing of a complete response header
    [[nodiscard]] static Info detect(std::string_view header, bool headRequest);
};
//---------------------------------------------------------------------------
} // namespace network
} // namespace urlblob
