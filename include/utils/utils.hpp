#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::utils {
//---------------------------------------------------------------------------
/// Case insensitive ordering for http header names
struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept;
};
//---------------------------------------------------------------------------
/// Case insensitive equality
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
/// Remove leading and trailing whitespaces
[[nodiscard]] std::string_view trim(std::string_view value) noexcept;
/// Parse an unsigned decimal number, the whole (trimmed) value needs to be a number
[[nodiscard]] std::optional<uint64_t> parseUnsigned(std::string_view value) noexcept;
/// Split into lines at \n, \r\n and \r, the terminators are dropped
[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view text);
/// Format a size in a human readable way
[[nodiscard]] std::string formatSize(uint64_t size);
//---------------------------------------------------------------------------
/// Reassembles lines from arbitrarily cut chunks
class LineSplitter {
    public:
    /// The line callback
    using Callback = std::function<void(std::string_view line)>;

    private:
    /// The incomplete line
    std::string _pending;
    /// The last chunk ended with \r, a following \n belongs to it
    bool _pendingCarriageReturn;
    /// The consumer
    Callback _callback;

    public:
    /// The constructor
    explicit LineSplitter(Callback callback) : _pending(), _pendingCarriageReturn(false), _callback(std::move(callback)) {}

    /// Feed the next chunk
    void feed(std::string_view chunk);
    /// Flush the last line without terminator
    void finish();
};
//---------------------------------------------------------------------------
} // namespace urlblob::utils
