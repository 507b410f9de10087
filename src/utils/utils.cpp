#include "utils/utils.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>
#include <iomanip>
#include <sstream>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace urlblob {
namespace utils {
//---------------------------------------------------------------------------
static inline unsigned char lower(char c)
// Ascii lower case
{
    return static_cast<unsigned char>(tolower(static_cast<unsigned char>(c)));
}
//---------------------------------------------------------------------------
bool CaseInsensitiveLess::operator()(string_view lhs, string_view rhs) const noexcept
// Compare lexicographically ignoring the case
{
    return lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) { return lower(a) < lower(b); });
}
//---------------------------------------------------------------------------
bool iequals(string_view lhs, string_view rhs) noexcept
// Case insensitive equality
{
    return lhs.size() == rhs.size() && equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) { return lower(a) == lower(b); });
}
//---------------------------------------------------------------------------
string_view trim(string_view value) noexcept
// Remove whitespaces at both sides
{
    static constexpr string_view whitespaces = " \t\r\n";
    auto begin = value.find_first_not_of(whitespaces);
    if (begin == value.npos)
        return {};
    auto end = value.find_last_not_of(whitespaces);
    return value.substr(begin, end - begin + 1);
}
//---------------------------------------------------------------------------
optional<uint64_t> parseUnsigned(string_view value) noexcept
// Parse a decimal number
{
    value = trim(value);
    if (value.empty())
        return nullopt;
    uint64_t result = 0;
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result);
    if (ec != errc() || ptr != value.data() + value.size())
        return nullopt;
    return result;
}
//---------------------------------------------------------------------------
vector<string_view> splitLines(string_view text)
// Split into lines
{
    vector<string_view> lines;
    uint64_t begin = 0;
    for (uint64_t i = 0; i < text.size(); i++) {
        if (text[i] == '\n' || text[i] == '\r') {
            lines.push_back(text.substr(begin, i - begin));
            if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                i++;
            begin = i + 1;
        }
    }
    if (begin < text.size())
        lines.push_back(text.substr(begin));
    return lines;
}
//---------------------------------------------------------------------------
string formatSize(uint64_t size)
// Human readable size
{
    static constexpr const char* units[] = {"KB", "MB", "GB"};
    if (size < 1024)
        return to_string(size) + " bytes";
    auto value = static_cast<double>(size) / 1024;
    auto unit = 0u;
    while (value >= 1024 && unit < 2) {
        value /= 1024;
        unit++;
    }
    stringstream s;
    s << fixed << setprecision(2) << value << " " << units[unit];
    return s.str();
}
//---------------------------------------------------------------------------
void LineSplitter::feed(string_view chunk)
// Feed the next chunk
{
    for (auto c : chunk) {
        if (_pendingCarriageReturn) {
            _pendingCarriageReturn = false;
            if (c == '\n')
                continue;
        }
        if (c == '\n' || c == '\r') {
            _callback(_pending);
            _pending.clear();
            _pendingCarriageReturn = c == '\r';
        } else {
            _pending.push_back(c);
        }
    }
}
//---------------------------------------------------------------------------
void LineSplitter::finish()
// Flush the last line
{
    if (!_pending.empty()) {
        _callback(_pending);
        _pending.clear();
    }
    _pendingCarriageReturn = false;
}
//---------------------------------------------------------------------------
} // namespace utils
} // namespace urlblob
