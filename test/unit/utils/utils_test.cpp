#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <map>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::utils::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("utils") {
    REQUIRE(iequals("Content-Length", "content-length"));
    REQUIRE(!iequals("Content-Length", "Content-Lengths"));
    REQUIRE(trim("  value\t\r\n") == "value");
    REQUIRE(trim(" \t ").empty());

    REQUIRE(parseUnsigned("1024") == 1024u);
    REQUIRE(parseUnsigned(" 7 ") == 7u);
    REQUIRE(!parseUnsigned(""));
    REQUIRE(!parseUnsigned("12a"));
    REQUIRE(!parseUnsigned("-1"));
    REQUIRE(!parseUnsigned("99999999999999999999999"));

    REQUIRE(formatSize(512) == "512 bytes");
    REQUIRE(formatSize(1536) == "1.50 KB");
    REQUIRE(formatSize(5ull * 1024 * 1024) == "5.00 MB");
    REQUIRE(formatSize(3ull * 1024 * 1024 * 1024) == "3.00 GB");

    map<string, int, CaseInsensitiveLess> headers;
    headers.emplace("Content-Type", 1);
    REQUIRE(headers.find(string_view("content-type")) != headers.end());
}
//---------------------------------------------------------------------------
TEST_CASE("split_lines") {
    REQUIRE(splitLines("").empty());
    REQUIRE(splitLines("a\nb\r\nc\rd") == vector<string_view>{"a", "b", "c", "d"});
    // No empty line after a trailing terminator
    REQUIRE(splitLines("a\n") == vector<string_view>{"a"});
    REQUIRE(splitLines("a\n\nb") == vector<string_view>{"a", "", "b"});
    REQUIRE(splitLines("\r\n") == vector<string_view>{""});
}
//---------------------------------------------------------------------------
TEST_CASE("line_splitter") {
    vector<string> lines;
    LineSplitter splitter([&lines](string_view line) { lines.emplace_back(line); });

    SECTION("chunk_boundaries") {
        for (auto chunk : {"fir", "st\nsec", "ond\r", "\nthird\r", "fourth\n", "last"})
            splitter.feed(chunk);
        splitter.finish();
        REQUIRE(lines == vector<string>{"first", "second", "third", "fourth", "last"});
    }
    SECTION("same_as_split_lines") {
        string text = "a\r\n\r\nb\rc\n\nd\r\n";
        for (auto c : text)
            splitter.feed(string_view(&c, 1));
        splitter.finish();
        vector<string> expected;
        for (auto line : splitLines(text))
            expected.emplace_back(line);
        REQUIRE(lines == expected);
    }
}
//---------------------------------------------------------------------------
} // namespace urlblob::utils::test
