#include "network/http_response.hpp"
#include <catch2/catch.hpp>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob {
namespace network {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("http_response") {
    SECTION("deserialize") {
        string header = "HTTP/1.1 206 Partial Content\r\nContent-Range: bytes 0-0/1024\r\ncontent-length:  1 \r\nETag: \"abc\"\r\n\r\n";
        auto response = HttpResponse::deserialize(header);
        REQUIRE(response.type == HttpResponse::Type::HTTP_1_1);
        REQUIRE(response.status == 206);
        REQUIRE(response.reason == "Partial Content");
        REQUIRE(response.success());
        REQUIRE(response.getHeader("Content-Length") == "1");
        REQUIRE(response.getHeader("content-range") == "bytes 0-0/1024");
        REQUIRE(!response.getHeader("Last-Modified"));
    }
    SECTION("without_reason") {
        auto response = HttpResponse::deserialize("HTTP/1.0 404\r\n\r\n");
        REQUIRE(response.type == HttpResponse::Type::HTTP_1_0);
        REQUIRE(response.status == 404);
        REQUIRE(response.reason.empty());
        REQUIRE(!response.success());
    }
    SECTION("invalid") {
        REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/2 200 OK\r\n\r\n"), runtime_error);
        REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 2x0 OK\r\n\r\n"), runtime_error);
        REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\nBroken\r\n\r\n"), runtime_error);
        REQUIRE_THROWS_AS(HttpResponse::deserialize("HTTP/1.1 200 OK\r\n"), runtime_error);
    }
    SECTION("status_classes") {
        REQUIRE(HttpResponse::checkSuccess(200));
        REQUIRE(HttpResponse::checkSuccess(201));
        REQUIRE(!HttpResponse::checkSuccess(304));
        REQUIRE(HttpResponse::withoutContent(204));
        REQUIRE(HttpResponse::withoutContent(304));
        REQUIRE(HttpResponse::withoutContent(100));
        REQUIRE(!HttpResponse::withoutContent(200));
    }
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace network
} // namespace urlblob
