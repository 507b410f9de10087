#include "cloud/blob.hpp"
#include "cloud/blob_error.hpp"
#include "cloud/blob_manager.hpp"
#include "utils/utils.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob {
namespace cloud {
namespace test {
//---------------------------------------------------------------------------
using namespace std;
using network::HttpRequest;
using network::HttpResponse;
//---------------------------------------------------------------------------
/// Serves byte ranges of one object from memory and records every exchange
class FakeHttpClient : public network::HttpClient {
    public:
    /// A recorded exchange
    struct Exchange {
        HttpRequest request;
        string body;
    };

    /// The object
    string object;
    /// The status and body of every response if set
    optional<pair<uint16_t, string>> failure;
    /// The exchanges
    vector<Exchange> exchanges;
    /// The chunk size of streamed bodies
    uint64_t chunkSize = 3;

    explicit FakeHttpClient(string object = "") : object(move(object)) {}

    HttpResponse request(const HttpRequest& request, string_view body) override {
        exchanges.push_back({request, string(body)});
        HttpResponse response;
        if (failure) {
            response.status = failure->first;
            response.body = failure->second;
            return response;
        }
        if (request.method == HttpRequest::Method::PUT) {
            object = string(body);
            response.status = 201;
            return response;
        }

        response.headers["Content-Type"] = "text/plain";
        response.headers["Last-Modified"] = "Wed, 21 Oct 2015 07:28:00 GMT";
        auto range = request.headers.find("Range");
        if (range == request.headers.end()) {
            response.status = 200;
            response.headers["Content-Length"] = to_string(object.size());
            response.body = object;
            return response;
        }

        auto rangeValue = string_view(range->second).substr(6);
        auto dash = rangeValue.find('-');
        auto start = *utils::parseUnsigned(rangeValue.substr(0, dash));
        auto end = dash + 1 < rangeValue.size() ? *utils::parseUnsigned(rangeValue.substr(dash + 1)) : object.size() - 1;
        if (start >= object.size()) {
            response.status = 416;
            return response;
        }
        end = min<uint64_t>(end, object.size() - 1);
        response.status = 206;
        response.body = object.substr(start, end - start + 1);
        response.headers["Content-Range"] = "bytes " + to_string(start) + "-" + to_string(end) + "/" + to_string(object.size());
        response.headers["Content-Length"] = to_string(response.body.size());
        return response;
    }

    HttpResponse stream(const HttpRequest& request, const ChunkCallback& onChunk) override {
        auto response = this->request(request, {});
        if (!response.success())
            return response;
        auto body = move(response.body);
        response.body.clear();
        for (uint64_t i = 0; i < body.size(); i += chunkSize)
            onChunk(string_view(body).substr(i, chunkSize));
        return response;
    }

    /// The Range header of an exchange
    optional<string> range(size_t exchange) const {
        auto& headers = exchanges.at(exchange).request.headers;
        auto it = headers.find("Range");
        if (it == headers.end())
            return nullopt;
        return it->second;
    }
};
//---------------------------------------------------------------------------
const string url = "https://bucket.s3.eu-central-1.amazonaws.com/dir/object.txt?X-Amz-Signature=abc";
//---------------------------------------------------------------------------
TEST_CASE("blob_get") {
    FakeHttpClient client("0123456789\xE2\x82\xAC" "abcdefghij");
    Blob blob(url, client);
    REQUIRE(blob.getType() == Provider::Type::S3);
    REQUIRE(blob.getUrl() == url);

    SECTION("whole") {
        REQUIRE(blob.get() == client.object);
        REQUIRE(client.exchanges.size() == 1);
        REQUIRE(client.exchanges[0].request.method == HttpRequest::Method::GET);
        REQUIRE(client.exchanges[0].request.url == url);
        REQUIRE(!client.range(0));
    }
    SECTION("ranges") {
        REQUIRE(blob.get(RangeArgs{Span{2, 5}, nullopt, nullopt}) == "234");
        REQUIRE(client.range(0) == "bytes=2-4");
        REQUIRE(blob.get(RangeArgs{nullopt, 2, 5}) == "2345");
        REQUIRE(client.range(1) == "bytes=2-5");
        REQUIRE(blob.get(RangeArgs{nullopt, 20, nullopt}) == "hij");
        REQUIRE(client.range(2) == "bytes=20-");
    }
    SECTION("conflict_before_request") {
        REQUIRE_THROWS_AS(blob.get(RangeArgs{Span{0, 4}, 1, nullopt}), ConflictingRangeError);
        REQUIRE_THROWS_AS(blob.growToValidString(RangeArgs{Span{0, 4}, nullopt, 3}), ConflictingRangeError);
        REQUIRE_THROWS_AS(blob.shrinkToValidString(RangeArgs{Span{0, 4}, 1, 3}), ConflictingRangeError);
        REQUIRE_THROWS_AS(blob.stream([](string_view) {}, RangeArgs{Span{}, 1, nullopt}), ConflictingRangeError);
        REQUIRE(client.exchanges.empty());
    }
    SECTION("stat") {
        auto stats = blob.stat();
        REQUIRE(client.range(0) == "bytes=0-0");
        REQUIRE(stats.size() == client.object.size());
        REQUIRE(stats.contentType() == "text/plain");
        REQUIRE(stats.lastModified() == "Wed, 21 Oct 2015 07:28:00 GMT");
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blob_text") {
    FakeHttpClient client("0123456789\xE2\x82\xAC" "abcdefghij");
    Blob blob(url, client);

    SECTION("grow_left") {
        REQUIRE(blob.growToValidString(RangeArgs{Span{11, 20}, nullopt, nullopt}) == client.object.substr(10, 10));
        REQUIRE(client.exchanges.size() == 2);
        REQUIRE(client.range(1) == "bytes=10-10");
    }
    SECTION("grow_right") {
        REQUIRE(blob.growToValidString(RangeArgs{nullopt, 0, 10}) == client.object.substr(0, 13));
        REQUIRE(client.exchanges.size() == 4);
        REQUIRE(client.range(1) == "bytes=0-0");
        REQUIRE(client.range(2) == "bytes=11-11");
        REQUIRE(client.range(3) == "bytes=12-12");
    }
    SECTION("grow_whole") {
        REQUIRE(blob.growToValidString() == client.object);
        REQUIRE(client.exchanges.size() == 1);
    }
    SECTION("shrink") {
        REQUIRE(blob.shrinkToValidString(RangeArgs{nullopt, 11, 20}) == "abcdefgh");
        REQUIRE(blob.shrinkToValidString(RangeArgs{nullopt, 5, 11}) == "56789");
        REQUIRE(client.exchanges.size() == 2);
    }
    SECTION("lines") {
        client.object = "first\r\nsecond\n\nfourth\n";
        REQUIRE(blob.getLines() == vector<string>{"first", "second", "", "fourth"});
        client.object = "a\n\xFF";
        REQUIRE_THROWS_AS(blob.getLines(), range_error);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blob_stream") {
    FakeHttpClient client("line one\r\nline two\nline \xC3\xA4\xFF\nlast");
    Blob blob(url, client);

    SECTION("chunks") {
        string result;
        unsigned chunks = 0;
        blob.stream([&](string_view chunk) { result.append(chunk); chunks++; });
        REQUIRE(result == client.object);
        REQUIRE(chunks > 1);
    }
    SECTION("lines") {
        vector<string> lines;
        blob.streamLines([&](string_view line) { lines.emplace_back(line); });
        REQUIRE(lines == vector<string>{"line one", "line two", "line \xC3\xA4\xEF\xBF\xBD", "last"});
    }
    SECTION("range") {
        string result;
        blob.stream([&](string_view chunk) { result.append(chunk); }, RangeArgs{Span{5, 8}, nullopt, nullopt});
        REQUIRE(result == "one");
    }
    SECTION("failure") {
        client.failure = {404, "<Error><Code>NoSuchKey</Code></Error>"};
        unsigned chunks = 0;
        REQUIRE_THROWS_AS(blob.stream([&](string_view) { chunks++; }), BlobNotFoundError);
        REQUIRE(chunks == 0);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blob_put") {
    FakeHttpClient client;

    SECTION("azure") {
        Blob blob("https://account.blob.core.windows.net/container/blob?sig=x", client);
        REQUIRE(blob.getType() == Provider::Type::Azure);
        blob.put("payload", "application/octet-stream");
        auto& exchange = client.exchanges.at(0);
        REQUIRE(exchange.request.method == HttpRequest::Method::PUT);
        REQUIRE(exchange.body == "payload");
        REQUIRE(exchange.request.headers.at("x-ms-blob-type") == "BlockBlob");
        REQUIRE(exchange.request.headers.at("Content-Type") == "application/octet-stream");
        REQUIRE(!client.range(0));
    }
    SECTION("lines") {
        Blob blob("http://localhost:9000/bucket/key", client);
        REQUIRE(blob.getType() == Provider::Type::Generic);
        blob.putLines({"a", "b", "c"});
        REQUIRE(client.object == "a\nb\nc");
        REQUIRE(client.exchanges.at(0).request.headers.empty());
        blob.putLines({});
        REQUIRE(client.object.empty());
    }
    SECTION("override") {
        Blob blob("http://localhost:9000/bucket/key", client, Provider::Type::Azure);
        REQUIRE(blob.getType() == Provider::Type::Azure);
        blob.put("x");
        REQUIRE(client.exchanges.at(0).request.headers.count("x-ms-blob-type") == 1);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blob_errors") {
    FakeHttpClient client("content");
    Blob blob(url, client);

    client.failure = {404, "<Error><Code>NoSuchBucket</Code><Message>The specified bucket does not exist</Message></Error>"};
    REQUIRE_THROWS_AS(blob.get(), ContainerNotFoundError);
    REQUIRE_THROWS_AS(blob.stat(), ContainerNotFoundError);
    REQUIRE_THROWS_WITH(blob.growToValidString(), "The specified bucket does not exist");

    client.failure = {403, "<Error><Code>AccessDenied</Code></Error>"};
    REQUIRE_THROWS_AS(blob.put("x"), AuthenticationFailedError);

    client.failure = {503, ""};
    try {
        (void)blob.get();
        FAIL("no error thrown");
    } catch (const BlobError& error) {
        REQUIRE(error.isRetryable());
        REQUIRE(error.getStatusCode() == 503);
        REQUIRE(error.getProvider() == Provider::Type::S3);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("blob_manager") {
    auto client = make_unique<FakeHttpClient>("managed");
    auto& fake = *client;
    BlobManager manager(move(client));
    REQUIRE(&manager.getClient() == &fake);

    auto blob = manager.fromUrl("https://bucket.storage.googleapis.com/key");
    REQUIRE(blob.getType() == Provider::Type::GCP);
    REQUIRE(blob.get() == "managed");
    REQUIRE(manager.fromUrl("https://example.com/key", Provider::Type::S3).getType() == Provider::Type::S3);

    REQUIRE_THROWS_AS(BlobManager(unique_ptr<network::HttpClient>()), std::invalid_argument);
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace urlblob
