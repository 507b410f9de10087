#include "cloud/error_classifier.hpp"
#include "network/http_response.hpp"
#include <catch2/catch.hpp>
#include <string>
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
//---------------------------------------------------------------------------
// Helper to test private methods
class ErrorClassifierTester {
    public:
    void test() {
        REQUIRE(ErrorClassifier::unescape("&lt;a&gt; &quot;b&quot; &apos;c&apos; &amp;amp;") == "<a> \"b\" 'c' &amp;");
        REQUIRE(ErrorClassifier::unescape("&#38; &#x26; &#xE4;") == "& & \xC3\xA4");
        REQUIRE(ErrorClassifier::unescape("") == "");
        REQUIRE(!ErrorClassifier::unescape("a & b"));
        REQUIRE(!ErrorClassifier::unescape("&unknown;"));
        REQUIRE(!ErrorClassifier::unescape("&amp"));
        REQUIRE(!ErrorClassifier::unescape("&#;"));
        REQUIRE(!ErrorClassifier::unescape("&#0;"));
        REQUIRE(!ErrorClassifier::unescape("&#xD800;"));
        REQUIRE(!ErrorClassifier::unescape("&#x110000;"));
        REQUIRE(!ErrorClassifier::unescape("&#12a;"));

        REQUIRE(ErrorClassifier::nameLength("Code>") == 4);
        REQUIRE(ErrorClassifier::nameLength("s3:Code attr") == 7);
        REQUIRE(ErrorClassifier::nameLength(">") == 0);
        REQUIRE(ErrorClassifier::nameLength("1Code>") == 0);

        REQUIRE(ErrorClassifier::declarationLength("<!DOCTYPE Error>") == 16);
        REQUIRE(ErrorClassifier::declarationLength("<!DOCTYPE Error [<!ENTITY x \"]>\">]><Error/>") == 35);
        REQUIRE(!ErrorClassifier::declarationLength("<!DOCTYPE Error [<!ENTITY x \"y\">"));
    }
};
//---------------------------------------------------------------------------
TEST_CASE("error_classifier_xml") {
    ErrorClassifierTester tester;
    tester.test();

    auto xml = ErrorClassifier::parseXmlError("\xEF\xBB\xBF <?xml version=\"1.0\"?>\n<Error><Code>NoSuchKey</Code><Message>The key does not exist.</Message></Error>\n");
    REQUIRE(xml);
    REQUIRE(xml->code == "NoSuchKey");
    REQUIRE(xml->message == "The key does not exist.");
    REQUIRE(!xml->authenticationDetail);

    REQUIRE(!ErrorClassifier::parseXmlError(""));
    REQUIRE(!ErrorClassifier::parseXmlError("Not Found"));
    REQUIRE(!ErrorClassifier::parseXmlError("{\"error\": \"<Code>x</Code>\"}"));

    SECTION("nested") {
        xml = ErrorClassifier::parseXmlError("<Error><CodeDetail>x</CodeDetail><Details attr='1' other = \"&amp;\"><Code>Deep&amp;Nested<Inner/>tail</Code></Details><Code>Second</Code><Message/></Error>");
        REQUIRE(xml);
        REQUIRE(xml->code == "Deep&Nested");
        REQUIRE(!xml->message);

        // The root itself is no field, empty elements are absent
        xml = ErrorClassifier::parseXmlError("<Code>Root<Message></Message></Code>");
        REQUIRE(xml);
        REQUIRE(!xml->code);
        REQUIRE(!xml->message);

        xml = ErrorClassifier::parseXmlError("<!DOCTYPE Error><!-- <Code>Comment</Code> --><Error><Code><![CDATA[A<B]]></Code><Message>&#60;&#x3E;</Message></Error><!-- done -->");
        REQUIRE(xml);
        REQUIRE(xml->code == "A<B");
        REQUIRE(xml->message == "<>");
    }
    SECTION("malformed") {
        // Truncated
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code></Err"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket"));
        // Invalid references
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code><Message>a & b</Message></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code><Message>&nbsp;</Message></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error a=\"&\"><Code>NoSuchBucket</Code></Error>"));
        // Unbalanced
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Message></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code></Error></Error>"));
        // Content around the root
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code></Error><Error/>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuchBucket</Code></Error>trailing"));
        // Broken tags
        REQUIRE(!ErrorClassifier::parseXmlError("<Error a=1><Code>NoSuchBucket</Code></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error a='1'b='2'><Code>NoSuchBucket</Code></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("< Error><Code>NoSuchBucket</Code></Error>"));
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><!-- open <Code>NoSuchBucket</Code></Error>"));
        // Invalid UTF-8
        REQUIRE(!ErrorClassifier::parseXmlError("<Error><Code>NoSuch\xFF</Code></Error>"));
    }
}
//---------------------------------------------------------------------------
TEST_CASE("error_classifier_s3") {
    auto error = ErrorClassifier::classify(Provider::Type::S3, 404, nullopt, "<Error><Code>NoSuchBucket</Code><Message>The bucket does not exist</Message></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::ContainerNotFound);
    REQUIRE(dynamic_cast<ContainerNotFoundError*>(error.get()));
    REQUIRE(error->getMessage() == "The bucket does not exist");
    REQUIRE(string(error->what()) == "The bucket does not exist");

    error = ErrorClassifier::classify(Provider::Type::S3, 404, "Not Found", "<Error><Code>NoSuchKey</Code></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    REQUIRE(string(error->what()) == "Not Found");

    error = ErrorClassifier::classify(Provider::Type::S3, 403, "Forbidden", "<Error><Code>AccessDenied</Code><Message>Access Denied</Message></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::AuthenticationFailed);
    REQUIRE(error->getExtraInfo() == "AccessDenied");
    REQUIRE(string(error->what()) == "Forbidden (AccessDenied)");
    REQUIRE(!error->isRetryable());

    error = ErrorClassifier::classify(Provider::Type::S3, 503, "Slow Down", "<Error><Code>SlowDown</Code></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::Retryable);
    REQUIRE(error->isRetryable());

    error = ErrorClassifier::classify(Provider::Type::S3, 416, nullopt, "<Error><Code>InvalidRange</Code></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::NonRetryable);

    // Unparsable bodies fall back to the status code and keep the body
    error = ErrorClassifier::classify(Provider::Type::S3, 404, nullopt, "<html>NoSuchBucket");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    REQUIRE(error->getRawBody() == "<html>NoSuchBucket");
    REQUIRE(!error->getMessage());

    error = ErrorClassifier::classify(Provider::Type::S3, 404, nullopt, "<Error><Code>NoSuchBucket</Code>");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    REQUIRE(error->getRawBody() == "<Error><Code>NoSuchBucket</Code>");

    error = ErrorClassifier::classify(Provider::Type::S3, 404, nullopt, "<Error><Code>NoSuchBucket</Code><Message>a & b</Message></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    REQUIRE(!error->getMessage());

    error = ErrorClassifier::classify(Provider::Type::S3, 403, nullopt, "<Error><Code>AccessDenied</Code>");
    REQUIRE(error->getKind() == BlobError::Kind::AuthenticationFailed);
    REQUIRE(!error->getExtraInfo());

    error = ErrorClassifier::classify(Provider::Type::S3, 404, nullopt, "<Error><Code>NoSuchBucket</Code><Message>Tom &#38; Jerry</Message></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::ContainerNotFound);
    REQUIRE(error->getMessage() == "Tom & Jerry");
}
//---------------------------------------------------------------------------
TEST_CASE("error_classifier_azure") {
    auto body = "<?xml version=\"1.0\" encoding=\"utf-8\"?><Error><Code>AuthenticationFailed</Code><Message>Server failed to authenticate the request.</Message><AuthenticationErrorDetail>Signature not valid in the specified time frame</AuthenticationErrorDetail></Error>";
    auto error = ErrorClassifier::classify(Provider::Type::Azure, 403, nullopt, body);
    REQUIRE(error->getKind() == BlobError::Kind::AuthenticationFailed);
    REQUIRE(dynamic_cast<AuthenticationFailedError*>(error.get()));
    REQUIRE(error->getExtraInfo() == "Signature not valid in the specified time frame");
    REQUIRE(error->getMessage() == "Server failed to authenticate the request.");

    error = ErrorClassifier::classify(Provider::Type::Azure, 404, nullopt, "<Error><Code>ContainerNotFound</Code></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::ContainerNotFound);
    error = ErrorClassifier::classify(Provider::Type::Azure, 404, nullopt, "<Error><Code>BlobNotFound</Code></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    // The authentication detail is only kept for 403
    error = ErrorClassifier::classify(Provider::Type::Azure, 400, nullopt, "<Error><Code>InvalidQueryParameterValue</Code><AuthenticationErrorDetail>x</AuthenticationErrorDetail></Error>");
    REQUIRE(error->getKind() == BlobError::Kind::NonRetryable);
    REQUIRE(!error->getExtraInfo());

    // A truncated document carries no code
    error = ErrorClassifier::classify(Provider::Type::Azure, 404, nullopt, "<Error><Code>ContainerNotFound</Code><Message>gone");
    REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
    REQUIRE(!error->getMessage());

    error = ErrorClassifier::classify(Provider::Type::Azure, 500, nullopt, "");
    REQUIRE(error->getKind() == BlobError::Kind::Retryable);
    REQUIRE(string(error->what()) == "500");
}
//---------------------------------------------------------------------------
TEST_CASE("error_classifier_generic") {
    for (auto type : {Provider::Type::GCP, Provider::Type::Generic}) {
        // Bodies are never parsed, containers are never distinguished
        auto error = ErrorClassifier::classify(type, 404, nullopt, "<Error><Code>NoSuchBucket</Code></Error>");
        REQUIRE(error->getKind() == BlobError::Kind::BlobNotFound);
        REQUIRE(!error->getMessage());
        REQUIRE(ErrorClassifier::classify(type, 403, nullopt, "anything")->getKind() == BlobError::Kind::AuthenticationFailed);
        REQUIRE(ErrorClassifier::classify(type, 502, nullopt, "")->getKind() == BlobError::Kind::Retryable);
        REQUIRE(ErrorClassifier::classify(type, 400, nullopt, "")->getKind() == BlobError::Kind::NonRetryable);
        REQUIRE(ErrorClassifier::classify(type, 304, nullopt, "")->getKind() == BlobError::Kind::NonRetryable);
    }

    // Invalid UTF-8 in the raw body is replaced
    auto error = ErrorClassifier::classify(Provider::Type::Generic, 400, nullopt, "bad\xFF");
    REQUIRE(error->getRawBody() == "bad\xEF\xBF\xBD");
    REQUIRE(error->getProvider() == Provider::Type::Generic);
    REQUIRE(error->getStatusCode() == 400);
}
//---------------------------------------------------------------------------
TEST_CASE("error_classifier_raise") {
    network::HttpResponse response;
    response.status = 404;
    response.reason = "";
    response.body = "<Error><Code>NoSuchKey</Code><Message>gone</Message></Error>";
    auto error = ErrorClassifier::classify(Provider::Type::S3, response);
    REQUIRE(!error->getReason());

    // The dynamic type is thrown
    REQUIRE_THROWS_AS(error->raise(), BlobNotFoundError);
    REQUIRE_THROWS_AS(error->raise(), NonRetryableBlobError);
    REQUIRE_THROWS_AS(error->raise(), BlobError);
    REQUIRE_THROWS_WITH(error->raise(), "gone");

    auto retryable = BlobError::make(BlobError::Kind::Retryable, BlobError::Details{});
    REQUIRE_THROWS_AS(retryable->raise(), RetryableBlobError);
    REQUIRE(string(BlobError::getKindName(retryable->getKind())) == "Retryable");
}
//---------------------------------------------------------------------------
} // namespace test
} // namespace cloud
} // namespace urlblob
