#include "cloud/error_classifier.hpp"
#include "network/http_response.hpp"
#include "utils/utf8.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
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
//---------------------------------------------------------------------------
using namespace std;
using Code = network::HttpResponse::Code;
//---------------------------------------------------------------------------
unique_ptr<BlobError> ErrorClassifier::classify(Provider::Type type, uint16_t statusCode, optional<string_view> reason, string_view body)
// Classify a failed response
{
    BlobError::Details details;
    details.provider = type;
    details.statusCode = statusCode;
    if (reason)
        details.reason = string(*reason);
    details.rawBody = utils::Utf8::decodeLossy(body);

    switch (type) {
        case Provider::Type::S3: return classifyS3(move(details), body);
        case Provider::Type::Azure: return classifyAzure(move(details), body);
        default: return classifyGeneric(move(details));
    }
}
//---------------------------------------------------------------------------
unique_ptr<BlobError> ErrorClassifier::classify(Provider::Type type, const network::HttpResponse& response)
// Classify a failed response
{
    optional<string_view> reason;
    if (!response.reason.empty())
        reason = response.reason;
    return classify(type, response.status, reason, response.body);
}
//---------------------------------------------------------------------------
unique_ptr<BlobError> ErrorClassifier::classifyS3(BlobError::Details details, string_view body)
// S3 distinguishes missing buckets by the error code
{
    optional<string> code;
    if (auto xml = parseXmlError(body)) {
        code = move(xml->code);
        details.message = move(xml->message);
    }

    auto status = static_cast<Code>(details.statusCode);
    if (status == Code::NOT_FOUND_404) {
        if (code == "NoSuchBucket")
            return BlobError::make(BlobError::Kind::ContainerNotFound, move(details));
        return BlobError::make(BlobError::Kind::BlobNotFound, move(details));
    } else if (status == Code::FORBIDDEN_403) {
        details.extraInfo = move(code);
        return BlobError::make(BlobError::Kind::AuthenticationFailed, move(details));
    } else if (details.statusCode >= 500) {
        return BlobError::make(BlobError::Kind::Retryable, move(details));
    }
    return BlobError::make(BlobError::Kind::NonRetryable, move(details));
}
//---------------------------------------------------------------------------
unique_ptr<BlobError> ErrorClassifier::classifyAzure(BlobError::Details details, string_view body)
// Azure distinguishes missing containers by the error code and explains authentication failures
{
    auto xml = parseXmlError(body);
    optional<string> code;
    if (xml) {
        code = xml->code;
        details.message = xml->message;
    }

    auto status = static_cast<Code>(details.statusCode);
    if (status == Code::NOT_FOUND_404) {
        if (code == "ContainerNotFound")
            return BlobError::make(BlobError::Kind::ContainerNotFound, move(details));
        return BlobError::make(BlobError::Kind::BlobNotFound, move(details));
    } else if (status == Code::FORBIDDEN_403) {
        if (xml)
            details.extraInfo = move(xml->authenticationDetail);
        return BlobError::make(BlobError::Kind::AuthenticationFailed, move(details));
    } else if (details.statusCode >= 500) {
        return BlobError::make(BlobError::Kind::Retryable, move(details));
    }
    return BlobError::make(BlobError::Kind::NonRetryable, move(details));
}
//---------------------------------------------------------------------------
unique_ptr<BlobError> ErrorClassifier::classifyGeneric(BlobError::Details details)
// Without a body format only the status code is available
{
    auto status = static_cast<Code>(details.statusCode);
    if (status == Code::FORBIDDEN_403)
        return BlobError::make(BlobError::Kind::AuthenticationFailed, move(details));
    else if (status == Code::NOT_FOUND_404)
        return BlobError::make(BlobError::Kind::BlobNotFound, move(details));
    else if (details.statusCode >= 500)
        return BlobError::make(BlobError::Kind::Retryable, move(details));
    return BlobError::make(BlobError::Kind::NonRetryable, move(details));
}
//---------------------------------------------------------------------------
optional<ErrorClassifier::XmlError> ErrorClassifier::parseXmlError(string_view body)
// Parse an error document, every field is only trusted once the whole document is well-formed
{
    static constexpr string_view byteOrderMark = "\xEF\xBB\xBF";
    if (body.starts_with(byteOrderMark))
        body.remove_prefix(byteOrderMark.size());
    if (utils::Utf8::validate(body))
        return nullopt;
    body = utils::trim(body);
    if (!body.starts_with('<'))
        return nullopt;

    /// An open element
    struct Element {
        /// The name
        string_view name;
        /// The text in front of the first child
        string text;
        /// Was a child seen?
        bool childSeen = false;
        /// The field that receives the text
        optional<string>* target = nullptr;
    };

    XmlError error;
    // The first descendant with the name below the root fills the field
    pair<string_view, optional<string>*> fields[] = {{"Code", &error.code}, {"Message", &error.message}, {"AuthenticationErrorDetail", &error.authenticationDetail}};
    bool claimed[] = {false, false, false};
    auto claim = [&](string_view name) -> optional<string>* {
        for (auto i = 0u; i < size(fields); i++) {
            if (!claimed[i] && fields[i].first == name) {
                claimed[i] = true;
                return fields[i].second;
            }
        }
        return nullptr;
    };

    vector<Element> open;
    bool rootSeen = false, rootClosed = false;
    uint64_t pos = 0;
    while (pos < body.size()) {
        auto rest = body.substr(pos);
        if (rest.front() != '<') {
            auto length = min(rest.find('<'), rest.size());
            auto raw = rest.substr(0, length);
            if (open.empty()) {
                // Only whitespace may surround the root
                if (!utils::trim(raw).empty())
                    return nullopt;
            } else {
                auto text = unescape(raw);
                if (!text)
                    return nullopt;
                if (!open.back().childSeen)
                    open.back().text += *text;
            }
            pos += length;
        } else if (rest.starts_with("<!--")) {
            auto end = rest.find("-->", 4);
            if (end == rest.npos)
                return nullopt;
            pos += end + 3;
        } else if (rest.starts_with("<![CDATA[")) {
            auto end = rest.find("]]>", 9);
            if (end == rest.npos || open.empty())
                return nullopt;
            if (!open.back().childSeen)
                open.back().text += rest.substr(9, end - 9);
            pos += end + 3;
        } else if (rest.starts_with("<?")) {
            auto end = rest.find("?>", 2);
            if (end == rest.npos)
                return nullopt;
            pos += end + 2;
        } else if (rest.starts_with("<!")) {
            auto length = declarationLength(rest);
            if (!length || rootSeen)
                return nullopt;
            pos += *length;
        } else if (rest.starts_with("</")) {
            auto length = nameLength(rest.substr(2));
            if (!length || open.empty() || open.back().name != rest.substr(2, length))
                return nullopt;
            auto tail = rest.substr(2 + length);
            auto trimmed = tail.substr(min(tail.find_first_not_of(" \t\r\n"), tail.size()));
            if (!trimmed.starts_with('>'))
                return nullopt;
            auto& element = open.back();
            if (element.target && !element.text.empty())
                *element.target = move(element.text);
            open.pop_back();
            rootClosed = open.empty();
            pos += rest.size() - trimmed.size() + 1;
        } else {
            // A start tag
            auto length = nameLength(rest.substr(1));
            if (!length || rootClosed)
                return nullopt;
            auto name = rest.substr(1, length);
            uint64_t cursor = 1 + length;
            bool selfClosing = false;
            while (true) {
                auto attributeStart = cursor;
                while (cursor < rest.size() && isspace(static_cast<unsigned char>(rest[cursor])))
                    cursor++;
                if (cursor >= rest.size())
                    return nullopt;
                if (rest[cursor] == '>') {
                    cursor++;
                    break;
                }
                if (rest.substr(cursor).starts_with("/>")) {
                    cursor += 2;
                    selfClosing = true;
                    break;
                }
                // Attributes are separated by whitespace
                if (cursor == attributeStart)
                    return nullopt;
                auto attributeLength = nameLength(rest.substr(cursor));
                if (!attributeLength)
                    return nullopt;
                cursor += attributeLength;
                while (cursor < rest.size() && isspace(static_cast<unsigned char>(rest[cursor])))
                    cursor++;
                if (cursor >= rest.size() || rest[cursor] != '=')
                    return nullopt;
                cursor++;
                while (cursor < rest.size() && isspace(static_cast<unsigned char>(rest[cursor])))
                    cursor++;
                if (cursor >= rest.size() || (rest[cursor] != '"' && rest[cursor] != '\''))
                    return nullopt;
                auto valueEnd = rest.find(rest[cursor], cursor + 1);
                if (valueEnd == rest.npos)
                    return nullopt;
                auto value = rest.substr(cursor + 1, valueEnd - cursor - 1);
                if (value.find('<') != value.npos || !unescape(value))
                    return nullopt;
                cursor = valueEnd + 1;
            }

            if (!open.empty())
                open.back().childSeen = true;
            optional<string>* target = open.empty() ? nullptr : claim(name);
            rootSeen = true;
            if (selfClosing) {
                // An empty element has no text
                rootClosed = open.empty();
            } else {
                open.push_back(Element{name, {}, false, target});
            }
            pos += cursor;
        }
    }
    if (!rootClosed)
        return nullopt;
    return error;
}
//---------------------------------------------------------------------------
uint64_t ErrorClassifier::nameLength(string_view text) noexcept
// The length of the name
{
    static constexpr string_view delimiters = " \t\r\n<>/=\"'&;";
    auto length = min(text.find_first_of(delimiters), text.size());
    // Names never start with a digit or a hyphen
    if (length && (isdigit(static_cast<unsigned char>(text.front())) || text.front() == '-' || text.front() == '.'))
        return 0;
    return length;
}
//---------------------------------------------------------------------------
optional<uint64_t> ErrorClassifier::declarationLength(string_view text) noexcept
// Skip a declaration like <!DOCTYPE Error [ ... ]>
{
    unsigned depth = 0;
    char quote = 0;
    for (uint64_t pos = 2; pos < text.size(); pos++) {
        auto c = text[pos];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            depth++;
        } else if (c == ']') {
            if (!depth)
                return nullopt;
            depth--;
        } else if (c == '>' && !depth) {
            return pos + 1;
        }
    }
    return nullopt;
}
//---------------------------------------------------------------------------
optional<string> ErrorClassifier::unescape(string_view text)
// Decode the entity and character references
{
    static constexpr pair<string_view, char> entities[] = {{"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''}};

    string result;
    result.reserve(text.size());
    while (!text.empty()) {
        auto ampersand = text.find('&');
        result.append(text.substr(0, ampersand));
        if (ampersand == text.npos)
            break;
        text.remove_prefix(ampersand + 1);

        auto semicolon = text.find(';');
        if (semicolon == text.npos)
            return nullopt;
        auto reference = text.substr(0, semicolon);
        text.remove_prefix(semicolon + 1);

        if (reference.starts_with('#')) {
            // A character reference, decimal or hexadecimal
            auto digits = reference.substr(1);
            unsigned base = 10;
            if (digits.starts_with('x')) {
                digits.remove_prefix(1);
                base = 16;
            }
            if (digits.empty() || digits.size() > 8)
                return nullopt;
            uint32_t codePoint = 0;
            for (auto c : digits) {
                unsigned digit;
                if (c >= '0' && c <= '9')
                    digit = static_cast<unsigned>(c - '0');
                else if (base == 16 && c >= 'a' && c <= 'f')
                    digit = static_cast<unsigned>(c - 'a' + 10);
                else if (base == 16 && c >= 'A' && c <= 'F')
                    digit = static_cast<unsigned>(c - 'A' + 10);
                else
                    return nullopt;
                codePoint = codePoint * base + digit;
            }
            // Xml does not allow the null character
            if (!codePoint)
                return nullopt;
            auto encoded = utils::Utf8::encode(codePoint);
            if (!encoded)
                return nullopt;
            result += *encoded;
            continue;
        }

        auto matched = false;
        for (auto& [entity, replacement] : entities) {
            if (reference == entity) {
                result.push_back(replacement);
                matched = true;
                break;
            }
        }
        if (!matched)
            return nullopt;
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
