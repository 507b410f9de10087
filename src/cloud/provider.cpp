#include "cloud/provider.hpp"
#include <regex>
#include <stdexcept>
#include <string>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
// S3 compatible hostnames (AWS regional, AWS global, Hetzner)
const regex s3Pattern(R"((\.s3\.[a-z0-9-]+\.amazonaws\.com)|(s3\.amazonaws\.com)|(\.your-objectstorage\.com))");
// GCP compatible hostnames
const regex gcpPattern(R"((\.storage\.googleapis\.com)|(storage\.cloud\.google\.com))");
// Azure compatible hostnames
const regex azurePattern(R"((\.blob\.core\.windows\.net))");
//---------------------------------------------------------------------------
bool search(string_view url, const regex& pattern)
// Search the pattern anywhere in the url
{
    return regex_search(url.begin(), url.end(), pattern);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
bool Provider::isS3Compatible(string_view url)
// Is the url served by an S3 compatible storage?
{
    return search(url, s3Pattern);
}
//---------------------------------------------------------------------------
bool Provider::isGCPCompatible(string_view url)
// Is the url served by a GCP compatible storage?
{
    return search(url, gcpPattern);
}
//---------------------------------------------------------------------------
bool Provider::isAzureCompatible(string_view url)
// Is the url served by an Azure compatible storage?
{
    return search(url, azurePattern);
}
//---------------------------------------------------------------------------
Provider::Type Provider::detect(string_view url)
// Detect the provider, S3 before GCP before Azure
{
    if (isS3Compatible(url))
        return Type::S3;
    if (isGCPCompatible(url))
        return Type::GCP;
    if (isAzureCompatible(url))
        return Type::Azure;
    return Type::Generic;
}
//---------------------------------------------------------------------------
Provider::Type Provider::parseType(string_view name)
// Parse a provider name or alias
{
    static constexpr pair<string_view, Type> names[] = {
        {"s3", Type::S3},
        {"gcp", Type::GCP},
        {"azure", Type::Azure},
        {"generic", Type::Generic},
        {"aws", Type::S3},
        {"aws_s3", Type::S3},
        {"google", Type::GCP},
        {"az", Type::Azure},
        {"windows", Type::Azure}};

    for (auto& [alias, type] : names)
        if (utils::iequals(alias, name))
            return type;

    string message = "Invalid URL type: " + string(name) + ". Valid types: ";
    for (auto type : {Type::S3, Type::GCP, Type::Azure, Type::Generic}) {
        if (type != Type::S3)
            message += ", ";
        message += getTypeName(type);
    }
    throw invalid_argument(message);
}
//---------------------------------------------------------------------------
Provider::Headers Provider::putHeaders(Type type, const optional<string>& contentType)
// Builds the headers for uploading an object
{
    Headers headers;
    if (contentType && !contentType->empty())
        headers.emplace("Content-Type", *contentType);
    // Azure refuses writes without the blob type
    if (type == Type::Azure)
        headers.emplace("x-ms-blob-type", "BlockBlob");
    return headers;
}
//---------------------------------------------------------------------------
} // namespace urlblob::cloud
