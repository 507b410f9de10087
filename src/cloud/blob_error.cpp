#include "cloud/blob_error.hpp"
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
BlobError::BlobError(Kind kind, Details details) : runtime_error(describe(details)), _kind(kind), _details(move(details))
// The constructor
{
}
//---------------------------------------------------------------------------
string BlobError::describe(const Details& details)
// The first non-empty of reason, message, body and status with the extra info
{
    string description;
    if (details.reason && !details.reason->empty())
        description = *details.reason;
    else if (details.message && !details.message->empty())
        description = *details.message;
    else if (details.rawBody && !details.rawBody->empty())
        description = *details.rawBody;
    else
        description = to_string(details.statusCode);

    if (details.extraInfo)
        description += " (" + *details.extraInfo + ")";
    return description;
}
//---------------------------------------------------------------------------
unique_ptr<BlobError> BlobError::make(Kind kind, Details details)
// Builds the error of the kind
{
    switch (kind) {
        case Kind::ContainerNotFound: return make_unique<ContainerNotFoundError>(move(details));
        case Kind::BlobNotFound: return make_unique<BlobNotFoundError>(move(details));
        case Kind::AuthenticationFailed: return make_unique<AuthenticationFailedError>(move(details));
        case Kind::Retryable: return make_unique<RetryableBlobError>(move(details));
        default: return make_unique<NonRetryableBlobError>(move(details));
    }
}
//---------------------------------------------------------------------------
} // namespace urlblob::cloud
