#include "cloud/blob_manager.hpp"
#include "network/socket_client.hpp"
#include <stdexcept>
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
//---------------------------------------------------------------------------
BlobManager::BlobManager(const network::Config& config) : _client(make_unique<network::SocketClient>(config))
// The constructor
{
}
//---------------------------------------------------------------------------
BlobManager::BlobManager(unique_ptr<network::HttpClient> client) : _client(move(client))
// The constructor
{
    if (!_client)
        throw invalid_argument("The blob manager needs a http client");
}
//---------------------------------------------------------------------------
Blob BlobManager::fromUrl(string url, optional<Provider::Type> type)
// Create the blob of an url
{
    return Blob(move(url), *_client, type);
}
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
