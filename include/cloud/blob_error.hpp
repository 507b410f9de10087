#pragma once
#include "cloud/provider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
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
namespace cloud {
//---------------------------------------------------------------------------
/// A failure reported by the storage server
class BlobError : public std::runtime_error {
    public:
    /// The error kinds, from the most specific to the least specific
    enum class Kind : uint8_t {
        ContainerNotFound,
        BlobNotFound,
        AuthenticationFailed,
        Retryable,
        NonRetryable
    };

    /// The payload of every error
    struct Details {
        /// The provider of the url
        Provider::Type provider = Provider::Type::Generic;
        /// The http status code
        uint16_t statusCode = 0;
        /// The reason phrase of the status line
        std::optional<std::string> reason;
        /// The message extracted from the body
        std::optional<std::string> message;
        /// Provider specific details, e.g., the S3 error code
        std::optional<std::string> extraInfo;
        /// The undecoded body text
        std::optional<std::string> rawBody;
    };

    /// Get the kind name
    static constexpr auto getKindName(Kind kind) noexcept {
        switch (kind) {
            case Kind::ContainerNotFound: return "ContainerNotFound";
            case Kind::BlobNotFound: return "BlobNotFound";
            case Kind::AuthenticationFailed: return "AuthenticationFailed";
            case Kind::Retryable: return "Retryable";
            case Kind::NonRetryable: return "NonRetryable";
            default: return "Unknown";
        }
    }

    protected:
    /// The kind
    Kind _kind;
    /// The details
    Details _details;

    /// The constructor
    BlobError(Kind kind, Details details);

    public:
    /// The destructor
    ~BlobError() noexcept override = default;

    /// Get the kind
    [[nodiscard]] Kind getKind() const noexcept { return _kind; }
    /// Get the provider
    [[nodiscard]] Provider::Type getProvider() const noexcept { return _details.provider; }
    /// Get the status code
    [[nodiscard]] uint16_t getStatusCode() const noexcept { return _details.statusCode; }
    /// Get the reason phrase
    [[nodiscard]] const std::optional<std::string>& getReason() const noexcept { return _details.reason; }
    /// Get the server message
    [[nodiscard]] const std::optional<std::string>& getMessage() const noexcept { return _details.message; }
    /// Get the extra info
    [[nodiscard]] const std::optional<std::string>& getExtraInfo() const noexcept { return _details.extraInfo; }
    /// Get the raw body
    [[nodiscard]] const std::optional<std::string>& getRawBody() const noexcept { return _details.rawBody; }
    /// Should a retry policy consider reattempting?
    [[nodiscard]] bool isRetryable() const noexcept { return _kind == Kind::Retryable; }

    /// Throws the error as its dynamic type
    [[noreturn]] virtual void raise() const = 0;

    /// Builds the error of the kind
    [[nodiscard]] static std::unique_ptr<BlobError> make(Kind kind, Details details);
    /// Builds the human readable description
    [[nodiscard]] static std::string describe(const Details& details);
};
//---------------------------------------------------------------------------
/// Server side failure (5xx)
class RetryableBlobError : public BlobError {
    public:
    /// The constructor
    explicit RetryableBlobError(Details details) : BlobError(Kind::Retryable, std::move(details)) {}
    /// Throws the error
    [[noreturn]] void raise() const override { throw *this; }
};
//---------------------------------------------------------------------------
/// Any failure a retry does not fix
class NonRetryableBlobError : public BlobError {
    protected:
    /// The constructor for specializations
    NonRetryableBlobError(Kind kind, Details details) : BlobError(kind, std::move(details)) {}

    public:
    /// The constructor
    explicit NonRetryableBlobError(Details details) : BlobError(Kind::NonRetryable, std::move(details)) {}
    /// Throws the error
    [[noreturn]] void raise() const override { throw *this; }
};
//---------------------------------------------------------------------------
/// The container or bucket does not exist
class ContainerNotFoundError : public NonRetryableBlobError {
    public:
    /// The constructor
    explicit ContainerNotFoundError(Details details) : NonRetryableBlobError(Kind::ContainerNotFound, std::move(details)) {}
    /// Throws the error
    [[noreturn]] void raise() const override { throw *this; }
};
//---------------------------------------------------------------------------
/// The object does not exist
class BlobNotFoundError : public NonRetryableBlobError {
    public:
    /// The constructor
    explicit BlobNotFoundError(Details details) : NonRetryableBlobError(Kind::BlobNotFound, std::move(details)) {}
    /// Throws the error
    [[noreturn]] void raise() const override { throw *this; }
};
//---------------------------------------------------------------------------
/// The url is not authorized
class AuthenticationFailedError : public NonRetryableBlobError {
    public:
    /// The constructor
    explicit AuthenticationFailedError(Details details) : NonRetryableBlobError(Kind::AuthenticationFailed, std::move(details)) {}
    /// Throws the error
    [[noreturn]] void raise() const override { throw *this; }
};
//---------------------------------------------------------------------------
/// A local contract violation, never retryable
class UsageError : public std::logic_error {
    public:
    using std::logic_error::logic_error;
};
//---------------------------------------------------------------------------
/// A relative range and explicit bounds were given together
class ConflictingRangeError : public UsageError {
    public:
    /// The constructor
    ConflictingRangeError() : UsageError("Cannot specify both byte_range and start/end parameters") {}
};
//---------------------------------------------------------------------------
/// A range that has no http representation
class InvalidRangeError : public UsageError {
    public:
    using UsageError::UsageError;
};
//---------------------------------------------------------------------------
/// A response header is absent or malformed
class HeaderError : public UsageError {
    public:
    using UsageError::UsageError;
};
//---------------------------------------------------------------------------
} // namespace cloud
} // namespace urlblob
