#pragma once
#include <stdexcept>
#include <string>

namespace maxproxy {

// Caller input is missing required fields or is not valid JSON.
class MalformedRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Base for failures to obtain an access credential; surfaced as HTTP 401.
class CredentialError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No credential source yielded a token.
class CredentialUnavailable : public CredentialError {
public:
    using CredentialError::CredentialError;
};

// Refresh failed and the cached credential is past its expiry.
class CredentialExpired : public CredentialError {
public:
    using CredentialError::CredentialError;
};

// Non-success status from the upstream. Status and body are forwarded verbatim.
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(long status, std::string body)
        : std::runtime_error("Upstream API error (HTTP " + std::to_string(status) + ")"),
          status_(status), body_(std::move(body)) {}

    long status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

} // namespace maxproxy
