#pragma once
#include <string>

namespace convtrack {

// Outcome of checking an X-Hub-Signature-256 header against a request body.
enum class SignatureResult {
    Valid,
    MissingHeader,
    MalformedHeader,     // no "sha256=" prefix or empty digest
    Mismatch,
    SecretNotConfigured, // server-side configuration error, not the caller's fault
};

// True for the outcomes that mean the sender could not be authenticated.
bool is_unauthorized(SignatureResult result);

const char* signature_result_name(SignatureResult result);

// Lowercase hex HMAC-SHA256 of data keyed by key.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// "sha256=<hex>" for body, as the platform would send it.
std::string signature_header_for(const std::string& body, const std::string& secret);

// Verify header ("sha256=<hex>", may be empty when absent) for body.
// The digest comparison runs in constant time.
SignatureResult verify_signature(const std::string& body,
                                 const std::string& header,
                                 const std::string& secret);

} // namespace convtrack
