#include "signature.hpp"
#include "util.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace convtrack {

static constexpr const char* kPrefix = "sha256=";
static constexpr size_t kPrefixLen = 7;

bool is_unauthorized(SignatureResult result) {
    return result == SignatureResult::MissingHeader ||
           result == SignatureResult::MalformedHeader ||
           result == SignatureResult::Mismatch;
}

const char* signature_result_name(SignatureResult result) {
    switch (result) {
        case SignatureResult::Valid:               return "valid";
        case SignatureResult::MissingHeader:       return "missing header";
        case SignatureResult::MalformedHeader:     return "malformed header";
        case SignatureResult::Mismatch:            return "digest mismatch";
        case SignatureResult::SecretNotConfigured: return "secret not configured";
    }
    return "unknown";
}

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             digest, &digest_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return hex_encode(digest, digest_len);
}

std::string signature_header_for(const std::string& body, const std::string& secret) {
    return std::string(kPrefix) + hmac_sha256_hex(secret, body);
}

SignatureResult verify_signature(const std::string& body,
                                 const std::string& header,
                                 const std::string& secret) {
    if (secret.empty()) return SignatureResult::SecretNotConfigured;
    if (header.empty()) return SignatureResult::MissingHeader;
    if (header.compare(0, kPrefixLen, kPrefix) != 0 || header.size() == kPrefixLen) {
        return SignatureResult::MalformedHeader;
    }

    std::string provided = to_lower(header.substr(kPrefixLen));
    std::string expected = hmac_sha256_hex(secret, body);

    // Length is public (always 64 for SHA-256), only the content must not leak.
    if (provided.size() != expected.size()) return SignatureResult::Mismatch;
    if (CRYPTO_memcmp(provided.data(), expected.data(), expected.size()) != 0) {
        return SignatureResult::Mismatch;
    }
    return SignatureResult::Valid;
}

} // namespace convtrack
