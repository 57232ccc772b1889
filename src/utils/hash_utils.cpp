/**
 * @file hash_utils.cpp
 * @brief Implementation of OpenSSL-backed hashing and token utilities
 *
 * @date 2025
 */

#include "breachlab/utils/hash_utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace breachlab {
namespace utils {

// ============================================================================
// ENCODING
// ============================================================================

std::string HashUtils::BytesToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// ============================================================================
// DIGESTS
// ============================================================================

std::string HashUtils::ComputeHmacSHA256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    auto* result = HMAC(EVP_sha256(),
                        key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                        digest, &digest_length);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return BytesToHex(digest, digest_length);
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BytesToHex(hash, SHA256_DIGEST_LENGTH);
}

// ============================================================================
// COMPARISON
// ============================================================================

bool HashUtils::ConstantTimeEquals(const std::string& expected, const std::string& submitted) {
    if (expected.size() != submitted.size()) {
        // Burn the same amount of work as a real comparison
        if (!submitted.empty()) {
            CRYPTO_memcmp(submitted.data(), submitted.data(), submitted.size());
        }
        return false;
    }
    if (expected.empty()) {
        return true;
    }
    return CRYPTO_memcmp(expected.data(), submitted.data(), expected.size()) == 0;
}

// ============================================================================
// RANDOMNESS
// ============================================================================

std::vector<uint8_t> HashUtils::RandomBytes(std::size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed: CSPRNG not available");
    }
    return bytes;
}

std::string HashUtils::RandomHex(std::size_t num_bytes) {
    auto bytes = RandomBytes(num_bytes);
    return BytesToHex(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace breachlab
