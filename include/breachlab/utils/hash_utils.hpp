/**
 * @file hash_utils.hpp
 * @brief Keyed hashing, constant-time comparison and random token utilities
 *
 * Thin wrappers over OpenSSL used by the flag system and the session
 * registry: HMAC-SHA256 message authentication, SHA-256 digests, timing-safe
 * equality and cryptographically secure random identifiers.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace breachlab {
namespace utils {

/**
 * @class HashUtils
 * @brief Static cryptographic helpers backed by OpenSSL
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string mac = HashUtils::ComputeHmacSHA256(secret, "web-xss-01:alice:1700000000");
 * bool same = HashUtils::ConstantTimeEquals(mac, expected);
 * std::string session_id = HashUtils::RandomHex(8);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute HMAC-SHA256 of a message
     * @param key Secret key (raw bytes)
     * @param message Message to authenticate
     * @return Lowercase hex digest (64 characters)
     *
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string ComputeHmacSHA256(const std::string& key, const std::string& message);

    /**
     * @brief Compute SHA-256 digest of a string
     * @param data Input data
     * @return Lowercase hex digest
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Compare two strings without data-dependent early exit
     *
     * A length mismatch returns false after a full-length comparison of the
     * submitted value against itself, so the position of the first differing
     * byte is never observable through timing.
     *
     * @param expected Reference value
     * @param submitted Untrusted value
     * @return true if both strings are byte-identical
     */
    static bool ConstantTimeEquals(const std::string& expected, const std::string& submitted);

    /**
     * @brief Generate random bytes from the OpenSSL CSPRNG
     * @param count Number of bytes
     * @return Random bytes
     *
     * @throws std::runtime_error if the generator is not seeded
     */
    static std::vector<uint8_t> RandomBytes(std::size_t count);

    /**
     * @brief Generate a random lowercase hex token
     * @param num_bytes Entropy in bytes (token length is twice this)
     * @return Hex string
     */
    static std::string RandomHex(std::size_t num_bytes);

    /**
     * @brief Convert binary buffer to lowercase hex
     */
    static std::string BytesToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace breachlab
