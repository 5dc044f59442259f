#ifndef QRRECEIVE_DIGEST_HPP
#define QRRECEIVE_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../core/error_handling.hpp"

namespace qrreceive::crypto {

// Hash prefix length carried on the wire (hex characters)
constexpr size_t TRUNCATED_HASH_LENGTH = 16;

std::string sha256_hex(const uint8_t* data, size_t size);
std::string sha256_hex(const std::vector<uint8_t>& data);

/**
 * @brief SHA-256 hex digest cut to the wire length
 */
std::string truncated_sha256(const std::vector<uint8_t>& data);

/**
 * @brief Case-insensitive prefix comparison of a computed digest with a declared one
 *
 * An empty declared hash always matches; a non-empty one needs at least
 * TRUNCATED_HASH_LENGTH characters.
 */
bool hash_matches(const std::string& computed_hex, const std::string& declared_hex);

std::string base64_encode(const std::vector<uint8_t>& data);
Result<std::vector<uint8_t>> base64_decode(const std::string& text);

std::string to_hex(const std::vector<uint8_t>& data);
Result<std::vector<uint8_t>> from_hex(const std::string& hex);

} // namespace qrreceive::crypto

#endif // QRRECEIVE_DIGEST_HPP
