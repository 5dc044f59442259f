#ifndef QRRECEIVE_CIPHER_HPP
#define QRRECEIVE_CIPHER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../core/error_handling.hpp"

namespace qrreceive::crypto {

enum class CipherAlgorithm {
    AES_256_GCM,
    AES_256_CBC,
    CHACHA20_POLY1305
};

/**
 * @brief Maps a wire identifier ("aes-256-gcm", ...) to an algorithm
 */
std::optional<CipherAlgorithm> parse_cipher_algorithm(const std::string& name);
std::string cipher_algorithm_name(CipherAlgorithm algorithm);

/**
 * @brief OpenSSL EVP backed symmetric cipher
 *
 * Sealed layout: iv || ciphertext || tag. CBC has no tag and uses PKCS#7 padding.
 * All algorithms take a 32 byte key.
 */
class SymmetricCipher {
public:
    SymmetricCipher(CipherAlgorithm algorithm, std::vector<uint8_t> key);

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext,
                                 const std::vector<uint8_t>& iv,
                                 const std::vector<uint8_t>& aad = {}) const;

    Result<std::vector<uint8_t>> decrypt(const std::vector<uint8_t>& sealed,
                                         const std::vector<uint8_t>& aad = {}) const;

    CipherAlgorithm algorithm() const { return algorithm_; }

    static size_t key_size() { return 32; }
    static size_t iv_size(CipherAlgorithm algorithm);
    static size_t tag_size(CipherAlgorithm algorithm);

    // Fresh IV from RAND_bytes
    static std::vector<uint8_t> random_iv(CipherAlgorithm algorithm);

private:
    CipherAlgorithm algorithm_;
    std::vector<uint8_t> key_;
};

} // namespace qrreceive::crypto

#endif // QRRECEIVE_CIPHER_HPP
