#ifndef QRRECEIVE_TRANSFORM_PROVIDER_HPP
#define QRRECEIVE_TRANSFORM_PROVIDER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "error_handling.hpp"

namespace qrreceive {

/**
 * @brief Key bytes and associated data for one key reference
 */
struct KeyMaterial {
    std::vector<uint8_t> key;
    std::vector<uint8_t> aad;
};

/**
 * @brief Resolves the key reference carried in the header
 */
class KeyStore {
public:
    virtual ~KeyStore() = default;
    virtual std::optional<KeyMaterial> find(const std::string& key_ref) const = 0;
};

/**
 * @brief In-memory key table; the empty reference names the default key
 */
class StaticKeyStore : public KeyStore {
public:
    void add(const std::string& key_ref, KeyMaterial material);
    std::optional<KeyMaterial> find(const std::string& key_ref) const override;
    size_t size() const { return keys_.size(); }

private:
    std::map<std::string, KeyMaterial> keys_;
};

/**
 * @brief Platform crypto / compression collaborator
 *
 * Algorithms are named by their wire identifiers. Unknown identifiers fail
 * with UNSUPPORTED_ALGORITHM.
 */
class TransformProvider {
public:
    virtual ~TransformProvider() = default;

    virtual Result<std::vector<uint8_t>> decrypt(const std::string& algorithm,
                                                 const KeyMaterial& key,
                                                 const std::vector<uint8_t>& data) = 0;

    virtual Result<std::vector<uint8_t>> decompress(const std::string& algorithm,
                                                    const std::vector<uint8_t>& data) = 0;
};

/**
 * @brief OpenSSL EVP ciphers and zlib
 *
 * decrypt: aes-256-gcm, aes-256-cbc, chacha20-poly1305.
 * decompress: gzip, deflate (raw), zlib.
 */
class PlatformTransformProvider : public TransformProvider {
public:
    explicit PlatformTransformProvider(size_t max_decompressed_bytes = 1024ull * 1024 * 1024);

    Result<std::vector<uint8_t>> decrypt(const std::string& algorithm,
                                         const KeyMaterial& key,
                                         const std::vector<uint8_t>& data) override;

    Result<std::vector<uint8_t>> decompress(const std::string& algorithm,
                                            const std::vector<uint8_t>& data) override;

private:
    size_t max_decompressed_bytes_;
};

} // namespace qrreceive

#endif // QRRECEIVE_TRANSFORM_PROVIDER_HPP
