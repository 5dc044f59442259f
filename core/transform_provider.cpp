#include "transform_provider.hpp"
#include "../compression/zlib_codec.hpp"
#include "../crypto/cipher.hpp"

#include <stdexcept>

namespace qrreceive {

void StaticKeyStore::add(const std::string& key_ref, KeyMaterial material) {
    keys_[key_ref] = std::move(material);
}

std::optional<KeyMaterial> StaticKeyStore::find(const std::string& key_ref) const {
    auto it = keys_.find(key_ref);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PlatformTransformProvider::PlatformTransformProvider(size_t max_decompressed_bytes)
    : max_decompressed_bytes_(max_decompressed_bytes) {}

Result<std::vector<uint8_t>> PlatformTransformProvider::decrypt(const std::string& algorithm,
                                                                const KeyMaterial& key,
                                                                const std::vector<uint8_t>& data) {
    auto parsed = crypto::parse_cipher_algorithm(algorithm);
    if (!parsed) {
        return QRRECEIVE_ERROR(ErrorCategory::CRYPTO, ErrorCode::UNSUPPORTED_ALGORITHM,
                               "unsupported encryption algorithm '" + algorithm + "'");
    }
    if (key.key.size() != crypto::SymmetricCipher::key_size()) {
        return QRRECEIVE_ERROR(ErrorCategory::CRYPTO, ErrorCode::DECRYPTION_FAILED,
                               algorithm + " needs a " + std::to_string(crypto::SymmetricCipher::key_size()) +
                               " byte key, got " + std::to_string(key.key.size()));
    }

    crypto::SymmetricCipher cipher(*parsed, key.key);
    return cipher.decrypt(data, key.aad);
}

Result<std::vector<uint8_t>> PlatformTransformProvider::decompress(const std::string& algorithm,
                                                                   const std::vector<uint8_t>& data) {
    auto format = compression::parse_zlib_format(algorithm);
    if (!format) {
        return QRRECEIVE_ERROR(ErrorCategory::COMPRESSION, ErrorCode::UNSUPPORTED_ALGORITHM,
                               "unsupported compression algorithm '" + algorithm + "'");
    }
    try {
        return compression::inflate_buffer(data, *format, max_decompressed_bytes_);
    } catch (const std::runtime_error& e) {
        return QRRECEIVE_ERROR(ErrorCategory::COMPRESSION, ErrorCode::DECOMPRESSION_FAILED, e.what());
    }
}

} // namespace qrreceive
