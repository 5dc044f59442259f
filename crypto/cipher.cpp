#include "cipher.hpp"
#include "openssl_raii.hpp"

#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace qrreceive::crypto {

namespace {

const EVP_CIPHER* evp_cipher(CipherAlgorithm algorithm) {
    switch (algorithm) {
        case CipherAlgorithm::AES_256_GCM: return EVP_aes_256_gcm();
        case CipherAlgorithm::AES_256_CBC: return EVP_aes_256_cbc();
        case CipherAlgorithm::CHACHA20_POLY1305: return EVP_chacha20_poly1305();
    }
    return nullptr;
}

bool is_aead(CipherAlgorithm algorithm) {
    return algorithm != CipherAlgorithm::AES_256_CBC;
}

ErrorInfo decrypt_error(const std::string& message) {
    return QRRECEIVE_ERROR(ErrorCategory::CRYPTO, ErrorCode::DECRYPTION_FAILED, message);
}

} // namespace

std::optional<CipherAlgorithm> parse_cipher_algorithm(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "aes-256-gcm") return CipherAlgorithm::AES_256_GCM;
    if (lower == "aes-256-cbc") return CipherAlgorithm::AES_256_CBC;
    if (lower == "chacha20-poly1305") return CipherAlgorithm::CHACHA20_POLY1305;
    return std::nullopt;
}

std::string cipher_algorithm_name(CipherAlgorithm algorithm) {
    switch (algorithm) {
        case CipherAlgorithm::AES_256_GCM: return "aes-256-gcm";
        case CipherAlgorithm::AES_256_CBC: return "aes-256-cbc";
        case CipherAlgorithm::CHACHA20_POLY1305: return "chacha20-poly1305";
    }
    return "unknown";
}

size_t SymmetricCipher::iv_size(CipherAlgorithm algorithm) {
    return algorithm == CipherAlgorithm::AES_256_CBC ? 16 : 12;
}

size_t SymmetricCipher::tag_size(CipherAlgorithm algorithm) {
    return is_aead(algorithm) ? 16 : 0;
}

std::vector<uint8_t> SymmetricCipher::random_iv(CipherAlgorithm algorithm) {
    std::vector<uint8_t> iv(iv_size(algorithm));
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return iv;
}

SymmetricCipher::SymmetricCipher(CipherAlgorithm algorithm, std::vector<uint8_t> key)
    : algorithm_(algorithm), key_(std::move(key)) {
    if (key_.size() != key_size()) {
        throw std::invalid_argument("cipher key must be " + std::to_string(key_size()) + " bytes");
    }
}

std::vector<uint8_t> SymmetricCipher::encrypt(const std::vector<uint8_t>& plaintext,
                                              const std::vector<uint8_t>& iv,
                                              const std::vector<uint8_t>& aad) const {
    if (iv.size() != iv_size(algorithm_)) {
        throw std::invalid_argument("wrong IV length for " + cipher_algorithm_name(algorithm_));
    }

    CipherCtx ctx;
    const bool aead = is_aead(algorithm_);

    if (EVP_EncryptInit_ex(ctx.get(), evp_cipher(algorithm_), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }
    if (aead && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                                    static_cast<int>(iv.size()), nullptr) != 1) {
        throw std::runtime_error("setting AEAD IV length failed");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex key setup failed");
    }

    int len = 0;
    if (aead && !aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        throw std::runtime_error("AAD update failed");
    }

    std::vector<uint8_t> out(iv);
    const size_t header = out.size();
    out.resize(header + plaintext.size() + EVP_MAX_BLOCK_LENGTH);

    if (EVP_EncryptUpdate(ctx.get(), out.data() + header, &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    size_t total = header + static_cast<size_t>(len);

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    total += static_cast<size_t>(len);
    out.resize(total);

    if (aead) {
        std::vector<uint8_t> tag(tag_size(algorithm_));
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                                static_cast<int>(tag.size()), tag.data()) != 1) {
            throw std::runtime_error("reading AEAD tag failed");
        }
        out.insert(out.end(), tag.begin(), tag.end());
    }
    return out;
}

Result<std::vector<uint8_t>> SymmetricCipher::decrypt(const std::vector<uint8_t>& sealed,
                                                      const std::vector<uint8_t>& aad) const {
    const size_t iv_len = iv_size(algorithm_);
    const size_t tag_len = tag_size(algorithm_);
    const bool aead = is_aead(algorithm_);

    if (sealed.size() < iv_len + tag_len) {
        return decrypt_error("ciphertext shorter than IV and tag");
    }

    const uint8_t* iv = sealed.data();
    const uint8_t* body = sealed.data() + iv_len;
    const size_t body_len = sealed.size() - iv_len - tag_len;

    CipherCtx ctx;
    if (EVP_DecryptInit_ex(ctx.get(), evp_cipher(algorithm_), nullptr, nullptr, nullptr) != 1) {
        return decrypt_error("EVP_DecryptInit_ex failed");
    }
    if (aead && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                                    static_cast<int>(iv_len), nullptr) != 1) {
        return decrypt_error("setting AEAD IV length failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1) {
        return decrypt_error("EVP_DecryptInit_ex key setup failed");
    }

    int len = 0;
    if (aead && !aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1) {
        return decrypt_error("AAD update failed");
    }

    std::vector<uint8_t> plain(body_len + EVP_MAX_BLOCK_LENGTH);
    if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, body, static_cast<int>(body_len)) != 1) {
        return decrypt_error("EVP_DecryptUpdate failed");
    }
    size_t total = static_cast<size_t>(len);

    if (aead) {
        std::vector<uint8_t> tag(sealed.end() - static_cast<std::ptrdiff_t>(tag_len), sealed.end());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                                static_cast<int>(tag.size()), tag.data()) != 1) {
            return decrypt_error("setting AEAD tag failed");
        }
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
        return decrypt_error(aead ? "authentication tag mismatch" : "bad padding");
    }
    total += static_cast<size_t>(len);
    plain.resize(total);
    return plain;
}

} // namespace qrreceive::crypto
