#include "digest.hpp"
#include "openssl_raii.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <openssl/evp.h>

namespace qrreceive::crypto {

namespace {

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string sha256_hex(const uint8_t* data, size_t size) {
    DigestCtx ctx;
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return to_hex(std::vector<uint8_t>(out.begin(), out.begin() + out_len));
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string truncated_sha256(const std::vector<uint8_t>& data) {
    return sha256_hex(data).substr(0, TRUNCATED_HASH_LENGTH);
}

bool hash_matches(const std::string& computed_hex, const std::string& declared_hex) {
    if (declared_hex.empty()) {
        return true;
    }
    if (declared_hex.size() < TRUNCATED_HASH_LENGTH || declared_hex.size() > computed_hex.size()) {
        return false;
    }
    return std::equal(declared_hex.begin(), declared_hex.end(), computed_hex.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

Result<std::vector<uint8_t>> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            clean.push_back(c);
        }
    }

    if (clean.empty()) {
        return std::vector<uint8_t>();
    }
    if (clean.size() % 4 != 0) {
        return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::PAYLOAD_DECODE_ERROR,
                               "base64 length is not a multiple of 4");
    }

    size_t padding = 0;
    for (size_t i = 0; i < clean.size(); ++i) {
        char c = clean[i];
        if (c == '=') {
            // '=' only allowed in the final two positions
            if (i < clean.size() - 2) {
                return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::PAYLOAD_DECODE_ERROR,
                                       "misplaced base64 padding");
            }
            ++padding;
        } else if (padding > 0 || !is_base64_char(c)) {
            return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::PAYLOAD_DECODE_ERROR,
                                   "invalid base64 character");
        }
    }

    std::vector<uint8_t> out(clean.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::PAYLOAD_DECODE_ERROR,
                               "base64 decode failed");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::string to_hex(const std::vector<uint8_t>& data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Result<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::INVALID_ARGUMENT,
                               "hex string has odd length");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::INVALID_ARGUMENT,
                                   "invalid hex digit");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace qrreceive::crypto
