#pragma once
#include <openssl/evp.h>
#include <stdexcept>

namespace qrreceive::crypto {

class CipherCtx {
public:
    CipherCtx() {
        ctx_ = EVP_CIPHER_CTX_new();
        if (!ctx_) {
            throw std::runtime_error("EVP_CIPHER_CTX_new failed");
        }
    }
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
    CipherCtx(CipherCtx&& other) noexcept : ctx_(other.ctx_) { other.ctx_ = nullptr; }
    CipherCtx& operator=(CipherCtx&& other) noexcept {
        if (this != &other) {
            cleanup();
            ctx_ = other.ctx_;
            other.ctx_ = nullptr;
        }
        return *this;
    }
    ~CipherCtx() { cleanup(); }
    EVP_CIPHER_CTX* get() const { return ctx_; }
private:
    void cleanup() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }
    EVP_CIPHER_CTX* ctx_{nullptr};
};

class DigestCtx {
public:
    DigestCtx() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
    }
    DigestCtx(const DigestCtx&) = delete;
    DigestCtx& operator=(const DigestCtx&) = delete;
    DigestCtx(DigestCtx&& other) noexcept : ctx_(other.ctx_) { other.ctx_ = nullptr; }
    DigestCtx& operator=(DigestCtx&& other) noexcept {
        if (this != &other) {
            cleanup();
            ctx_ = other.ctx_;
            other.ctx_ = nullptr;
        }
        return *this;
    }
    ~DigestCtx() { cleanup(); }
    EVP_MD_CTX* get() const { return ctx_; }
private:
    void cleanup() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }
    EVP_MD_CTX* ctx_{nullptr};
};

} // namespace qrreceive::crypto
