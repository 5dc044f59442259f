/**
 * @file reed_solomon.hpp
 * @brief Systematic Reed-Solomon RS(255,k) block codec over GF(2^8)
 *
 * Codeword layout: k data symbols followed by n-k parity symbols. The first
 * symbol of a block is the highest-degree coefficient. Generator roots are
 * alpha^0 .. alpha^(n-k-1).
 *
 * Decoding: syndromes -> Berlekamp-Massey error locator -> Chien search ->
 * Forney error values -> syndrome re-check.
 */

#ifndef QRRECEIVE_REED_SOLOMON_HPP
#define QRRECEIVE_REED_SOLOMON_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../core/error_handling.hpp"

namespace qrreceive::fec {

/**
 * @brief Outcome of decoding one block
 */
struct BlockDecodeResult {
    std::vector<uint8_t> data;      // k data symbols, or the partial block as received
    size_t corrected_symbols = 0;
    bool uncorrectable = false;     // More than t errors; data is the uncorrected prefix
    bool partial = false;           // Trailing block shorter than n, passed through
};

/**
 * @brief Aggregate over a whole stream
 */
struct FecDecodeStats {
    size_t blocks = 0;
    size_t partial_blocks = 0;
    size_t corrected_symbols = 0;
    size_t uncorrectable_blocks = 0;
};

class ReedSolomonCodec {
public:
    /**
     * @throws std::invalid_argument for anything but (255,223) and (255,239)
     */
    ReedSolomonCodec(size_t n, size_t k);

    static bool is_supported(size_t n, size_t k);

    size_t n() const { return n_; }
    size_t k() const { return k_; }
    size_t parity() const { return n_ - k_; }
    size_t max_correctable() const { return (n_ - k_) / 2; }

    /**
     * @brief Encodes exactly k data symbols into an n-symbol codeword
     */
    std::vector<uint8_t> encode_block(const std::vector<uint8_t>& data) const;

    /**
     * @brief Splits data into k-symbol pieces and encodes each one
     *
     * A short final piece is emitted as-is, matching what the decoder passes through.
     */
    std::vector<uint8_t> encode(const std::vector<uint8_t>& data) const;

    /**
     * @brief Decodes one block of length symbols
     *
     * length < n is a trailing partial block and is returned unmodified.
     */
    BlockDecodeResult decode_block(const uint8_t* block, size_t length) const;

    /**
     * @brief Decodes a concatenation of blocks, appending data symbols to out
     */
    FecDecodeStats decode(const std::vector<uint8_t>& stream, std::vector<uint8_t>& out) const;

    std::vector<uint8_t> syndromes(const uint8_t* codeword) const;

private:
    std::vector<uint8_t> berlekamp_massey(const std::vector<uint8_t>& synd) const;
    std::vector<size_t> chien_search(const std::vector<uint8_t>& locator) const;

    size_t n_;
    size_t k_;
    std::vector<uint8_t> generator_;    // Highest degree first, monic
};

} // namespace qrreceive::fec

#endif // QRRECEIVE_REED_SOLOMON_HPP
