#include "reed_solomon.hpp"
#include "galois_field.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace qrreceive::fec {

namespace {

using GF = GaloisField;

// Lowest-degree-first evaluation
uint8_t evaluate_low_first(const std::vector<uint8_t>& poly, uint8_t x) {
    uint8_t result = 0;
    for (size_t i = poly.size(); i-- > 0;) {
        result = GF::add(GF::multiply(result, x), poly[i]);
    }
    return result;
}

} // namespace

bool ReedSolomonCodec::is_supported(size_t n, size_t k) {
    return n == 255 && (k == 223 || k == 239);
}

ReedSolomonCodec::ReedSolomonCodec(size_t n, size_t k) : n_(n), k_(k) {
    if (!is_supported(n, k)) {
        throw std::invalid_argument("unsupported Reed-Solomon variant (" +
                                    std::to_string(n) + "," + std::to_string(k) + ")");
    }

    // g(x) = prod (x - alpha^i), i = 0 .. n-k-1
    generator_ = {1};
    for (size_t i = 0; i < parity(); ++i) {
        std::vector<uint8_t> next(generator_.size() + 1, 0);
        const uint8_t root = GF::exp(static_cast<int>(i));
        for (size_t j = 0; j < generator_.size(); ++j) {
            next[j] = GF::add(next[j], generator_[j]);
            next[j + 1] = GF::add(next[j + 1], GF::multiply(generator_[j], root));
        }
        generator_.swap(next);
    }
}

std::vector<uint8_t> ReedSolomonCodec::encode_block(const std::vector<uint8_t>& data) const {
    if (data.size() != k_) {
        throw std::invalid_argument("encode_block expects exactly k data symbols");
    }

    // Remainder of data(x) * x^(n-k) divided by g(x)
    std::vector<uint8_t> work(data);
    work.resize(n_, 0);
    for (size_t i = 0; i < k_; ++i) {
        const uint8_t coef = work[i];
        if (coef == 0) {
            continue;
        }
        for (size_t j = 1; j < generator_.size(); ++j) {
            work[i + j] = GF::add(work[i + j], GF::multiply(generator_[j], coef));
        }
    }

    std::vector<uint8_t> codeword(data);
    codeword.insert(codeword.end(), work.begin() + static_cast<std::ptrdiff_t>(k_), work.end());
    return codeword;
}

std::vector<uint8_t> ReedSolomonCodec::encode(const std::vector<uint8_t>& data) const {
    std::vector<uint8_t> out;
    out.reserve((data.size() / k_ + 1) * n_);
    size_t offset = 0;
    while (offset + k_ <= data.size()) {
        std::vector<uint8_t> piece(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                   data.begin() + static_cast<std::ptrdiff_t>(offset + k_));
        std::vector<uint8_t> cw = encode_block(piece);
        out.insert(out.end(), cw.begin(), cw.end());
        offset += k_;
    }
    out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(offset), data.end());
    return out;
}

std::vector<uint8_t> ReedSolomonCodec::syndromes(const uint8_t* codeword) const {
    std::vector<uint8_t> synd(parity(), 0);
    for (size_t j = 0; j < parity(); ++j) {
        const uint8_t x = GF::exp(static_cast<int>(j));
        uint8_t s = 0;
        for (size_t p = 0; p < n_; ++p) {
            s = GF::add(GF::multiply(s, x), codeword[p]);
        }
        synd[j] = s;
    }
    return synd;
}

std::vector<uint8_t> ReedSolomonCodec::berlekamp_massey(const std::vector<uint8_t>& synd) const {
    const size_t nsym = synd.size();
    std::vector<uint8_t> locator(nsym + 1, 0);
    std::vector<uint8_t> previous(nsym + 1, 0);
    locator[0] = 1;
    previous[0] = 1;

    size_t length = 0;
    size_t shift = 1;
    uint8_t last_discrepancy = 1;

    for (size_t r = 0; r < nsym; ++r) {
        uint8_t delta = synd[r];
        for (size_t i = 1; i <= length; ++i) {
            delta = GF::add(delta, GF::multiply(locator[i], synd[r - i]));
        }

        if (delta == 0) {
            ++shift;
            continue;
        }

        const uint8_t coef = GF::divide(delta, last_discrepancy);
        if (2 * length <= r) {
            std::vector<uint8_t> saved(locator);
            for (size_t i = 0; i + shift <= nsym; ++i) {
                locator[i + shift] = GF::add(locator[i + shift], GF::multiply(coef, previous[i]));
            }
            length = r + 1 - length;
            previous.swap(saved);
            last_discrepancy = delta;
            shift = 1;
        } else {
            for (size_t i = 0; i + shift <= nsym; ++i) {
                locator[i + shift] = GF::add(locator[i + shift], GF::multiply(coef, previous[i]));
            }
            ++shift;
        }
    }

    // Trim to the actual degree; a degree different from length marks failure upstream
    size_t degree = nsym;
    while (degree > 0 && locator[degree] == 0) {
        --degree;
    }
    locator.resize(degree + 1);
    if (degree != length) {
        locator.clear();
    }
    return locator;
}

std::vector<size_t> ReedSolomonCodec::chien_search(const std::vector<uint8_t>& locator) const {
    // Error at degree d when locator(alpha^-d) == 0
    std::vector<size_t> degrees;
    for (size_t d = 0; d < n_; ++d) {
        if (evaluate_low_first(locator, GF::exp(-static_cast<int>(d))) == 0) {
            degrees.push_back(d);
        }
    }
    return degrees;
}

BlockDecodeResult ReedSolomonCodec::decode_block(const uint8_t* block, size_t length) const {
    BlockDecodeResult result;

    if (length < n_) {
        result.data.assign(block, block + length);
        result.partial = true;
        return result;
    }

    std::vector<uint8_t> codeword(block, block + n_);
    const std::vector<uint8_t> synd = syndromes(codeword.data());

    const bool clean = std::all_of(synd.begin(), synd.end(), [](uint8_t s) { return s == 0; });
    if (clean) {
        result.data.assign(codeword.begin(), codeword.begin() + static_cast<std::ptrdiff_t>(k_));
        return result;
    }

    auto give_up = [&]() {
        result.data.assign(block, block + k_);
        result.uncorrectable = true;
        result.corrected_symbols = 0;
        return result;
    };

    const std::vector<uint8_t> locator = berlekamp_massey(synd);
    const size_t errors = locator.empty() ? 0 : locator.size() - 1;
    if (errors == 0 || errors > max_correctable()) {
        return give_up();
    }

    const std::vector<size_t> degrees = chien_search(locator);
    if (degrees.size() != errors) {
        return give_up();
    }

    // Omega(x) = S(x) * Lambda(x) mod x^(n-k)
    std::vector<uint8_t> omega(parity(), 0);
    for (size_t i = 0; i < parity(); ++i) {
        for (size_t j = 0; j <= i && j < locator.size(); ++j) {
            omega[i] = GF::add(omega[i], GF::multiply(synd[i - j], locator[j]));
        }
    }

    // Formal derivative: only odd powers survive in characteristic 2
    std::vector<uint8_t> derivative(locator.size() > 1 ? locator.size() - 1 : 1, 0);
    for (size_t i = 1; i < locator.size(); i += 2) {
        derivative[i - 1] = locator[i];
    }

    for (size_t d : degrees) {
        const uint8_t x = GF::exp(static_cast<int>(d));
        const uint8_t x_inv = GF::inverse(x);
        const uint8_t denominator = evaluate_low_first(derivative, x_inv);
        if (denominator == 0) {
            return give_up();
        }
        // First consecutive root is alpha^0, so the X^(1-fcr) factor is X
        const uint8_t magnitude =
            GF::multiply(x, GF::divide(evaluate_low_first(omega, x_inv), denominator));
        const size_t position = n_ - 1 - d;
        codeword[position] = GF::add(codeword[position], magnitude);
    }

    const std::vector<uint8_t> check = syndromes(codeword.data());
    if (!std::all_of(check.begin(), check.end(), [](uint8_t s) { return s == 0; })) {
        return give_up();
    }

    result.data.assign(codeword.begin(), codeword.begin() + static_cast<std::ptrdiff_t>(k_));
    result.corrected_symbols = errors;
    return result;
}

FecDecodeStats ReedSolomonCodec::decode(const std::vector<uint8_t>& stream,
                                        std::vector<uint8_t>& out) const {
    FecDecodeStats stats;
    out.reserve(out.size() + stream.size());

    for (size_t offset = 0; offset < stream.size(); offset += n_) {
        const size_t length = std::min(n_, stream.size() - offset);
        BlockDecodeResult block = decode_block(stream.data() + offset, length);

        ++stats.blocks;
        if (block.partial) {
            ++stats.partial_blocks;
        }
        if (block.uncorrectable) {
            ++stats.uncorrectable_blocks;
            report_warning(QRRECEIVE_ERROR(ErrorCategory::FEC, ErrorCode::UNCORRECTABLE_BLOCK,
                                           "FEC block at offset " + std::to_string(offset) +
                                           " has more than " + std::to_string(max_correctable()) +
                                           " symbol errors, passing through uncorrected"));
        }
        stats.corrected_symbols += block.corrected_symbols;
        out.insert(out.end(), block.data.begin(), block.data.end());
    }
    return stats;
}

} // namespace qrreceive::fec
