/**
 * @file galois_field.hpp
 * @brief GF(2^8) arithmetic for the Reed-Solomon decoder
 *
 * Elements are bytes. The field is generated by the primitive polynomial
 * x^8 + x^4 + x^3 + x^2 + 1 (0x11D) with primitive element alpha = 2.
 */

#ifndef QRRECEIVE_GALOIS_FIELD_HPP
#define QRRECEIVE_GALOIS_FIELD_HPP

#include <array>
#include <cstdint>
#include <stdexcept>

namespace qrreceive::fec {

class GaloisField {
public:
    static constexpr uint16_t PRIMITIVE_POLYNOMIAL = 0x11D;
    static constexpr uint8_t GENERATOR = 0x02;
    static constexpr int ORDER = 255;   // Size of the multiplicative group

    static uint8_t add(uint8_t a, uint8_t b) { return a ^ b; }
    static uint8_t subtract(uint8_t a, uint8_t b) { return a ^ b; }

    static uint8_t multiply(uint8_t a, uint8_t b);

    /**
     * @throws std::domain_error when b is zero
     */
    static uint8_t divide(uint8_t a, uint8_t b);

    /**
     * @throws std::domain_error for zero
     */
    static uint8_t inverse(uint8_t a);

    // a^n, n may be negative for non-zero a
    static uint8_t power(uint8_t a, int n);

    // alpha^n for any integer n
    static uint8_t exp(int n);

    /**
     * @throws std::domain_error for zero
     */
    static int log(uint8_t a);

private:
    struct Tables {
        std::array<uint8_t, 2 * ORDER> exp{};
        std::array<int, 256> log{};
        Tables();
    };

    static const Tables& tables();
};

} // namespace qrreceive::fec

#endif // QRRECEIVE_GALOIS_FIELD_HPP
