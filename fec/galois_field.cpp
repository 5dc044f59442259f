#include "galois_field.hpp"

namespace qrreceive::fec {

GaloisField::Tables::Tables() {
    // Successive powers of alpha, reduced by the primitive polynomial
    uint16_t x = 1;
    for (int i = 0; i < ORDER; ++i) {
        exp[i] = static_cast<uint8_t>(x);
        log[x] = i;
        x <<= 1;
        if (x & 0x100) {
            x ^= PRIMITIVE_POLYNOMIAL;
        }
    }
    // Duplicate so exp[log a + log b] needs no modulo
    for (int i = ORDER; i < 2 * ORDER; ++i) {
        exp[i] = exp[i - ORDER];
    }
    log[0] = -1;
}

const GaloisField::Tables& GaloisField::tables() {
    static const Tables instance;
    return instance;
}

uint8_t GaloisField::multiply(uint8_t a, uint8_t b) {
    if (a == 0 || b == 0) {
        return 0;
    }
    const Tables& t = tables();
    return t.exp[t.log[a] + t.log[b]];
}

uint8_t GaloisField::divide(uint8_t a, uint8_t b) {
    if (b == 0) {
        throw std::domain_error("GF(256) division by zero");
    }
    if (a == 0) {
        return 0;
    }
    const Tables& t = tables();
    return t.exp[t.log[a] + ORDER - t.log[b]];
}

uint8_t GaloisField::inverse(uint8_t a) {
    if (a == 0) {
        throw std::domain_error("zero has no inverse in GF(256)");
    }
    const Tables& t = tables();
    return t.exp[ORDER - t.log[a]];
}

uint8_t GaloisField::power(uint8_t a, int n) {
    if (n == 0) {
        return 1;
    }
    if (a == 0) {
        if (n < 0) {
            throw std::domain_error("zero raised to a negative power");
        }
        return 0;
    }
    const Tables& t = tables();
    int e = static_cast<int>((static_cast<long long>(t.log[a]) * n) % ORDER);
    if (e < 0) {
        e += ORDER;
    }
    return t.exp[e];
}

uint8_t GaloisField::exp(int n) {
    int e = n % ORDER;
    if (e < 0) {
        e += ORDER;
    }
    return tables().exp[e];
}

int GaloisField::log(uint8_t a) {
    if (a == 0) {
        throw std::domain_error("log of zero in GF(256)");
    }
    return tables().log[a];
}

} // namespace qrreceive::fec
