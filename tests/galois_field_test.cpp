#include "../fec/galois_field.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace qrreceive::fec;

TEST(GaloisFieldTest, AdditionIsXor) {
    EXPECT_EQ(GaloisField::add(0x53, 0xCA), 0x99);
    EXPECT_EQ(GaloisField::subtract(0x53, 0xCA), 0x99);
    EXPECT_EQ(GaloisField::add(0x7F, 0x7F), 0x00);
}

TEST(GaloisFieldTest, MultiplyKnownValues) {
    EXPECT_EQ(GaloisField::multiply(3, 7), 9);
    EXPECT_EQ(GaloisField::multiply(0x80, 2), 0x1D);
    EXPECT_EQ(GaloisField::multiply(0, 0xAB), 0);
    EXPECT_EQ(GaloisField::multiply(1, 0xAB), 0xAB);
}

TEST(GaloisFieldTest, ExpAndLogAreInverse) {
    EXPECT_EQ(GaloisField::exp(0), 1);
    EXPECT_EQ(GaloisField::exp(8), 0x1D);
    EXPECT_EQ(GaloisField::exp(255), 1);
    EXPECT_EQ(GaloisField::exp(-1), GaloisField::exp(254));

    for (int a = 1; a < 256; ++a) {
        EXPECT_EQ(GaloisField::exp(GaloisField::log(static_cast<uint8_t>(a))), a);
    }
}

TEST(GaloisFieldTest, EveryNonZeroElementHasInverse) {
    for (int a = 1; a < 256; ++a) {
        const uint8_t x = static_cast<uint8_t>(a);
        EXPECT_EQ(GaloisField::multiply(x, GaloisField::inverse(x)), 1) << "a=" << a;
    }
}

TEST(GaloisFieldTest, DivideUndoesMultiply) {
    for (int a = 0; a < 256; a += 7) {
        for (int b = 1; b < 256; b += 11) {
            const uint8_t x = static_cast<uint8_t>(a);
            const uint8_t y = static_cast<uint8_t>(b);
            EXPECT_EQ(GaloisField::divide(GaloisField::multiply(x, y), y), x);
        }
    }
}

TEST(GaloisFieldTest, MultiplyIsCommutativeAndDistributive) {
    for (int a = 0; a < 256; a += 13) {
        for (int b = 0; b < 256; b += 17) {
            const uint8_t x = static_cast<uint8_t>(a);
            const uint8_t y = static_cast<uint8_t>(b);
            const uint8_t z = static_cast<uint8_t>(a ^ 0x5A);
            EXPECT_EQ(GaloisField::multiply(x, y), GaloisField::multiply(y, x));
            EXPECT_EQ(GaloisField::multiply(z, GaloisField::add(x, y)),
                      GaloisField::add(GaloisField::multiply(z, x), GaloisField::multiply(z, y)));
        }
    }
}

TEST(GaloisFieldTest, PowerMatchesRepeatedMultiplication) {
    uint8_t acc = 1;
    for (int n = 0; n < 20; ++n) {
        EXPECT_EQ(GaloisField::power(0x35, n), acc);
        acc = GaloisField::multiply(acc, 0x35);
    }
    EXPECT_EQ(GaloisField::power(0x35, -1), GaloisField::inverse(0x35));
    EXPECT_EQ(GaloisField::power(2, 255), 1);
}

TEST(GaloisFieldTest, ZeroHasNoInverseOrLog) {
    EXPECT_THROW(GaloisField::inverse(0), std::domain_error);
    EXPECT_THROW(GaloisField::divide(5, 0), std::domain_error);
    EXPECT_THROW(GaloisField::log(0), std::domain_error);
}
