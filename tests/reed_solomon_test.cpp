#include "../fec/reed_solomon.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

using namespace qrreceive;
using namespace qrreceive::fec;
using qrreceive::test_support::pattern;

class ReedSolomonTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::instance().clear_stats();
        codec = std::make_unique<ReedSolomonCodec>(255, 223);
        data = pattern(223, 42);
        codeword = codec->encode_block(data);
    }

    // Flips count distinct symbols spread over the codeword
    static void corrupt(std::vector<uint8_t>& block, size_t count, size_t stride = 7) {
        for (size_t i = 0; i < count; ++i) {
            block[(i * stride + 3) % block.size()] ^= static_cast<uint8_t>(0x5A + i);
        }
    }

    std::unique_ptr<ReedSolomonCodec> codec;
    std::vector<uint8_t> data;
    std::vector<uint8_t> codeword;
};

TEST_F(ReedSolomonTest, EncodeIsSystematic) {
    ASSERT_EQ(codeword.size(), 255u);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), codeword.begin()));

    const std::vector<uint8_t> synd = codec->syndromes(codeword.data());
    for (uint8_t s : synd) {
        EXPECT_EQ(s, 0);
    }
}

TEST_F(ReedSolomonTest, CleanCodewordDecodesToDataPrefix) {
    BlockDecodeResult result = codec->decode_block(codeword.data(), codeword.size());
    EXPECT_FALSE(result.uncorrectable);
    EXPECT_FALSE(result.partial);
    EXPECT_EQ(result.corrected_symbols, 0u);
    EXPECT_EQ(result.data, data);
}

TEST_F(ReedSolomonTest, CorrectsSingleSymbolError) {
    std::vector<uint8_t> received = codeword;
    received[100] ^= 0xFF;

    BlockDecodeResult result = codec->decode_block(received.data(), received.size());
    EXPECT_FALSE(result.uncorrectable);
    EXPECT_EQ(result.corrected_symbols, 1u);
    EXPECT_EQ(result.data, data);
}

TEST_F(ReedSolomonTest, CorrectsErrorsInParitySymbols) {
    std::vector<uint8_t> received = codeword;
    received[223] ^= 0x01;
    received[254] ^= 0x80;

    BlockDecodeResult result = codec->decode_block(received.data(), received.size());
    EXPECT_FALSE(result.uncorrectable);
    EXPECT_EQ(result.corrected_symbols, 2u);
    EXPECT_EQ(result.data, data);
}

TEST_F(ReedSolomonTest, CorrectsUpToCapacity) {
    ASSERT_EQ(codec->max_correctable(), 16u);
    std::vector<uint8_t> received = codeword;
    corrupt(received, 16);

    BlockDecodeResult result = codec->decode_block(received.data(), received.size());
    EXPECT_FALSE(result.uncorrectable);
    EXPECT_EQ(result.corrected_symbols, 16u);
    EXPECT_EQ(result.data, data);
}

TEST_F(ReedSolomonTest, FlagsBlockBeyondCapacityAndPassesPrefixThrough) {
    std::vector<uint8_t> received = codeword;
    corrupt(received, 40);

    BlockDecodeResult result = codec->decode_block(received.data(), received.size());
    EXPECT_TRUE(result.uncorrectable);
    EXPECT_EQ(result.corrected_symbols, 0u);
    EXPECT_EQ(result.data, std::vector<uint8_t>(received.begin(), received.begin() + 223));
}

TEST_F(ReedSolomonTest, RS255_239CorrectsEightErrors) {
    ReedSolomonCodec small(255, 239);
    const std::vector<uint8_t> payload = pattern(239, 9);
    std::vector<uint8_t> received = small.encode_block(payload);
    ASSERT_EQ(received.size(), 255u);
    corrupt(received, 8, 31);

    BlockDecodeResult result = small.decode_block(received.data(), received.size());
    EXPECT_FALSE(result.uncorrectable);
    EXPECT_EQ(result.corrected_symbols, 8u);
    EXPECT_EQ(result.data, payload);
}

TEST_F(ReedSolomonTest, StreamDecodeHandlesPartialTail) {
    const std::vector<uint8_t> original = pattern(223 * 3 + 50, 5);
    std::vector<uint8_t> stream = codec->encode(original);
    ASSERT_EQ(stream.size(), 255u * 3 + 50);

    stream[10] ^= 0x11;          // block 0
    stream[255 + 200] ^= 0x22;   // block 1
    stream[255 + 201] ^= 0x33;

    std::vector<uint8_t> out;
    FecDecodeStats stats = codec->decode(stream, out);
    EXPECT_EQ(out, original);
    EXPECT_EQ(stats.blocks, 4u);
    EXPECT_EQ(stats.partial_blocks, 1u);
    EXPECT_EQ(stats.corrected_symbols, 3u);
    EXPECT_EQ(stats.uncorrectable_blocks, 0u);
}

TEST_F(ReedSolomonTest, StreamDecodeDegradesPerBlock) {
    const std::vector<uint8_t> original = pattern(223 * 2, 6);
    std::vector<uint8_t> stream = codec->encode(original);

    std::vector<uint8_t> first(stream.begin(), stream.begin() + 255);
    corrupt(first, 30);
    std::copy(first.begin(), first.end(), stream.begin());
    stream[255 + 17] ^= 0x44;

    std::vector<uint8_t> out;
    FecDecodeStats stats = codec->decode(stream, out);
    ASSERT_EQ(out.size(), original.size());
    EXPECT_EQ(stats.uncorrectable_blocks, 1u);
    EXPECT_EQ(stats.corrected_symbols, 1u);
    EXPECT_TRUE(std::equal(out.begin() + 223, out.end(), original.begin() + 223));
    EXPECT_TRUE(std::equal(out.begin(), out.begin() + 223, first.begin()));
    EXPECT_EQ(ErrorManager::instance().count(ErrorCode::UNCORRECTABLE_BLOCK), 1u);
}

TEST_F(ReedSolomonTest, RejectsUnsupportedVariants) {
    EXPECT_TRUE(ReedSolomonCodec::is_supported(255, 223));
    EXPECT_TRUE(ReedSolomonCodec::is_supported(255, 239));
    EXPECT_FALSE(ReedSolomonCodec::is_supported(255, 200));
    EXPECT_FALSE(ReedSolomonCodec::is_supported(128, 96));
    EXPECT_THROW(ReedSolomonCodec(255, 200), std::invalid_argument);
}
