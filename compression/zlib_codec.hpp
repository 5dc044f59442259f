#ifndef QRRECEIVE_ZLIB_CODEC_HPP
#define QRRECEIVE_ZLIB_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../core/error_handling.hpp"

namespace qrreceive::compression {

/**
 * @brief Container formats handled by zlib
 */
enum class ZlibFormat {
    GZIP,       // RFC 1952
    ZLIB,       // RFC 1950
    RAW         // RFC 1951 deflate stream, no header
};

/**
 * @brief "gzip" / "deflate" / "zlib" to a format; anything else is not zlib's
 */
std::optional<ZlibFormat> parse_zlib_format(const std::string& algorithm);

/**
 * @brief Inflates a whole buffer
 *
 * Fails with DECOMPRESSION_FAILED on corrupt or truncated input, or when the
 * output would exceed max_output bytes.
 */
Result<std::vector<uint8_t>> inflate_buffer(const std::vector<uint8_t>& input,
                                            ZlibFormat format,
                                            size_t max_output);

/**
 * @brief Deflates a whole buffer (sender side / fixtures)
 */
std::vector<uint8_t> deflate_buffer(const std::vector<uint8_t>& input,
                                    ZlibFormat format,
                                    int level = 6);

} // namespace qrreceive::compression

#endif // QRRECEIVE_ZLIB_CODEC_HPP
