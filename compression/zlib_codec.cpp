#include "zlib_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <zlib.h>

namespace qrreceive::compression {

namespace {

int window_bits(ZlibFormat format) {
    switch (format) {
        case ZlibFormat::GZIP: return 16 + MAX_WBITS;
        case ZlibFormat::ZLIB: return MAX_WBITS;
        case ZlibFormat::RAW: return -MAX_WBITS;
    }
    return MAX_WBITS;
}

// Owns an inflate or deflate z_stream
class ZStream {
public:
    enum class Mode { INFLATE, DEFLATE };

    ZStream(Mode mode, int bits, int level = Z_DEFAULT_COMPRESSION) : mode_(mode) {
        std::memset(&stream_, 0, sizeof(stream_));
        int rc = mode_ == Mode::INFLATE
            ? inflateInit2(&stream_, bits)
            : deflateInit2(&stream_, level, Z_DEFLATED, bits, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw std::runtime_error("zlib stream init failed");
        }
    }
    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;
    ~ZStream() {
        if (mode_ == Mode::INFLATE) {
            inflateEnd(&stream_);
        } else {
            deflateEnd(&stream_);
        }
    }
    z_stream* get() { return &stream_; }

private:
    Mode mode_;
    z_stream stream_;
};

ErrorInfo decompress_error(const std::string& message) {
    return QRRECEIVE_ERROR(ErrorCategory::COMPRESSION, ErrorCode::DECOMPRESSION_FAILED, message);
}

} // namespace

std::optional<ZlibFormat> parse_zlib_format(const std::string& algorithm) {
    std::string lower(algorithm);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "gzip") return ZlibFormat::GZIP;
    if (lower == "deflate") return ZlibFormat::RAW;
    if (lower == "zlib") return ZlibFormat::ZLIB;
    return std::nullopt;
}

Result<std::vector<uint8_t>> inflate_buffer(const std::vector<uint8_t>& input,
                                            ZlibFormat format,
                                            size_t max_output) {
    ZStream zs(ZStream::Mode::INFLATE, window_bits(format));
    z_stream* s = zs.get();

    s->next_in = const_cast<Bytef*>(input.data());
    s->avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> out;
    std::vector<uint8_t> buffer(64 * 1024);
    int rc = Z_OK;

    while (rc != Z_STREAM_END) {
        s->next_out = buffer.data();
        s->avail_out = static_cast<uInt>(buffer.size());

        rc = inflate(s, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            return decompress_error(std::string("inflate failed: ") + (s->msg ? s->msg : "corrupt data"));
        }

        const size_t produced = buffer.size() - s->avail_out;
        if (out.size() + produced > max_output) {
            return decompress_error("decompressed size exceeds limit of " + std::to_string(max_output) + " bytes");
        }
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(produced));

        if (rc == Z_BUF_ERROR || (rc == Z_OK && s->avail_in == 0 && produced == 0)) {
            return decompress_error("truncated compressed stream");
        }
    }

    return out;
}

std::vector<uint8_t> deflate_buffer(const std::vector<uint8_t>& input,
                                    ZlibFormat format,
                                    int level) {
    ZStream zs(ZStream::Mode::DEFLATE, window_bits(format), level);
    z_stream* s = zs.get();

    s->next_in = const_cast<Bytef*>(input.data());
    s->avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> out(deflateBound(s, static_cast<uLong>(input.size())) + 32);
    s->next_out = out.data();
    s->avail_out = static_cast<uInt>(out.size());

    if (deflate(s, Z_FINISH) != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish in one pass");
    }
    out.resize(out.size() - s->avail_out);
    return out;
}

} // namespace qrreceive::compression
