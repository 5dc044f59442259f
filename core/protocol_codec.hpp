#ifndef QRRECEIVE_PROTOCOL_CODEC_HPP
#define QRRECEIVE_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "error_handling.hpp"

namespace qrreceive {

/**
 * @brief Wire formats understood by the codec
 */
enum class WireFormat {
    QRFILE_V2,      // JSON, full transform metadata
    QRFILE_V1,      // JSON, legacy: chunk_hash field, no transforms
    SIMPLE          // F:<name>:I:<index>:T:<total>:D:<base64>
};

std::string wire_format_tag(WireFormat format);

struct FecParameters {
    uint32_t total_symbols = 255;   // n
    uint32_t data_symbols = 223;    // k
    uint32_t blocks = 0;            // Informational block count from the sender

    uint32_t parity_symbols() const { return total_symbols - data_symbols; }
};

struct EncryptionParameters {
    std::string algorithm;          // Wire identifier, e.g. "aes-256-gcm"
    std::string key_ref;            // Key material reference; empty selects the default key
};

struct CompressionParameters {
    std::string algorithm;          // Wire identifier, e.g. "gzip"
    std::optional<double> ratio;
};

/**
 * @brief Transform chain the sender applied, as declared in the header block
 *
 * An absent stage is identity on the receiving side.
 */
struct TransformMetadata {
    std::optional<FecParameters> fec;
    std::optional<EncryptionParameters> encryption;
    std::optional<CompressionParameters> compression;

    bool is_identity() const { return !fec && !encryption && !compression; }
};

/**
 * @brief One parsed block
 *
 * Index 0 is the header block; it carries the transfer description in
 * addition to its payload.
 */
struct Envelope {
    WireFormat format = WireFormat::QRFILE_V2;
    uint32_t index = 0;
    uint32_t total = 0;
    std::vector<uint8_t> payload;
    std::string chunk_hash;         // Truncated SHA-256 hex of the payload, may be empty

    std::string filename;
    uint64_t file_size = 0;
    std::string file_hash;          // Truncated SHA-256 hex of the reconstructed file
    TransformMetadata transforms;

    bool is_header() const { return index == 0; }
};

/**
 * @brief Stateless envelope parser / serializer
 */
class ProtocolCodec {
public:
    /**
     * @brief Parses one captured string
     *
     * Fails with MALFORMED_ENVELOPE for ill-formed records, missing required
     * fields or an unknown fmt tag, and with PAYLOAD_DECODE_ERROR when the
     * base64 payload does not decode.
     */
    static Result<Envelope> parse(const std::string& raw);

    /**
     * @brief Renders an envelope in its own wire format
     *
     * Transform metadata is only written for qrfile/v2.
     */
    static std::string serialize(const Envelope& envelope);
};

} // namespace qrreceive

#endif // QRRECEIVE_PROTOCOL_CODEC_HPP
