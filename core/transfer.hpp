#ifndef QRRECEIVE_TRANSFER_HPP
#define QRRECEIVE_TRANSFER_HPP

#include <cstdint>
#include <string>
#include "error_handling.hpp"
#include "protocol_codec.hpp"

namespace qrreceive {

/**
 * @brief Description of the file being received, taken from the header block
 */
struct TransferInfo {
    std::string filename;
    uint64_t file_size = 0;
    uint32_t total_blocks = 0;
    std::string file_hash;
    WireFormat format = WireFormat::QRFILE_V2;
    TransformMetadata transforms;

    static TransferInfo from_header(const Envelope& header);

    // Same block count and file hash as this transfer
    bool matches(const Envelope& envelope) const;
};

/**
 * @brief Checks a parsed block against the active transfer
 *
 * STALE_TRANSFER when the block belongs to another transfer. CHECKSUM_MISMATCH
 * when the payload hash differs from the declared one, unless the transfer
 * declares FEC: the block is then accepted with a warning.
 */
Result<void> check_envelope(const TransferInfo& transfer, const Envelope& envelope);

} // namespace qrreceive

#endif // QRRECEIVE_TRANSFER_HPP
