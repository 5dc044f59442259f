#include "transfer.hpp"
#include "../crypto/digest.hpp"

namespace qrreceive {

TransferInfo TransferInfo::from_header(const Envelope& header) {
    TransferInfo info;
    info.filename = header.filename;
    info.file_size = header.file_size;
    info.total_blocks = header.total;
    info.file_hash = header.file_hash;
    info.format = header.format;
    info.transforms = header.transforms;
    return info;
}

bool TransferInfo::matches(const Envelope& envelope) const {
    return envelope.total == total_blocks && envelope.file_hash == file_hash;
}

Result<void> check_envelope(const TransferInfo& transfer, const Envelope& envelope) {
    if (!transfer.matches(envelope)) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::STALE_TRANSFER,
                               "block does not belong to the active transfer",
                               envelope.index, Severity::WARNING);
    }

    if (envelope.chunk_hash.empty()) {
        return success();
    }

    const std::string computed = crypto::sha256_hex(envelope.payload);
    if (crypto::hash_matches(computed, envelope.chunk_hash)) {
        return success();
    }

    ErrorInfo mismatch = QRRECEIVE_ERROR(ErrorCategory::PROTOCOL, ErrorCode::CHECKSUM_MISMATCH,
                                         "payload hash " + computed.substr(0, crypto::TRUNCATED_HASH_LENGTH) +
                                         " does not match declared " + envelope.chunk_hash,
                                         envelope.index);
    if (transfer.transforms.fec) {
        // FEC stage repairs symbol errors after assembly
        report_warning(mismatch);
        return success();
    }
    return mismatch;
}

} // namespace qrreceive
