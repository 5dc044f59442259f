#include "reverse_pipeline.hpp"

namespace qrreceive {

const char* pipeline_stage_name(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::FEC_DECODE: return "fec";
        case PipelineStage::DECRYPTION: return "decryption";
        case PipelineStage::DECOMPRESSION: return "decompression";
    }
    return "unknown";
}

ReverseTransformPipeline::ReverseTransformPipeline(TransformProvider& provider, const KeyStore& keys)
    : provider_(provider), keys_(keys) {}

Result<std::vector<uint8_t>> ReverseTransformPipeline::decrypt(const EncryptionParameters& params,
                                                               const std::vector<uint8_t>& data) const {
    std::optional<KeyMaterial> key = keys_.find(params.key_ref);
    if (!key) {
        return QRRECEIVE_ERROR(ErrorCategory::CRYPTO, ErrorCode::KEY_NOT_FOUND,
                               params.key_ref.empty() ? std::string("no default key configured")
                                                      : "no key for reference '" + params.key_ref + "'");
    }
    return provider_.decrypt(params.algorithm, *key, data);
}

Result<PipelineOutput> ReverseTransformPipeline::run(const TransformMetadata& transforms,
                                                     std::vector<uint8_t> assembled) const {
    PipelineOutput output;
    output.bytes = std::move(assembled);

    if (transforms.fec) {
        const FecParameters& params = *transforms.fec;
        if (!fec::ReedSolomonCodec::is_supported(params.total_symbols, params.data_symbols)) {
            return QRRECEIVE_ERROR(ErrorCategory::FEC, ErrorCode::UNSUPPORTED_FEC_VARIANT,
                                   "RS(" + std::to_string(params.total_symbols) + "," +
                                   std::to_string(params.data_symbols) + ") is not supported");
        }
        fec::ReedSolomonCodec codec(params.total_symbols, params.data_symbols);
        std::vector<uint8_t> decoded;
        output.fec = codec.decode(output.bytes, decoded);
        output.bytes.swap(decoded);
        output.stages.push_back(PipelineStage::FEC_DECODE);

        log_info("FEC decoded " + std::to_string(output.fec.blocks) + " blocks, corrected " +
                 std::to_string(output.fec.corrected_symbols) + " symbols, " +
                 std::to_string(output.fec.uncorrectable_blocks) + " uncorrectable");
    }

    if (transforms.encryption) {
        Result<std::vector<uint8_t>> plain = decrypt(*transforms.encryption, output.bytes);
        if (!plain) {
            return plain.error();
        }
        output.bytes = std::move(plain).value();
        output.stages.push_back(PipelineStage::DECRYPTION);
    }

    if (transforms.compression) {
        Result<std::vector<uint8_t>> inflated =
            provider_.decompress(transforms.compression->algorithm, output.bytes);
        if (!inflated) {
            return inflated.error();
        }
        log_info("decompressed " + std::to_string(output.bytes.size()) + " -> " +
                 std::to_string(inflated.value().size()) + " bytes (" +
                 transforms.compression->algorithm + ")");
        output.bytes = std::move(inflated).value();
        output.stages.push_back(PipelineStage::DECOMPRESSION);
    }

    return output;
}

} // namespace qrreceive
