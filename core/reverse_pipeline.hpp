#ifndef QRRECEIVE_REVERSE_PIPELINE_HPP
#define QRRECEIVE_REVERSE_PIPELINE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "error_handling.hpp"
#include "protocol_codec.hpp"
#include "transform_provider.hpp"
#include "../fec/reed_solomon.hpp"

namespace qrreceive {

enum class PipelineStage {
    FEC_DECODE,
    DECRYPTION,
    DECOMPRESSION
};

const char* pipeline_stage_name(PipelineStage stage);

struct PipelineOutput {
    std::vector<uint8_t> bytes;
    std::vector<PipelineStage> stages;      // Stages that ran, in order
    fec::FecDecodeStats fec;
};

/**
 * @brief Undoes the sender's transform chain
 *
 * Stages run in the fixed order FEC decode, decryption, decompression, each
 * only when the header declares it. Uncorrectable FEC blocks degrade per
 * block; every other stage failure aborts the run.
 */
class ReverseTransformPipeline {
public:
    ReverseTransformPipeline(TransformProvider& provider, const KeyStore& keys);

    Result<PipelineOutput> run(const TransformMetadata& transforms,
                               std::vector<uint8_t> assembled) const;

private:
    Result<std::vector<uint8_t>> decrypt(const EncryptionParameters& params,
                                         const std::vector<uint8_t>& data) const;

    TransformProvider& provider_;
    const KeyStore& keys_;
};

} // namespace qrreceive

#endif // QRRECEIVE_REVERSE_PIPELINE_HPP
