#ifndef QRRECEIVE_CONFIG_HPP
#define QRRECEIVE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "error_handling.hpp"

namespace qrreceive {

/**
 * @brief Block storage and timeout settings
 */
struct ChunkStoreConfig {
    size_t memory_threshold_bytes = 50 * 1024 * 1024;       // Spill to durable storage above this
    std::chrono::milliseconds chunk_timeout{10000};          // Deadline per missing block
    std::chrono::milliseconds poll_interval{500};            // Timeout / retry scan cadence
    std::string spill_directory;                             // Empty: no durable store
    size_t early_block_limit = 256;                          // Blocks held until the first header arrives
};

/**
 * @brief Re-acquisition scheduling
 */
struct RetryConfig {
    uint32_t max_retries = 5;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_factor = 2.0;
    std::chrono::milliseconds jitter_max{1000};
    uint32_t max_concurrent = 3;
};

/**
 * @brief Reverse transform settings
 */
struct PipelineConfig {
    size_t worker_threads = 1;                 // thread_pool size for pipeline / durable writes
    bool verify_file_hash = true;              // Compare truncated SHA-256 of the result
    size_t max_decompressed_bytes = 1024ull * 1024 * 1024;
};

struct ReceiverConfig {
    ChunkStoreConfig chunk_store;
    RetryConfig retry;
    PipelineConfig pipeline;

    Result<void> validate() const;
};

/**
 * @brief Loads an INI-style file ([chunk_store], [retry], [pipeline]) into config
 *
 * Keys that are absent keep their current value.
 */
Result<void> load_config_file(const std::string& path, ReceiverConfig& config);

} // namespace qrreceive

#endif // QRRECEIVE_CONFIG_HPP
