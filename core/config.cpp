#include "config.hpp"

#include <fstream>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace qrreceive {

Result<void> ReceiverConfig::validate() const {
    if (chunk_store.memory_threshold_bytes == 0) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "chunk_store.memory_threshold must be positive");
    }
    if (chunk_store.chunk_timeout.count() <= 0 || chunk_store.poll_interval.count() <= 0) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "chunk_store timeout and poll interval must be positive");
    }
    if (retry.max_retries == 0 || retry.max_concurrent == 0) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "retry.max_retries and retry.max_concurrent must be at least 1");
    }
    if (retry.backoff_factor < 1.0) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "retry.backoff_factor must be >= 1");
    }
    if (retry.base_delay.count() < 0 || retry.jitter_max.count() < 0 ||
        retry.max_delay < retry.base_delay) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "retry delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (pipeline.worker_threads == 0) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               "pipeline.worker_threads must be at least 1");
    }
    return success();
}

Result<void> load_config_file(const std::string& path, ReceiverConfig& config) {
    std::ifstream in(path);
    if (!in) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::MISSING_CONFIGURATION,
                               "cannot open config file " + path);
    }

    // Durations are read as plain millisecond counts
    int64_t chunk_timeout_ms = config.chunk_store.chunk_timeout.count();
    int64_t poll_interval_ms = config.chunk_store.poll_interval.count();
    int64_t base_delay_ms = config.retry.base_delay.count();
    int64_t max_delay_ms = config.retry.max_delay.count();
    int64_t jitter_ms = config.retry.jitter_max.count();

    po::options_description desc("qrreceive configuration");
    desc.add_options()
        ("chunk_store.memory_threshold",
         po::value<size_t>(&config.chunk_store.memory_threshold_bytes)
             ->default_value(config.chunk_store.memory_threshold_bytes))
        ("chunk_store.chunk_timeout_ms", po::value<int64_t>(&chunk_timeout_ms)->default_value(chunk_timeout_ms))
        ("chunk_store.poll_interval_ms", po::value<int64_t>(&poll_interval_ms)->default_value(poll_interval_ms))
        ("chunk_store.spill_directory",
         po::value<std::string>(&config.chunk_store.spill_directory)
             ->default_value(config.chunk_store.spill_directory))
        ("chunk_store.early_block_limit",
         po::value<size_t>(&config.chunk_store.early_block_limit)
             ->default_value(config.chunk_store.early_block_limit))
        ("retry.max_retries", po::value<uint32_t>(&config.retry.max_retries)->default_value(config.retry.max_retries))
        ("retry.base_delay_ms", po::value<int64_t>(&base_delay_ms)->default_value(base_delay_ms))
        ("retry.max_delay_ms", po::value<int64_t>(&max_delay_ms)->default_value(max_delay_ms))
        ("retry.backoff_factor",
         po::value<double>(&config.retry.backoff_factor)->default_value(config.retry.backoff_factor))
        ("retry.jitter_max_ms", po::value<int64_t>(&jitter_ms)->default_value(jitter_ms))
        ("retry.max_concurrent",
         po::value<uint32_t>(&config.retry.max_concurrent)->default_value(config.retry.max_concurrent))
        ("pipeline.worker_threads",
         po::value<size_t>(&config.pipeline.worker_threads)->default_value(config.pipeline.worker_threads))
        ("pipeline.verify_file_hash",
         po::value<bool>(&config.pipeline.verify_file_hash)->default_value(config.pipeline.verify_file_hash))
        ("pipeline.max_decompressed_bytes",
         po::value<size_t>(&config.pipeline.max_decompressed_bytes)
             ->default_value(config.pipeline.max_decompressed_bytes))
    ;

    try {
        po::variables_map vm;
        po::store(po::parse_config_file(in, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return QRRECEIVE_ERROR(ErrorCategory::CONFIGURATION, ErrorCode::INVALID_CONFIGURATION,
                               std::string("invalid config file ") + path + ": " + e.what());
    }

    config.chunk_store.chunk_timeout = std::chrono::milliseconds(chunk_timeout_ms);
    config.chunk_store.poll_interval = std::chrono::milliseconds(poll_interval_ms);
    config.retry.base_delay = std::chrono::milliseconds(base_delay_ms);
    config.retry.max_delay = std::chrono::milliseconds(max_delay_ms);
    config.retry.jitter_max = std::chrono::milliseconds(jitter_ms);

    return config.validate();
}

} // namespace qrreceive
