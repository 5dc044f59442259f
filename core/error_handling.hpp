#ifndef QRRECEIVE_ERROR_HANDLING_HPP
#define QRRECEIVE_ERROR_HANDLING_HPP

#include <string>
#include <optional>
#include <variant>
#include <iostream>
#include <memory>
#include <map>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <cstdint>

namespace qrreceive {

/**
 * @brief Error category
 */
enum class ErrorCategory {
    NONE,               // No error
    PROTOCOL,           // Envelope parsing / wire format
    TRANSFER,           // Block bookkeeping and retries
    STORAGE,            // Memory / durable block storage
    FEC,                // Forward error correction
    CRYPTO,             // Decryption and hashing
    COMPRESSION,        // Decompression
    CAPTURE,            // Capture collaborator
    CONFIGURATION,      // Configuration values
    RUNTIME,            // Generic runtime failures
    INTERNAL            // Broken invariants
};

/**
 * @brief Severity of a reported error
 */
enum class Severity {
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Error codes for specific failure kinds
 */
enum class ErrorCode {
    // General (0-99)
    SUCCESS = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    OPERATION_FAILED = 3,

    // Protocol (100-199)
    PROTOCOL_BASE = 100,
    MALFORMED_ENVELOPE = 101,       // Not a well-formed record or unsupported fmt tag
    PAYLOAD_DECODE_ERROR = 102,     // base64 payload could not be decoded
    CHECKSUM_MISMATCH = 103,        // Per-block hash does not match the payload

    // Transfer (200-299)
    TRANSFER_BASE = 200,
    INDEX_OUT_OF_RANGE = 201,       // Index outside [0, totalBlocks)
    NO_ACTIVE_TRANSFER = 202,       // Data block before any header
    STALE_TRANSFER = 203,           // Block belongs to a superseded transfer
    CHUNK_TIMEOUT = 204,            // Block deadline elapsed
    TRANSFER_INCOMPLETE = 205,      // assemble() with missing blocks
    RETRY_CEILING_EXCEEDED = 206,   // Block permanently failed
    CAPTURE_FAILED = 207,           // Re-acquisition attempt failed

    // Storage (300-399)
    STORAGE_BASE = 300,
    FILE_IO_ERROR = 301,
    SIZE_MISMATCH = 302,            // Assembled size differs from declared size

    // FEC (400-499)
    FEC_BASE = 400,
    UNCORRECTABLE_BLOCK = 401,
    UNSUPPORTED_FEC_VARIANT = 402,

    // Crypto / compression (500-599)
    CRYPTO_BASE = 500,
    DECRYPTION_FAILED = 501,
    KEY_NOT_FOUND = 502,
    UNSUPPORTED_ALGORITHM = 503,
    DECOMPRESSION_FAILED = 504,
    INTEGRITY_CHECK_FAILED = 505,

    // Configuration (600-699)
    CONFIG_BASE = 600,
    INVALID_CONFIGURATION = 601,
    MISSING_CONFIGURATION = 602,

    // Internal (800-899)
    INTERNAL_BASE = 800,
    INVARIANT_VIOLATED = 801
};

/**
 * @brief Description of a single error
 */
struct ErrorInfo {
    ErrorCategory category;
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::optional<uint32_t> block_index;   // Block the error refers to, if any
    Severity severity;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(
        ErrorCategory cat = ErrorCategory::NONE,
        ErrorCode err_code = ErrorCode::SUCCESS,
        const std::string& msg = "",
        const std::string& src_file = "",
        int src_line = 0,
        std::optional<uint32_t> index = std::nullopt,
        Severity sev = Severity::ERROR
    ) : category(cat),
        code(err_code),
        message(msg),
        file(src_file),
        line(src_line),
        block_index(index),
        severity(sev),
        timestamp(std::chrono::system_clock::now()) {}

    std::string to_string() const {
        std::string result = "[" + category_to_string(category) + "] ";
        result += code_to_string(code) + ": " + message;

        if (block_index.has_value()) {
            result += " (block " + std::to_string(block_index.value()) + ")";
        }

        if (!file.empty()) {
            result += " at " + file + ":" + std::to_string(line);
        }

        return result;
    }

    static std::string category_to_string(ErrorCategory cat) {
        switch (cat) {
            case ErrorCategory::NONE: return "NONE";
            case ErrorCategory::PROTOCOL: return "PROTOCOL";
            case ErrorCategory::TRANSFER: return "TRANSFER";
            case ErrorCategory::STORAGE: return "STORAGE";
            case ErrorCategory::FEC: return "FEC";
            case ErrorCategory::CRYPTO: return "CRYPTO";
            case ErrorCategory::COMPRESSION: return "COMPRESSION";
            case ErrorCategory::CAPTURE: return "CAPTURE";
            case ErrorCategory::CONFIGURATION: return "CONFIG";
            case ErrorCategory::RUNTIME: return "RUNTIME";
            case ErrorCategory::INTERNAL: return "INTERNAL";
            default: return "UNKNOWN";
        }
    }

    static std::string code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::SUCCESS: return "SUCCESS";
            case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::OPERATION_FAILED: return "OPERATION_FAILED";

            case ErrorCode::MALFORMED_ENVELOPE: return "MALFORMED_ENVELOPE";
            case ErrorCode::PAYLOAD_DECODE_ERROR: return "PAYLOAD_DECODE_ERROR";
            case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";

            case ErrorCode::INDEX_OUT_OF_RANGE: return "INDEX_OUT_OF_RANGE";
            case ErrorCode::NO_ACTIVE_TRANSFER: return "NO_ACTIVE_TRANSFER";
            case ErrorCode::STALE_TRANSFER: return "STALE_TRANSFER";
            case ErrorCode::CHUNK_TIMEOUT: return "CHUNK_TIMEOUT";
            case ErrorCode::TRANSFER_INCOMPLETE: return "TRANSFER_INCOMPLETE";
            case ErrorCode::RETRY_CEILING_EXCEEDED: return "RETRY_CEILING_EXCEEDED";
            case ErrorCode::CAPTURE_FAILED: return "CAPTURE_FAILED";

            case ErrorCode::FILE_IO_ERROR: return "FILE_IO_ERROR";
            case ErrorCode::SIZE_MISMATCH: return "SIZE_MISMATCH";

            case ErrorCode::UNCORRECTABLE_BLOCK: return "UNCORRECTABLE_BLOCK";
            case ErrorCode::UNSUPPORTED_FEC_VARIANT: return "UNSUPPORTED_FEC_VARIANT";

            case ErrorCode::DECRYPTION_FAILED: return "DECRYPTION_FAILED";
            case ErrorCode::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
            case ErrorCode::UNSUPPORTED_ALGORITHM: return "UNSUPPORTED_ALGORITHM";
            case ErrorCode::DECOMPRESSION_FAILED: return "DECOMPRESSION_FAILED";
            case ErrorCode::INTEGRITY_CHECK_FAILED: return "INTEGRITY_CHECK_FAILED";

            case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
            case ErrorCode::MISSING_CONFIGURATION: return "MISSING_CONFIGURATION";

            case ErrorCode::INVARIANT_VIOLATED: return "INVARIANT_VIOLATED";

            default: return "ERROR_" + std::to_string(static_cast<int>(code));
        }
    }
};

/**
 * @brief Value-or-error return type for fallible operations
 *
 * Usage:
 * ```
 * Result<Envelope> parsed = ProtocolCodec::parse(raw);
 * if (!parsed) {
 *     std::cerr << parsed.error().to_string() << std::endl;
 *     return;
 * }
 * const Envelope& env = parsed.value();
 * ```
 */
template <typename T>
class Result {
public:
    Result(T value) : variant_(std::move(value)) {}

    Result(ErrorInfo error) : variant_(std::move(error)) {}

    bool success() const {
        return std::holds_alternative<T>(variant_);
    }

    explicit operator bool() const {
        return success();
    }

    T& value() & {
        if (!success()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(variant_);
    }

    const T& value() const & {
        if (!success()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::get<T>(variant_);
    }

    T&& value() && {
        if (!success()) {
            throw std::runtime_error("Attempted to access value of failed Result");
        }
        return std::move(std::get<T>(variant_));
    }

    ErrorInfo& error() & {
        if (success()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorInfo>(variant_);
    }

    const ErrorInfo& error() const & {
        if (success()) {
            throw std::runtime_error("Attempted to access error of successful Result");
        }
        return std::get<ErrorInfo>(variant_);
    }

private:
    std::variant<T, ErrorInfo> variant_;
};

template <>
class Result<void> {
public:
    Result() : success_(true), error_() {}

    Result(ErrorInfo error) : success_(false), error_(std::move(error)) {}

    bool success() const {
        return success_;
    }

    explicit operator bool() const {
        return success_;
    }

    void value() const {
        if (!success_) {
            throw std::runtime_error("Attempted to access value of failed Result<void>");
        }
    }

    ErrorInfo& error() & {
        if (success_) {
            throw std::runtime_error("Attempted to access error of successful Result<void>");
        }
        return error_;
    }

    const ErrorInfo& error() const & {
        if (success_) {
            throw std::runtime_error("Attempted to access error of successful Result<void>");
        }
        return error_;
    }

private:
    bool success_;
    ErrorInfo error_;
};

inline ErrorInfo make_error(
    ErrorCategory category,
    ErrorCode code,
    const std::string& message,
    const std::string& file = "",
    int line = 0,
    std::optional<uint32_t> block_index = std::nullopt,
    Severity severity = Severity::ERROR
) {
    return ErrorInfo(category, code, message, file, line, block_index, severity);
}

inline Result<void> success() {
    return Result<void>();
}

// Attach source location
#define QRRECEIVE_ERROR(category, code, message, ...) \
    ::qrreceive::make_error(category, code, message, __FILE__, __LINE__, ##__VA_ARGS__)

/**
 * @brief Collects errors and keeps per-code statistics
 *
 * Also the single place the library writes log output: reported errors and
 * warnings go to std::cerr, informational lines to std::cout when verbose.
 */
class ErrorManager {
public:
    static ErrorManager& instance() {
        static ErrorManager instance;
        return instance;
    }

    void report_error(const ErrorInfo& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_code_counts_[error.code]++;

        if (log_errors_) {
            std::cerr << (error.severity == Severity::WARNING ? "WARNING: " : "ERROR: ")
                      << error.to_string() << std::endl;
        }
    }

    void log_info(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (verbose_) {
            std::cout << "[qrreceive] " << message << std::endl;
        }
    }

    void set_logging(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        log_errors_ = enable;
    }

    void set_verbose(bool enable) {
        std::lock_guard<std::mutex> lock(mutex_);
        verbose_ = enable;
    }

    uint64_t count(ErrorCode code) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = error_code_counts_.find(code);
        return it == error_code_counts_.end() ? 0 : it->second;
    }

    void clear_stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_code_counts_.clear();
    }

private:
    ErrorManager() : log_errors_(true), verbose_(false) {}

    mutable std::mutex mutex_;
    std::map<ErrorCode, uint64_t> error_code_counts_;

    bool log_errors_;
    bool verbose_;
};

inline void report_error(const ErrorInfo& error) {
    ErrorManager::instance().report_error(error);
}

inline void report_warning(ErrorInfo error) {
    error.severity = Severity::WARNING;
    ErrorManager::instance().report_error(error);
}

inline void log_info(const std::string& message) {
    ErrorManager::instance().log_info(message);
}

#define QRRECEIVE_REPORT(category, code, message, ...) \
    ::qrreceive::report_error(QRRECEIVE_ERROR(category, code, message, ##__VA_ARGS__))

} // namespace qrreceive

#endif // QRRECEIVE_ERROR_HANDLING_HPP
