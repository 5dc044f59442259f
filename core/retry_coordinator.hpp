#ifndef QRRECEIVE_RETRY_COORDINATOR_HPP
#define QRRECEIVE_RETRY_COORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "chunk_store.hpp"
#include "config.hpp"
#include "error_handling.hpp"

namespace qrreceive {

/**
 * @brief Capture collaborator used for re-acquisition
 *
 * reacquire() asks for the block with the given index and reports the raw
 * envelope string, or a failure, through the handler. The handler may run
 * synchronously or later on any thread.
 */
class CaptureSource {
public:
    using Handler = std::function<void(Result<std::string>)>;

    virtual ~CaptureSource() = default;
    virtual void reacquire(uint32_t index, Handler handler) = 0;
};

/**
 * @brief Scheduling metadata for one missing block; holds no payload
 */
struct RetryTicket {
    uint32_t index = 0;
    uint32_t attempt = 1;                           // Attempt issued next, or in flight
    std::optional<ErrorInfo> last_error;
    std::chrono::steady_clock::time_point eligible_at;
    std::chrono::milliseconds delay{0};             // Backoff applied for the current attempt
    bool active = false;                            // Re-acquisition in flight
};

struct RetryStats {
    size_t queued = 0;
    size_t active = 0;
    size_t near_ceiling = 0;
    double average_attempts = 0.0;
    uint64_t succeeded = 0;
    uint64_t permanently_failed = 0;
};

/**
 * @brief Bounded, backoff-scheduled re-acquisition of missing blocks
 *
 * delay(attempt) = min(base * factor^(attempt-1), max) + U(0, jitter).
 * A block fails permanently once its attempt number exceeds max_retries.
 * Before using a concurrency slot the coordinator asks the store whether the
 * block is still missing. Capture results that arrive after destruction are
 * dropped; the destructor waits for one that is being processed.
 */
class RetryCoordinator {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Callbacks {
        std::function<void(uint32_t index, uint32_t attempt)> on_retry;
        std::function<void(uint32_t index, uint32_t attempt, const AddOutcome& outcome)> on_success;
        std::function<void(uint32_t index, uint32_t attempt, const ErrorInfo& error)> on_failure;
        std::function<void(uint32_t index, const ErrorInfo& error)> on_permanent_failure;
    };

    RetryCoordinator(RetryConfig config, ChunkStore& store, CaptureSource& capture,
                     ClockFn clock = &Clock::now,
                     std::optional<uint32_t> seed = std::nullopt);

    ~RetryCoordinator();

    RetryCoordinator(const RetryCoordinator&) = delete;
    RetryCoordinator& operator=(const RetryCoordinator&) = delete;

    void set_callbacks(Callbacks callbacks);

    // Starts tracking a transfer; earlier tickets are dropped
    void begin(uint64_t generation, uint32_t total_blocks);

    // Drops every ticket; in-flight results become stale
    void reset();

    /**
     * @brief Queues a ticket unless one exists for the index
     * @return true when a ticket was created
     */
    bool notify_missing(uint32_t index);

    /**
     * @brief Issues re-acquisitions for eligible tickets, up to max_concurrent in flight
     * @return Number of re-acquisitions issued
     */
    size_t poll();

    void pause();
    void resume();
    bool paused() const;

    // Backoff for an attempt including jitter
    std::chrono::milliseconds delay(uint32_t attempt);

    // Backoff for an attempt without jitter
    static std::chrono::milliseconds backoff(const RetryConfig& config, uint32_t attempt);

    std::optional<RetryTicket> ticket(uint32_t index) const;
    RetryStats stats() const;
    const RetryConfig& config() const { return config_; }

private:
    // Outlives the coordinator inside pending capture handlers
    struct Lifeline {
        std::mutex mutex;
        RetryCoordinator* owner = nullptr;
    };

    std::chrono::milliseconds delay_locked(uint32_t attempt);
    void complete(uint32_t index, uint64_t generation, Result<std::string> raw);
    Result<AddOutcome> deliver(uint32_t index, uint64_t generation, const Result<std::string>& raw);
    void drop_ticket_locked(uint32_t index);

    RetryConfig config_;
    ChunkStore& store_;
    CaptureSource& capture_;
    ClockFn clock_;
    std::shared_ptr<Lifeline> lifeline_;

    mutable std::mutex mutex_;
    Callbacks callbacks_;
    std::mt19937 rng_;
    uint64_t generation_ = 0;
    std::vector<std::optional<RetryTicket>> tickets_;   // Arena indexed by block number
    size_t queued_ = 0;
    size_t active_ = 0;
    bool paused_ = false;
    uint64_t succeeded_ = 0;
    uint64_t permanently_failed_ = 0;
};

} // namespace qrreceive

#endif // QRRECEIVE_RETRY_COORDINATOR_HPP
