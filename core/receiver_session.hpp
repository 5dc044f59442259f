#ifndef QRRECEIVE_RECEIVER_SESSION_HPP
#define QRRECEIVE_RECEIVER_SESSION_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include "block_storage.hpp"
#include "chunk_store.hpp"
#include "config.hpp"
#include "error_handling.hpp"
#include "retry_coordinator.hpp"
#include "reverse_pipeline.hpp"
#include "transform_provider.hpp"

namespace qrreceive {

/**
 * @brief Final output of a transfer
 */
struct ReconstructedFile {
    std::string filename;
    std::vector<uint8_t> bytes;
    std::vector<PipelineStage> stages;
    fec::FecDecodeStats fec;
    std::optional<bool> hash_verified;   // Empty when no file hash was declared or checking is off
    bool size_matches = true;
};

/**
 * @brief Drives one receiver
 *
 * Inbound blocks, timeout scans and retry scans are serialized on a strand of
 * the io_context. Assembly and the reverse pipeline run on a thread pool and
 * report back through the strand. Handlers are invoked on the strand.
 * Work still queued when the session is destroyed is skipped; the session
 * must not be destroyed from one of its own handlers.
 */
class ReceiverSession {
public:
    struct Handlers {
        std::function<void(const TransferInfo&)> on_transfer_started;
        std::function<void(const ChunkProgress&)> on_progress;
        std::function<void(uint32_t index, const ErrorInfo&)> on_block_failed;
        std::function<void(const std::vector<uint32_t>& failed)> on_stalled;
        std::function<void(const Result<ReconstructedFile>&)> on_complete;
    };

    ReceiverSession(boost::asio::io_context& io,
                    ReceiverConfig config,
                    CaptureSource& capture,
                    TransformProvider& provider,
                    const KeyStore& keys,
                    std::shared_ptr<DurableStore> durable = nullptr,
                    RetryCoordinator::ClockFn clock = &std::chrono::steady_clock::now);
    ~ReceiverSession();

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    void set_handlers(Handlers handlers);

    // Arms the periodic timeout / retry scan
    void start();
    void stop();

    // Queues a captured envelope string on the strand
    void submit(std::string raw);

    // Queues a reset of the active transfer on the strand
    void reset();

    /**
     * @brief Processes one captured envelope on the calling thread
     *
     * Must run on the strand when the session is started. Data blocks seen
     * before any header are held and replayed once a header arrives.
     */
    Result<void> handle_block(const std::string& raw);

    /**
     * @brief One scan: report elapsed deadlines, then issue eligible retries
     */
    void scan();

    ChunkStore& store() { return store_; }
    RetryCoordinator& retries() { return retries_; }
    const ReceiverConfig& config() const { return config_; }

private:
    struct Lifeline {
        std::mutex mutex;
        bool alive = true;
    };

    // Wraps a strand handler so it does nothing once the session is gone
    template <typename Fn>
    auto guarded(Fn fn) {
        return [life = lifeline_, fn = std::move(fn)](auto&&... args) mutable {
            std::lock_guard<std::mutex> lock(life->mutex);
            if (life->alive) {
                fn(std::forward<decltype(args)>(args)...);
            }
        };
    }

    void start_transfer(const Envelope& header);
    Result<void> accept(const TransferInfo& transfer, Envelope& envelope);
    void on_block_added(const ChunkProgress& progress);
    void check_stalled();
    void arm_timer();
    Result<ReconstructedFile> reconstruct();

    std::shared_ptr<Lifeline> lifeline_ = std::make_shared<Lifeline>();
    boost::asio::io_context& io_;
    ReceiverConfig config_;
    RetryCoordinator::ClockFn clock_;

    // Assembly and the reverse pipeline
    boost::asio::thread_pool pool_;
    // Durable writes for store_; assembly on pool_ blocks until they finish
    boost::asio::thread_pool io_pool_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;

    ChunkStore store_;
    RetryCoordinator retries_;
    ReverseTransformPipeline pipeline_;

    // Data blocks captured before the first header
    std::vector<Envelope> early_blocks_;

    Handlers handlers_;
    std::atomic<bool> running_{false};
    uint64_t processing_generation_ = 0;
    bool stall_reported_ = false;
};

} // namespace qrreceive

#endif // QRRECEIVE_RECEIVER_SESSION_HPP
