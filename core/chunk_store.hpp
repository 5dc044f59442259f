#ifndef QRRECEIVE_CHUNK_STORE_HPP
#define QRRECEIVE_CHUNK_STORE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "block_storage.hpp"
#include "config.hpp"
#include "error_handling.hpp"
#include "transfer.hpp"

namespace qrreceive {

/**
 * @brief Lifecycle of one block
 *
 * PENDING -> RECEIVED, or PENDING -> AWAITING_RETRY -> RETRYING ->
 * {RECEIVED | AWAITING_RETRY | FAILED}. A FAILED block may still be received.
 */
enum class BlockState {
    PENDING,
    AWAITING_RETRY,
    RETRYING,
    RECEIVED,
    FAILED
};

const char* block_state_name(BlockState state);

struct ChunkProgress {
    uint32_t received = 0;
    uint32_t total = 0;
    double ratio = 0.0;
    bool complete = false;
};

struct AddOutcome {
    ChunkProgress progress;
    bool duplicate = false;
};

struct AssembledFile {
    std::vector<uint8_t> bytes;
    bool size_matches = true;
};

/**
 * @brief Owns the block state of the active transfer
 *
 * Payloads live in a memory arena until the configured threshold would be
 * exceeded; then every buffered and later payload goes to the durable store.
 * The switch happens at most once per transfer. All members are thread-safe.
 *
 * Every transfer gets a new generation number. Calls tagged with an older
 * generation are rejected with STALE_TRANSFER.
 */
class ChunkStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit ChunkStore(ChunkStoreConfig config,
                        std::shared_ptr<DurableStore> durable = nullptr,
                        boost::asio::thread_pool* io_pool = nullptr);
    ~ChunkStore();

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    /**
     * @brief Discards prior state and starts a transfer with every block missing
     * @return Generation of the new transfer
     */
    uint64_t begin_transfer(const TransferInfo& info, Clock::time_point now = Clock::now());

    // Drops the active transfer; outstanding generations become stale
    void reset();

    bool has_transfer() const;
    std::optional<TransferInfo> transfer() const;
    uint64_t generation() const;
    std::string transfer_id() const;

    /**
     * @brief Stores a payload
     *
     * INDEX_OUT_OF_RANGE leaves the state untouched. Receiving an index twice
     * is a no-op reported as duplicate. A block whose durable write failed
     * counts as missing again and is accepted on redelivery.
     */
    Result<AddOutcome> add_chunk(uint32_t index, std::vector<uint8_t> payload,
                                 std::optional<uint64_t> generation = std::nullopt);

    /**
     * @brief Pending blocks whose deadline has elapsed
     *
     * Each returned block moves to AWAITING_RETRY, so it is reported once.
     * Blocks lost by a failed durable write are returned on the next call.
     */
    std::vector<uint32_t> collect_timeouts(Clock::time_point now);

    bool is_missing(uint32_t index, uint64_t generation) const;

    // State transitions driven by the retry coordinator; false when stale or already received
    bool mark_retrying(uint32_t index, uint64_t generation);
    bool mark_awaiting(uint32_t index, uint64_t generation);
    bool mark_failed(uint32_t index, uint64_t generation);

    std::optional<BlockState> state(uint32_t index) const;
    ChunkProgress progress() const;
    bool is_complete() const;
    std::vector<uint32_t> missing() const;
    std::vector<uint32_t> failed() const;

    bool durable_mode() const;
    size_t memory_usage() const;

    /**
     * @brief Concatenates all payloads in index order
     *
     * TRANSFER_INCOMPLETE unless every block is received, including blocks
     * whose durable write failed after they were accepted. A length different
     * from the declared size is reported as a SIZE_MISMATCH warning when the
     * transfer declares no transforms.
     */
    Result<AssembledFile> assemble();

private:
    struct BlockSlot {
        BlockState state = BlockState::PENDING;
        std::optional<Clock::time_point> deadline;
    };

    bool transition(uint32_t index, uint64_t generation, BlockState to);
    size_t reclaim_failed_writes_locked();
    void switch_to_durable_locked(const char* reason);
    void discard_storage_locked();
    ChunkProgress progress_locked() const;
    std::string transfer_id_locked() const;

    ChunkStoreConfig config_;
    std::shared_ptr<DurableStore> durable_;
    boost::asio::thread_pool* io_pool_;

    mutable std::mutex mutex_;
    std::optional<TransferInfo> transfer_;
    uint64_t generation_ = 0;
    std::vector<BlockSlot> blocks_;
    uint32_t received_ = 0;

    std::shared_ptr<BlockStorage> storage_;
    std::shared_ptr<MemoryBlockStorage> memory_;         // Set while in memory mode
    std::shared_ptr<DurableBlockStorage> durable_storage_;
    bool threshold_warned_ = false;
};

} // namespace qrreceive

#endif // QRRECEIVE_CHUNK_STORE_HPP
