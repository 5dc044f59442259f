#ifndef QRRECEIVE_BLOCK_STORAGE_HPP
#define QRRECEIVE_BLOCK_STORAGE_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include "error_handling.hpp"

namespace qrreceive {

/**
 * @brief Durable-storage collaborator
 *
 * Keyed by transfer id. Implementations need not be thread-safe; the
 * receiver serializes calls per transfer.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual Result<void> store_block(const std::string& transfer_id, uint32_t index,
                                     const std::vector<uint8_t>& bytes) = 0;

    // Concatenation of every stored block in increasing index order
    virtual Result<std::vector<uint8_t>> assemble(const std::string& transfer_id) = 0;

    virtual Result<void> discard(const std::string& transfer_id) = 0;
};

/**
 * @brief One file per block under <root>/<transfer_id>/<index>.blk
 */
class FileDurableStore : public DurableStore {
public:
    explicit FileDurableStore(std::string root);

    Result<void> store_block(const std::string& transfer_id, uint32_t index,
                             const std::vector<uint8_t>& bytes) override;
    Result<std::vector<uint8_t>> assemble(const std::string& transfer_id) override;
    Result<void> discard(const std::string& transfer_id) override;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

/**
 * @brief Storage strategy for the blocks of one transfer
 */
class BlockStorage {
public:
    virtual ~BlockStorage() = default;

    virtual const char* name() const = 0;
    virtual void put(uint32_t index, std::vector<uint8_t> bytes) = 0;
    virtual Result<std::vector<uint8_t>> assemble() = 0;

    // Payload bytes held in process memory
    virtual size_t resident_bytes() const = 0;
};

/**
 * @brief Arena of payloads indexed by block number
 */
class MemoryBlockStorage : public BlockStorage {
public:
    explicit MemoryBlockStorage(uint32_t total_blocks);

    const char* name() const override { return "memory"; }
    void put(uint32_t index, std::vector<uint8_t> bytes) override;
    Result<std::vector<uint8_t>> assemble() override;
    size_t resident_bytes() const override;

    // Moves every held payload out, leaving the storage empty
    std::vector<std::pair<uint32_t, std::vector<uint8_t>>> take_all();

private:
    mutable std::mutex mutex_;
    std::vector<std::optional<std::vector<uint8_t>>> slots_;
    size_t resident_bytes_ = 0;
};

/**
 * @brief Hands payloads to a DurableStore
 *
 * With a thread pool, writes run asynchronously on a strand of the pool;
 * without one they run inline. Failed writes are kept per block until
 * take_failed_writes() hands them back to the owner.
 */
class DurableBlockStorage : public BlockStorage {
public:
    DurableBlockStorage(std::shared_ptr<DurableStore> store, std::string transfer_id,
                        boost::asio::thread_pool* pool = nullptr);
    ~DurableBlockStorage() override;

    const char* name() const override { return "durable"; }
    void put(uint32_t index, std::vector<uint8_t> bytes) override;
    Result<std::vector<uint8_t>> assemble() override;
    size_t resident_bytes() const override { return 0; }

    // Waits for queued writes, then removes everything stored for the transfer
    Result<void> discard();

    // Blocks until every queued write has finished
    void drain();

    // Blocks whose write failed since the last call, with the write error
    std::vector<std::pair<uint32_t, ErrorInfo>> take_failed_writes();

    const std::string& transfer_id() const { return transfer_id_; }

private:
    struct WriteState {
        std::mutex mutex;
        std::condition_variable idle;
        size_t pending = 0;
        std::vector<std::pair<uint32_t, ErrorInfo>> failed;
    };

    static void write_block(const std::shared_ptr<DurableStore>& store,
                            const std::shared_ptr<WriteState>& state,
                            const std::string& transfer_id, uint32_t index,
                            const std::vector<uint8_t>& bytes);

    std::shared_ptr<DurableStore> store_;
    std::string transfer_id_;
    std::shared_ptr<WriteState> state_;
    std::optional<boost::asio::strand<boost::asio::thread_pool::executor_type>> strand_;
};

} // namespace qrreceive

#endif // QRRECEIVE_BLOCK_STORAGE_HPP
