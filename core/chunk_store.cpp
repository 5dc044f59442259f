#include "chunk_store.hpp"

#include <algorithm>

namespace qrreceive {

const char* block_state_name(BlockState state) {
    switch (state) {
        case BlockState::PENDING: return "pending";
        case BlockState::AWAITING_RETRY: return "awaiting-retry";
        case BlockState::RETRYING: return "retrying";
        case BlockState::RECEIVED: return "received";
        case BlockState::FAILED: return "failed";
    }
    return "unknown";
}

ChunkStore::ChunkStore(ChunkStoreConfig config,
                       std::shared_ptr<DurableStore> durable,
                       boost::asio::thread_pool* io_pool)
    : config_(std::move(config)),
      durable_(std::move(durable)),
      io_pool_(io_pool) {}

ChunkStore::~ChunkStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (durable_storage_) {
        durable_storage_->drain();
    }
}

uint64_t ChunkStore::begin_transfer(const TransferInfo& info, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    discard_storage_locked();

    transfer_ = info;
    ++generation_;
    received_ = 0;
    threshold_warned_ = false;

    BlockSlot initial;
    initial.deadline = now + config_.chunk_timeout;
    blocks_.assign(info.total_blocks, initial);

    memory_ = std::make_shared<MemoryBlockStorage>(info.total_blocks);
    storage_ = memory_;
    durable_storage_.reset();

    if (durable_ && info.file_size > config_.memory_threshold_bytes) {
        switch_to_durable_locked("declared file size exceeds the memory threshold");
    }

    log_info("transfer '" + info.filename + "' started: " + std::to_string(info.total_blocks) +
             " blocks, " + std::to_string(info.file_size) + " bytes, " + storage_->name() + " storage");
    return generation_;
}

void ChunkStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    discard_storage_locked();
    transfer_.reset();
    ++generation_;
    blocks_.clear();
    received_ = 0;
    storage_.reset();
    memory_.reset();
    durable_storage_.reset();
}

bool ChunkStore::has_transfer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_.has_value();
}

std::optional<TransferInfo> ChunkStore::transfer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_;
}

uint64_t ChunkStore::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::string ChunkStore::transfer_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_id_locked();
}

std::string ChunkStore::transfer_id_locked() const {
    if (!transfer_) {
        return std::string();
    }
    const std::string base = transfer_->file_hash.empty() ? "transfer" : transfer_->file_hash;
    return base + "-" + std::to_string(generation_);
}

Result<AddOutcome> ChunkStore::add_chunk(uint32_t index, std::vector<uint8_t> payload,
                                         std::optional<uint64_t> generation) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!transfer_) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::NO_ACTIVE_TRANSFER,
                               "no active transfer", index);
    }
    if (generation && *generation != generation_) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::STALE_TRANSFER,
                               "block delivered for a superseded transfer", index);
    }
    if (index >= blocks_.size()) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::INDEX_OUT_OF_RANGE,
                               "index outside [0, " + std::to_string(blocks_.size()) + ")", index);
    }

    reclaim_failed_writes_locked();

    BlockSlot& slot = blocks_[index];
    if (slot.state == BlockState::RECEIVED) {
        return AddOutcome{progress_locked(), true};
    }

    if (memory_ && memory_->resident_bytes() + payload.size() > config_.memory_threshold_bytes) {
        if (durable_) {
            switch_to_durable_locked("memory threshold exceeded");
        } else if (!threshold_warned_) {
            threshold_warned_ = true;
            report_warning(QRRECEIVE_ERROR(ErrorCategory::STORAGE, ErrorCode::OPERATION_FAILED,
                                           "memory threshold exceeded and no durable store is configured; "
                                           "keeping blocks in memory"));
        }
    }

    storage_->put(index, std::move(payload));
    slot.state = BlockState::RECEIVED;
    slot.deadline.reset();
    ++received_;

    return AddOutcome{progress_locked(), false};
}

std::vector<uint32_t> ChunkStore::collect_timeouts(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    reclaim_failed_writes_locked();
    std::vector<uint32_t> elapsed;
    for (size_t i = 0; i < blocks_.size(); ++i) {
        BlockSlot& slot = blocks_[i];
        if (slot.state == BlockState::PENDING && slot.deadline && *slot.deadline <= now) {
            slot.state = BlockState::AWAITING_RETRY;
            slot.deadline.reset();
            elapsed.push_back(static_cast<uint32_t>(i));
        }
    }
    return elapsed;
}

bool ChunkStore::is_missing(uint32_t index, uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transfer_ || generation != generation_ || index >= blocks_.size()) {
        return false;
    }
    const BlockState s = blocks_[index].state;
    return s != BlockState::RECEIVED && s != BlockState::FAILED;
}

bool ChunkStore::transition(uint32_t index, uint64_t generation, BlockState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transfer_ || generation != generation_ || index >= blocks_.size()) {
        return false;
    }
    BlockSlot& slot = blocks_[index];
    if (slot.state == BlockState::RECEIVED) {
        return false;
    }
    slot.state = to;
    slot.deadline.reset();
    return true;
}

bool ChunkStore::mark_retrying(uint32_t index, uint64_t generation) {
    return transition(index, generation, BlockState::RETRYING);
}

bool ChunkStore::mark_awaiting(uint32_t index, uint64_t generation) {
    return transition(index, generation, BlockState::AWAITING_RETRY);
}

bool ChunkStore::mark_failed(uint32_t index, uint64_t generation) {
    return transition(index, generation, BlockState::FAILED);
}

std::optional<BlockState> ChunkStore::state(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= blocks_.size()) {
        return std::nullopt;
    }
    return blocks_[index].state;
}

ChunkProgress ChunkStore::progress_locked() const {
    ChunkProgress p;
    p.received = received_;
    p.total = static_cast<uint32_t>(blocks_.size());
    p.ratio = p.total == 0 ? 0.0 : static_cast<double>(p.received) / p.total;
    p.complete = transfer_.has_value() && p.total > 0 && p.received == p.total;
    return p;
}

ChunkProgress ChunkStore::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_locked();
}

bool ChunkStore::is_complete() const {
    return progress().complete;
}

std::vector<uint32_t> ChunkStore::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> result;
    for (size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i].state != BlockState::RECEIVED) {
            result.push_back(static_cast<uint32_t>(i));
        }
    }
    return result;
}

std::vector<uint32_t> ChunkStore::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> result;
    for (size_t i = 0; i < blocks_.size(); ++i) {
        if (blocks_[i].state == BlockState::FAILED) {
            result.push_back(static_cast<uint32_t>(i));
        }
    }
    return result;
}

bool ChunkStore::durable_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durable_storage_ != nullptr;
}

size_t ChunkStore::memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_ ? storage_->resident_bytes() : 0;
}

Result<AssembledFile> ChunkStore::assemble() {
    std::shared_ptr<DurableBlockStorage> durable;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        durable = durable_storage_;
    }
    if (durable) {
        durable->drain();
    }

    std::shared_ptr<BlockStorage> storage;
    TransferInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!transfer_) {
            return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::NO_ACTIVE_TRANSFER,
                                   "no active transfer to assemble");
        }
        reclaim_failed_writes_locked();
        if (received_ != blocks_.size()) {
            return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::TRANSFER_INCOMPLETE,
                                   std::to_string(blocks_.size() - received_) + " of " +
                                   std::to_string(blocks_.size()) + " blocks missing");
        }
        storage = storage_;
        info = *transfer_;
    }

    Result<std::vector<uint8_t>> bytes = storage->assemble();
    if (!bytes) {
        return bytes.error();
    }

    AssembledFile file;
    file.bytes = std::move(bytes).value();
    if (info.transforms.is_identity() && info.file_size != 0 && file.bytes.size() != info.file_size) {
        file.size_matches = false;
        report_warning(QRRECEIVE_ERROR(ErrorCategory::STORAGE, ErrorCode::SIZE_MISMATCH,
                                       "assembled " + std::to_string(file.bytes.size()) +
                                       " bytes, header declared " + std::to_string(info.file_size)));
    }
    return file;
}

size_t ChunkStore::reclaim_failed_writes_locked() {
    if (!durable_storage_) {
        return 0;
    }
    size_t reclaimed = 0;
    for (auto& failure : durable_storage_->take_failed_writes()) {
        const uint32_t index = failure.first;
        if (index >= blocks_.size() || blocks_[index].state != BlockState::RECEIVED) {
            continue;
        }
        // Payload is in neither store; due for re-acquisition at the next scan
        BlockSlot& slot = blocks_[index];
        slot.state = BlockState::PENDING;
        slot.deadline = Clock::time_point::min();
        --received_;
        ++reclaimed;

        ErrorInfo lost = failure.second;
        lost.block_index = index;
        report_warning(lost);
    }
    return reclaimed;
}

void ChunkStore::switch_to_durable_locked(const char* reason) {
    durable_storage_ = std::make_shared<DurableBlockStorage>(durable_, transfer_id_locked(), io_pool_);

    if (memory_) {
        for (auto& block : memory_->take_all()) {
            durable_storage_->put(block.first, std::move(block.second));
        }
    }
    memory_.reset();
    storage_ = durable_storage_;

    log_info(std::string("switched to durable storage: ") + reason);
}

void ChunkStore::discard_storage_locked() {
    if (!durable_storage_) {
        return;
    }
    Result<void> discarded = durable_storage_->discard();
    if (!discarded) {
        report_warning(discarded.error());
    }
}

} // namespace qrreceive
