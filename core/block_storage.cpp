#include "block_storage.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <boost/asio/post.hpp>

namespace qrreceive {

namespace fs = std::filesystem;

namespace {

ErrorInfo io_error(const std::string& message, std::optional<uint32_t> index = std::nullopt) {
    return QRRECEIVE_ERROR(ErrorCategory::STORAGE, ErrorCode::FILE_IO_ERROR, message, index);
}

bool parse_block_name(const fs::path& path, uint32_t& index) {
    if (path.extension() != ".blk") {
        return false;
    }
    const std::string stem = path.stem().string();
    if (stem.empty() || stem.size() > 10 ||
        !std::all_of(stem.begin(), stem.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    const unsigned long long value = std::stoull(stem);
    if (value > UINT32_MAX) {
        return false;
    }
    index = static_cast<uint32_t>(value);
    return true;
}

} // namespace

// FileDurableStore

FileDurableStore::FileDurableStore(std::string root) : root_(std::move(root)) {}

Result<void> FileDurableStore::store_block(const std::string& transfer_id, uint32_t index,
                                           const std::vector<uint8_t>& bytes) {
    const fs::path dir = fs::path(root_) / transfer_id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return io_error("cannot create " + dir.string() + ": " + ec.message(), index);
    }

    const fs::path file = dir / (std::to_string(index) + ".blk");
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return io_error("cannot write " + file.string(), index);
    }
    return success();
}

Result<std::vector<uint8_t>> FileDurableStore::assemble(const std::string& transfer_id) {
    const fs::path dir = fs::path(root_) / transfer_id;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return io_error("cannot open " + dir.string() + ": " + ec.message());
    }

    std::vector<std::pair<uint32_t, fs::path>> blocks;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        uint32_t index = 0;
        if (parse_block_name(it->path(), index)) {
            blocks.emplace_back(index, it->path());
        }
    }
    if (ec) {
        return io_error("cannot list " + dir.string() + ": " + ec.message());
    }
    std::sort(blocks.begin(), blocks.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<uint8_t> out;
    for (const auto& block : blocks) {
        std::ifstream in(block.second, std::ios::binary);
        if (!in) {
            return io_error("cannot read " + block.second.string(), block.first);
        }
        out.insert(out.end(), std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return out;
}

Result<void> FileDurableStore::discard(const std::string& transfer_id) {
    std::error_code ec;
    fs::remove_all(fs::path(root_) / transfer_id, ec);
    if (ec) {
        return io_error("cannot remove transfer " + transfer_id + ": " + ec.message());
    }
    return success();
}

// MemoryBlockStorage

MemoryBlockStorage::MemoryBlockStorage(uint32_t total_blocks) : slots_(total_blocks) {}

void MemoryBlockStorage::put(uint32_t index, std::vector<uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= slots_.size()) {
        throw std::out_of_range("block index outside storage arena");
    }
    auto& slot = slots_[index];
    if (slot) {
        resident_bytes_ -= slot->size();
    }
    resident_bytes_ += bytes.size();
    slot = std::move(bytes);
}

Result<std::vector<uint8_t>> MemoryBlockStorage::assemble() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint8_t> out;
    out.reserve(resident_bytes_);
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            return QRRECEIVE_ERROR(ErrorCategory::INTERNAL, ErrorCode::INVARIANT_VIOLATED,
                                   "memory storage has no payload for a received block",
                                   static_cast<uint32_t>(i));
        }
        out.insert(out.end(), slots_[i]->begin(), slots_[i]->end());
    }
    return out;
}

size_t MemoryBlockStorage::resident_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resident_bytes_;
}

std::vector<std::pair<uint32_t, std::vector<uint8_t>>> MemoryBlockStorage::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<uint32_t, std::vector<uint8_t>>> taken;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i]) {
            taken.emplace_back(static_cast<uint32_t>(i), std::move(*slots_[i]));
            slots_[i].reset();
        }
    }
    resident_bytes_ = 0;
    return taken;
}

// DurableBlockStorage

DurableBlockStorage::DurableBlockStorage(std::shared_ptr<DurableStore> store,
                                         std::string transfer_id,
                                         boost::asio::thread_pool* pool)
    : store_(std::move(store)),
      transfer_id_(std::move(transfer_id)),
      state_(std::make_shared<WriteState>()) {
    if (!store_) {
        throw std::invalid_argument("DurableBlockStorage requires a durable store");
    }
    if (pool) {
        strand_.emplace(boost::asio::make_strand(*pool));
    }
}

DurableBlockStorage::~DurableBlockStorage() {
    drain();
}

void DurableBlockStorage::write_block(const std::shared_ptr<DurableStore>& store,
                                      const std::shared_ptr<WriteState>& state,
                                      const std::string& transfer_id, uint32_t index,
                                      const std::vector<uint8_t>& bytes) {
    Result<void> written = store->store_block(transfer_id, index, bytes);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (!written) {
        state->failed.emplace_back(index, written.error());
    }
    --state->pending;
    if (state->pending == 0) {
        state->idle.notify_all();
    }
}

void DurableBlockStorage::put(uint32_t index, std::vector<uint8_t> bytes) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->pending;
    }

    if (!strand_) {
        write_block(store_, state_, transfer_id_, index, bytes);
        return;
    }

    boost::asio::post(*strand_,
        [store = store_, state = state_, id = transfer_id_, index, data = std::move(bytes)]() {
            write_block(store, state, id, index, data);
        });
}

void DurableBlockStorage::drain() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle.wait(lock, [this]() { return state_->pending == 0; });
}

std::vector<std::pair<uint32_t, ErrorInfo>> DurableBlockStorage::take_failed_writes() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::vector<std::pair<uint32_t, ErrorInfo>> failed;
    failed.swap(state_->failed);
    return failed;
}

Result<std::vector<uint8_t>> DurableBlockStorage::assemble() {
    drain();
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->failed.empty()) {
            return state_->failed.front().second;
        }
    }
    return store_->assemble(transfer_id_);
}

Result<void> DurableBlockStorage::discard() {
    drain();
    return store_->discard(transfer_id_);
}

} // namespace qrreceive
