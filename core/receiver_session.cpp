#include "receiver_session.hpp"
#include "../crypto/digest.hpp"

#include <algorithm>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

namespace qrreceive {

ReceiverSession::ReceiverSession(boost::asio::io_context& io,
                                 ReceiverConfig config,
                                 CaptureSource& capture,
                                 TransformProvider& provider,
                                 const KeyStore& keys,
                                 std::shared_ptr<DurableStore> durable,
                                 RetryCoordinator::ClockFn clock)
    : io_(io),
      config_(std::move(config)),
      clock_(std::move(clock)),
      pool_(std::max<size_t>(1, config_.pipeline.worker_threads)),
      io_pool_(1),
      strand_(boost::asio::make_strand(io)),
      timer_(io),
      store_(config_.chunk_store, std::move(durable), &io_pool_),
      retries_(config_.retry, store_, capture, clock_),
      pipeline_(provider, keys) {

    RetryCoordinator::Callbacks callbacks;
    callbacks.on_success = [this](uint32_t, uint32_t, const AddOutcome& outcome) {
        const ChunkProgress progress = outcome.progress;
        boost::asio::post(strand_, guarded([this, progress]() { on_block_added(progress); }));
    };
    callbacks.on_permanent_failure = [this](uint32_t index, const ErrorInfo& error) {
        boost::asio::post(strand_, guarded([this, index, error]() {
            if (handlers_.on_block_failed) {
                handlers_.on_block_failed(index, error);
            }
            check_stalled();
        }));
    };
    retries_.set_callbacks(std::move(callbacks));
}

ReceiverSession::~ReceiverSession() {
    {
        // Waits for a handler running on another thread; queued ones become no-ops
        std::lock_guard<std::mutex> lock(lifeline_->mutex);
        lifeline_->alive = false;
    }
    stop();
    pool_.join();
}

void ReceiverSession::set_handlers(Handlers handlers) {
    handlers_ = std::move(handlers);
}

void ReceiverSession::start() {
    boost::asio::post(strand_, guarded([this]() {
        if (running_) {
            return;
        }
        running_ = true;
        arm_timer();
    }));
}

void ReceiverSession::stop() {
    running_ = false;
    timer_.cancel();
}

void ReceiverSession::arm_timer() {
    timer_.expires_after(config_.chunk_store.poll_interval);
    timer_.async_wait(boost::asio::bind_executor(strand_, guarded([this](const boost::system::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        scan();
        arm_timer();
    })));
}

void ReceiverSession::submit(std::string raw) {
    boost::asio::post(strand_, guarded([this, raw = std::move(raw)]() {
        if (!handle_block(raw)) {
            log_info("captured block rejected");
        }
    }));
}

void ReceiverSession::reset() {
    boost::asio::post(strand_, guarded([this]() {
        retries_.reset();
        store_.reset();
        early_blocks_.clear();
        processing_generation_ = 0;
        stall_reported_ = false;
        log_info("transfer reset");
    }));
}

void ReceiverSession::start_transfer(const Envelope& header) {
    if (store_.has_transfer()) {
        log_info("new header supersedes the active transfer");
        retries_.reset();
    }

    const TransferInfo info = TransferInfo::from_header(header);
    const uint64_t generation = store_.begin_transfer(info, clock_());
    retries_.begin(generation, info.total_blocks);
    processing_generation_ = 0;
    stall_reported_ = false;

    if (handlers_.on_transfer_started) {
        handlers_.on_transfer_started(info);
    }

    std::vector<Envelope> early;
    early.swap(early_blocks_);
    for (Envelope& envelope : early) {
        if (!accept(info, envelope)) {
            log_info("held block " + std::to_string(envelope.index) + " dropped");
        }
    }
}

Result<void> ReceiverSession::handle_block(const std::string& raw) {
    Result<Envelope> parsed = ProtocolCodec::parse(raw);
    if (!parsed) {
        report_warning(parsed.error());
        return parsed.error();
    }
    Envelope& envelope = parsed.value();

    if (envelope.is_header()) {
        std::optional<TransferInfo> current = store_.transfer();
        if (!current || !current->matches(envelope)) {
            start_transfer(envelope);
        }
    }

    std::optional<TransferInfo> transfer = store_.transfer();
    if (!transfer) {
        if (early_blocks_.size() < config_.chunk_store.early_block_limit) {
            log_info("holding block " + std::to_string(envelope.index) + " until a header arrives");
            early_blocks_.push_back(std::move(envelope));
            return success();
        }
        ErrorInfo error = QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::NO_ACTIVE_TRANSFER,
                                          "data block before any header, ignored", envelope.index,
                                          Severity::WARNING);
        report_warning(error);
        return error;
    }
    return accept(*transfer, envelope);
}

Result<void> ReceiverSession::accept(const TransferInfo& transfer, Envelope& envelope) {
    Result<void> checked = check_envelope(transfer, envelope);
    if (!checked) {
        report_warning(checked.error());
        return checked.error();
    }

    Result<AddOutcome> added = store_.add_chunk(envelope.index, std::move(envelope.payload),
                                                store_.generation());
    if (!added) {
        report_warning(added.error());
        return added.error();
    }
    if (!added.value().duplicate) {
        on_block_added(added.value().progress);
    }
    return success();
}

void ReceiverSession::on_block_added(const ChunkProgress& progress) {
    if (handlers_.on_progress) {
        handlers_.on_progress(progress);
    }
    if (!progress.complete || !store_.is_complete()) {
        return;
    }

    const uint64_t generation = store_.generation();
    if (processing_generation_ == generation) {
        return;
    }
    processing_generation_ = generation;
    log_info("all " + std::to_string(progress.total) + " blocks received, reconstructing");

    // Keeps io_context::run() alive until the result is back on the strand
    auto work = std::make_shared<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        io_.get_executor());

    boost::asio::post(pool_, [this, generation, work]() {
        Result<ReconstructedFile> result = reconstruct();
        boost::asio::post(strand_, guarded([this, generation, work, result = std::move(result)]() {
            work->reset();
            if (generation != store_.generation()) {
                log_info("discarding reconstruction of a superseded transfer");
                return;
            }
            if (!result && result.error().code == ErrorCode::TRANSFER_INCOMPLETE) {
                // Blocks lost by durable writes are re-acquired; assembly runs again once they are back
                processing_generation_ = 0;
                return;
            }
            if (handlers_.on_complete) {
                handlers_.on_complete(result);
            }
        }));
    });
}

void ReceiverSession::check_stalled() {
    if (stall_reported_ || !store_.has_transfer() || store_.is_complete()) {
        return;
    }
    const std::vector<uint32_t> missing = store_.missing();
    const std::vector<uint32_t> failed = store_.failed();
    if (!missing.empty() && missing.size() == failed.size()) {
        stall_reported_ = true;
        if (handlers_.on_stalled) {
            handlers_.on_stalled(failed);
        }
    }
}

void ReceiverSession::scan() {
    if (!store_.has_transfer() || store_.is_complete()) {
        return;
    }
    for (uint32_t index : store_.collect_timeouts(clock_())) {
        report_warning(QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::CHUNK_TIMEOUT,
                                       "deadline elapsed, scheduling re-acquisition", index));
        retries_.notify_missing(index);
    }
    retries_.poll();
}

Result<ReconstructedFile> ReceiverSession::reconstruct() {
    std::optional<TransferInfo> info = store_.transfer();
    if (!info) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::STALE_TRANSFER,
                               "transfer was reset before reconstruction");
    }

    Result<AssembledFile> assembled = store_.assemble();
    if (!assembled) {
        if (assembled.error().code == ErrorCode::TRANSFER_INCOMPLETE) {
            report_warning(assembled.error());
        } else {
            report_error(assembled.error());
        }
        return assembled.error();
    }
    const bool assembled_size_ok = assembled.value().size_matches;

    Result<PipelineOutput> output = pipeline_.run(info->transforms, std::move(assembled.value().bytes));
    if (!output) {
        report_error(output.error());
        return output.error();
    }

    ReconstructedFile file;
    file.filename = info->filename;
    file.bytes = std::move(output.value().bytes);
    file.stages = output.value().stages;
    file.fec = output.value().fec;
    file.size_matches = assembled_size_ok;

    if (!info->transforms.is_identity() && info->file_size != 0 && file.bytes.size() != info->file_size) {
        file.size_matches = false;
        report_warning(QRRECEIVE_ERROR(ErrorCategory::STORAGE, ErrorCode::SIZE_MISMATCH,
                                       "reconstructed " + std::to_string(file.bytes.size()) +
                                       " bytes, header declared " + std::to_string(info->file_size)));
    }

    if (config_.pipeline.verify_file_hash && !info->file_hash.empty()) {
        const std::string computed = crypto::sha256_hex(file.bytes);
        file.hash_verified = crypto::hash_matches(computed, info->file_hash);
        if (!*file.hash_verified) {
            report_warning(QRRECEIVE_ERROR(ErrorCategory::CRYPTO, ErrorCode::INTEGRITY_CHECK_FAILED,
                                           "file hash " + computed.substr(0, crypto::TRUNCATED_HASH_LENGTH) +
                                           " does not match declared " + info->file_hash));
        }
    }

    log_info("reconstructed '" + file.filename + "' (" + std::to_string(file.bytes.size()) + " bytes)");
    return file;
}

} // namespace qrreceive
