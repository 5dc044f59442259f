#include "retry_coordinator.hpp"
#include "protocol_codec.hpp"
#include "transfer.hpp"

#include <algorithm>
#include <cmath>

namespace qrreceive {

RetryCoordinator::RetryCoordinator(RetryConfig config, ChunkStore& store, CaptureSource& capture,
                                   ClockFn clock, std::optional<uint32_t> seed)
    : config_(std::move(config)),
      store_(store),
      capture_(capture),
      clock_(std::move(clock)),
      lifeline_(std::make_shared<Lifeline>()),
      rng_(seed ? *seed : std::random_device{}()) {
    lifeline_->owner = this;
}

RetryCoordinator::~RetryCoordinator() {
    std::lock_guard<std::mutex> lock(lifeline_->mutex);
    lifeline_->owner = nullptr;
}

void RetryCoordinator::set_callbacks(Callbacks callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = std::move(callbacks);
}

void RetryCoordinator::begin(uint64_t generation, uint32_t total_blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_ = generation;
    tickets_.assign(total_blocks, std::nullopt);
    queued_ = 0;
    active_ = 0;
}

void RetryCoordinator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    tickets_.clear();
    queued_ = 0;
    active_ = 0;
}

std::chrono::milliseconds RetryCoordinator::backoff(const RetryConfig& config, uint32_t attempt) {
    const uint32_t exponent = attempt == 0 ? 0 : attempt - 1;
    const double base = static_cast<double>(config.base_delay.count());
    const double raw = base * std::pow(config.backoff_factor, static_cast<double>(exponent));
    const double max = static_cast<double>(config.max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(raw, max)));
}

std::chrono::milliseconds RetryCoordinator::delay_locked(uint32_t attempt) {
    std::chrono::milliseconds d = backoff(config_, attempt);
    if (config_.jitter_max.count() > 0) {
        std::uniform_int_distribution<int64_t> jitter(0, config_.jitter_max.count());
        d += std::chrono::milliseconds(jitter(rng_));
    }
    return d;
}

std::chrono::milliseconds RetryCoordinator::delay(uint32_t attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delay_locked(attempt);
}

bool RetryCoordinator::notify_missing(uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= tickets_.size() || tickets_[index]) {
        return false;
    }

    RetryTicket ticket;
    ticket.index = index;
    ticket.attempt = 1;
    ticket.delay = delay_locked(1);
    ticket.eligible_at = clock_() + ticket.delay;
    tickets_[index] = ticket;
    ++queued_;

    log_info("block " + std::to_string(index) + " queued for re-acquisition in " +
             std::to_string(ticket.delay.count()) + " ms");
    return true;
}

void RetryCoordinator::drop_ticket_locked(uint32_t index) {
    auto& slot = tickets_[index];
    if (!slot) {
        return;
    }
    if (slot->active) {
        --active_;
    }
    slot.reset();
    --queued_;
}

size_t RetryCoordinator::poll() {
    struct Issue {
        uint32_t index;
        uint32_t attempt;
    };
    std::vector<Issue> issues;
    std::vector<std::pair<uint32_t, ErrorInfo>> exhausted;
    uint64_t generation = 0;
    Callbacks callbacks;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_) {
            return 0;
        }
        generation = generation_;
        callbacks = callbacks_;
        const auto now = clock_();

        for (uint32_t i = 0; i < tickets_.size() && active_ < config_.max_concurrent; ++i) {
            auto& slot = tickets_[i];
            if (!slot || slot->active || slot->eligible_at > now) {
                continue;
            }
            if (!store_.is_missing(i, generation)) {
                drop_ticket_locked(i);
                continue;
            }
            if (slot->attempt > config_.max_retries) {
                ErrorInfo ceiling = QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::RETRY_CEILING_EXCEEDED,
                                                    "no attempts left", i);
                drop_ticket_locked(i);
                ++permanently_failed_;
                store_.mark_failed(i, generation);
                exhausted.emplace_back(i, ceiling);
                continue;
            }
            if (!store_.mark_retrying(i, generation)) {
                drop_ticket_locked(i);
                continue;
            }
            slot->active = true;
            ++active_;
            issues.push_back({i, slot->attempt});
        }
    }

    for (const auto& failure : exhausted) {
        report_error(failure.second);
        if (callbacks.on_permanent_failure) {
            callbacks.on_permanent_failure(failure.first, failure.second);
        }
    }

    for (const Issue& issue : issues) {
        log_info("re-acquiring block " + std::to_string(issue.index) + " (attempt " +
                 std::to_string(issue.attempt) + "/" + std::to_string(config_.max_retries) + ")");
        if (callbacks.on_retry) {
            callbacks.on_retry(issue.index, issue.attempt);
        }
        const uint32_t index = issue.index;
        capture_.reacquire(index, [life = lifeline_, index, generation](Result<std::string> raw) {
            std::lock_guard<std::mutex> lock(life->mutex);
            if (life->owner) {
                life->owner->complete(index, generation, std::move(raw));
            }
        });
    }
    return issues.size();
}

Result<AddOutcome> RetryCoordinator::deliver(uint32_t index, uint64_t generation,
                                             const Result<std::string>& raw) {
    if (!raw) {
        ErrorInfo error = raw.error();
        error.block_index = index;
        return error;
    }

    Result<Envelope> parsed = ProtocolCodec::parse(raw.value());
    if (!parsed) {
        return parsed.error();
    }
    Envelope& envelope = parsed.value();
    if (envelope.index != index) {
        return QRRECEIVE_ERROR(ErrorCategory::CAPTURE, ErrorCode::CAPTURE_FAILED,
                               "re-acquired block " + std::to_string(envelope.index) +
                               " instead of the requested one", index);
    }

    std::optional<TransferInfo> transfer = store_.transfer();
    if (!transfer || store_.generation() != generation) {
        return QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::STALE_TRANSFER,
                               "transfer was reset during re-acquisition", index);
    }
    Result<void> checked = check_envelope(*transfer, envelope);
    if (!checked) {
        return checked.error();
    }

    return store_.add_chunk(index, std::move(envelope.payload), generation);
}

void RetryCoordinator::complete(uint32_t index, uint64_t generation, Result<std::string> raw) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            log_info("dropping re-acquisition result for superseded transfer (block " +
                     std::to_string(index) + ")");
            return;
        }
    }

    Result<AddOutcome> added = deliver(index, generation, raw);

    enum class Outcome { NONE, SUCCESS, FAILURE, PERMANENT };
    Outcome outcome = Outcome::NONE;
    uint32_t attempt = 0;
    ErrorInfo error;
    Callbacks callbacks;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || index >= tickets_.size() || !tickets_[index]) {
            return;
        }
        callbacks = callbacks_;
        RetryTicket& ticket = *tickets_[index];
        attempt = ticket.attempt;

        if (added) {
            drop_ticket_locked(index);
            ++succeeded_;
            outcome = Outcome::SUCCESS;
        } else if (added.error().code == ErrorCode::STALE_TRANSFER && store_.generation() != generation) {
            // Store moved to another transfer; this ticket is void
            drop_ticket_locked(index);
        } else {
            // Includes a re-acquired envelope that belongs to another transfer
            error = added.error();
            ticket.active = false;
            --active_;
            ticket.last_error = error;

            if (ticket.attempt >= config_.max_retries) {
                drop_ticket_locked(index);
                ++permanently_failed_;
                store_.mark_failed(index, generation);
                outcome = Outcome::PERMANENT;
            } else {
                ++ticket.attempt;
                ticket.delay = delay_locked(ticket.attempt);
                ticket.eligible_at = clock_() + ticket.delay;
                store_.mark_awaiting(index, generation);
                outcome = Outcome::FAILURE;
            }
        }
    }

    switch (outcome) {
        case Outcome::SUCCESS:
            log_info("block " + std::to_string(index) + " recovered on attempt " + std::to_string(attempt));
            if (callbacks.on_success) {
                callbacks.on_success(index, attempt, added.value());
            }
            break;
        case Outcome::FAILURE:
            report_warning(error);
            if (callbacks.on_failure) {
                callbacks.on_failure(index, attempt, error);
            }
            break;
        case Outcome::PERMANENT: {
            ErrorInfo ceiling = QRRECEIVE_ERROR(ErrorCategory::TRANSFER, ErrorCode::RETRY_CEILING_EXCEEDED,
                                                "gave up after " + std::to_string(attempt) +
                                                " attempts, last error: " + error.message, index);
            report_error(ceiling);
            if (callbacks.on_permanent_failure) {
                callbacks.on_permanent_failure(index, ceiling);
            }
            break;
        }
        case Outcome::NONE:
            break;
    }
}

void RetryCoordinator::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void RetryCoordinator::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
}

bool RetryCoordinator::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

std::optional<RetryTicket> RetryCoordinator::ticket(uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= tickets_.size()) {
        return std::nullopt;
    }
    return tickets_[index];
}

RetryStats RetryCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RetryStats s;
    s.queued = queued_;
    s.active = active_;
    s.succeeded = succeeded_;
    s.permanently_failed = permanently_failed_;

    uint64_t total_attempts = 0;
    for (const auto& slot : tickets_) {
        if (!slot) {
            continue;
        }
        total_attempts += slot->attempt;
        if (slot->attempt + 1 >= config_.max_retries) {
            ++s.near_ceiling;
        }
    }
    if (queued_ > 0) {
        s.average_attempts = static_cast<double>(total_attempts) / static_cast<double>(queued_);
    }
    return s;
}

} // namespace qrreceive
