#include "persistence_writer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

PersistenceWriter::PersistenceWriter(std::shared_ptr<TradeStore> store,
                                     std::shared_ptr<EventPublisher> publisher,
                                     WriterOptions options,
                                     std::shared_ptr<Metrics> metrics)
    : store_(std::move(store))
    , publisher_(std::move(publisher))
    , options_(options)
    , metrics_(std::move(metrics))
    , queue_(options.queue_capacity) {}

PersistenceWriter::~PersistenceWriter() {
    if (worker_.joinable()) {
        queue_.close();
        worker_.join();
    }
}

void PersistenceWriter::start() {
    if (started_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&PersistenceWriter::run, this);
}

void PersistenceWriter::set_fatal_handler(std::function<void(const std::string&)> handler) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    fatal_handler_ = std::move(handler);
}

std::optional<std::string> PersistenceWriter::failure() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_;
}

void PersistenceWriter::submit_trades(std::vector<Trade> trades) {
    for (auto& trade : trades) {
        if (!queue_.push(std::move(trade))) {
            auto reason = failure();
            throw FatalIngestionError(reason ? *reason : "persistence writer is stopped");
        }
    }
}

bool PersistenceWriter::submit_pool(const PoolMetadata& pool) {
    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        try {
            bool inserted = store_->insert_pool(pool);
            if (inserted) {
                metrics_->pools_registered++;
                spdlog::info("Registered {} pool {} ({} / {})", to_string(pool.dex),
                             pool.address, util::short_addr(pool.mint_a), util::short_addr(pool.mint_b));
                publish(to_json(pool));
            }
            return inserted;
        } catch (const std::exception& e) {
            spdlog::warn("Pool insert for {} failed (attempt {}/{}): {}",
                         pool.address, attempt + 1, options_.max_attempts, e.what());
            if (attempt + 1 < options_.max_attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(
                    util::backoff_ms(attempt, options_.backoff_min_ms, options_.backoff_max_ms)));
            }
        }
    }

    std::string reason = "pool insert for " + pool.address + " failed after " +
                         std::to_string(options_.max_attempts) + " attempts";
    fail(reason);
    throw FatalIngestionError(reason);
}

void PersistenceWriter::publish_completion(const CurveComplete& complete) {
    metrics_->curves_completed++;
    spdlog::info("Bonding curve {} for {} completed in {}", complete.bonding_curve,
                 util::short_addr(complete.mint), complete.txid);
    publish(to_json(complete));
}

void PersistenceWriter::flush() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!started_ || finished_ || failure_) {
        return;
    }
    uint64_t ticket = ++flush_requested_;
    flushed_cv_.wait(lock, [this, ticket] {
        return flush_done_ >= ticket || finished_ || failure_.has_value();
    });
}

void PersistenceWriter::stop() {
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PersistenceWriter::run() {
    std::vector<Trade> buffer;
    auto interval = std::chrono::milliseconds(options_.flush_interval_ms);
    auto last_flush = std::chrono::steady_clock::now();

    try {
        while (true) {
            auto item = queue_.pop_for(std::chrono::milliseconds(std::min(options_.flush_interval_ms, 50)));
            if (item) {
                buffer.push_back(std::move(*item));
            }

            bool drained = !item && queue_.closed();
            uint64_t pending_flush;
            uint64_t done;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                pending_flush = flush_requested_;
                done = flush_done_;
            }
            bool flush_now = pending_flush > done && queue_.size() == 0;
            bool due = std::chrono::steady_clock::now() - last_flush >= interval;

            if (buffer.size() >= options_.batch_size || ((due || drained || flush_now) && !buffer.empty())) {
                for (size_t offset = 0; offset < buffer.size(); offset += options_.batch_size) {
                    auto end = std::min(buffer.size(), offset + options_.batch_size);
                    write_batch(std::vector<Trade>(buffer.begin() + offset, buffer.begin() + end));
                }
                buffer.clear();
            }
            if (due || drained || flush_now) {
                last_flush = std::chrono::steady_clock::now();
            }

            if (flush_now) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                flush_done_ = pending_flush;
                flushed_cv_.notify_all();
            }

            if (drained) {
                break;
            }
        }
    } catch (const FatalIngestionError& e) {
        spdlog::critical("Persistence writer stopped: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
    flush_done_ = flush_requested_;
    flushed_cv_.notify_all();
}

void PersistenceWriter::write_batch(const std::vector<Trade>& batch) {
    for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
        try {
            auto result = store_->insert_trades(batch);

            metrics_->batches_written++;
            metrics_->trades_written += result.inserted.size();
            metrics_->conflicts += result.conflicts();
            spdlog::info("Batch committed: attempted={} inserted={} conflicts={}",
                         result.attempted, result.inserted.size(), result.conflicts());

            for (auto position : result.inserted) {
                publish(to_json(batch[position]));
            }
            return;

        } catch (const std::exception& e) {
            spdlog::warn("Batch of {} trades failed (attempt {}/{}): {}",
                         batch.size(), attempt + 1, options_.max_attempts, e.what());
            if (attempt + 1 < options_.max_attempts) {
                metrics_->batch_retries++;
                std::this_thread::sleep_for(std::chrono::milliseconds(
                    util::backoff_ms(attempt, options_.backoff_min_ms, options_.backoff_max_ms)));
            }
        }
    }

    metrics_->batch_failures++;
    std::string reason = "trade batch of " + std::to_string(batch.size()) + " failed after " +
                         std::to_string(options_.max_attempts) + " attempts";
    fail(reason);
    throw FatalIngestionError(reason);
}

void PersistenceWriter::fail(const std::string& reason) {
    std::function<void(const std::string&)> handler;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (failure_) return;
        failure_ = reason;
        handler = fatal_handler_;
        flushed_cv_.notify_all();
    }
    queue_.close();
    if (handler) {
        handler(reason);
    }
}

void PersistenceWriter::publish(const nlohmann::json& event) {
    if (!publisher_) {
        return;
    }
    if (!publisher_->publish_event(event)) {
        metrics_->publish_failures++;
    }
}
