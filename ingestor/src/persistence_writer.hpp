#pragma once

#include "bounded_queue.hpp"
#include "metrics.hpp"
#include "redis_bus.hpp"
#include "trade_store.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct WriterOptions {
    size_t batch_size = 200;
    int flush_interval_ms = 500;
    size_t queue_capacity = 4096;
    int max_attempts = 5;
    int backoff_min_ms = 200;
    int backoff_max_ms = 10000;
};

// Batches trades into single-transaction inserts with bounded retry, then
// publishes what was committed.
class PersistenceWriter {
public:
    PersistenceWriter(std::shared_ptr<TradeStore> store,
                      std::shared_ptr<EventPublisher> publisher,
                      WriterOptions options,
                      std::shared_ptr<Metrics> metrics);
    ~PersistenceWriter();

    void start();

    // Blocks while the batch queue is full. Throws FatalIngestionError once
    // the writer has failed.
    void submit_trades(std::vector<Trade> trades);

    // Synchronous; the pool row exists when this returns. True if it was new.
    bool submit_pool(const PoolMetadata& pool);

    // Announces a completed bonding curve; nothing is persisted
    void publish_completion(const CurveComplete& complete);

    // Writes everything submitted so far
    void flush();
    // Drains the queue, writes the remainder and joins
    void stop();

    std::optional<std::string> failure() const;
    void set_fatal_handler(std::function<void(const std::string&)> handler);

private:
    std::shared_ptr<TradeStore> store_;
    std::shared_ptr<EventPublisher> publisher_;
    WriterOptions options_;
    std::shared_ptr<Metrics> metrics_;

    BoundedQueue<Trade> queue_;
    std::thread worker_;
    std::atomic<bool> started_{false};

    mutable std::mutex state_mutex_;
    std::condition_variable flushed_cv_;
    uint64_t flush_requested_ = 0;
    uint64_t flush_done_ = 0;
    bool finished_ = false;
    std::optional<std::string> failure_;
    std::function<void(const std::string&)> fatal_handler_;

    void run();
    void write_batch(const std::vector<Trade>& batch);
    void fail(const std::string& reason);
    void publish(const nlohmann::json& event);
};
