#pragma once

#include "block_parser.hpp"
#include "bounded_queue.hpp"
#include "feed_source.hpp"
#include "metrics.hpp"
#include "rpc_client.hpp"
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct SubscriberOptions {
    std::vector<std::string> programs;
    std::string commitment = "confirmed";
    size_t queue_capacity = 4096;
    int max_connect_attempts = 10;
    uint64_t backfill_max_slots = 150;
    int backoff_min_ms = 200;
    int backoff_max_ms = 10000;
};

// Turns the push feed into a pull sequence of RawUpdates. A reader thread
// owns the feed, reconnects with backoff and backfills slot gaps over RPC.
class StreamSubscriber {
public:
    StreamSubscriber(std::shared_ptr<FeedSource> feed,
                     std::shared_ptr<BlockFetcher> fetcher,
                     std::shared_ptr<BlockParser> parser,
                     SubscriberOptions options,
                     std::shared_ptr<Metrics> metrics);
    ~StreamSubscriber();

    void start();
    // Blocks for the next update. nullopt after stop() once the queue is drained.
    // Throws FatalIngestionError when reconnects are exhausted.
    std::optional<RawUpdate> next();
    void stop();

    bool is_connected() const { return connected_; }
    uint64_t last_slot() const { return last_slot_; }

private:
    enum class SubscriptionKind { Block, Program };

    std::shared_ptr<FeedSource> feed_;
    std::shared_ptr<BlockFetcher> fetcher_;
    std::shared_ptr<BlockParser> parser_;
    SubscriberOptions options_;
    std::shared_ptr<Metrics> metrics_;

    BoundedQueue<RawUpdate> queue_;
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> last_slot_{0};
    uint64_t seq_ = 0;
    uint64_t request_id_ = 0;
    bool check_gap_ = false;
    std::map<uint64_t, SubscriptionKind> pending_;
    std::map<uint64_t, SubscriptionKind> subscriptions_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::mutex fatal_mutex_;
    std::optional<std::string> fatal_;

    void run();
    void subscribe();
    void handle_message(const std::string& message);
    void handle_block(const nlohmann::json& value, uint64_t slot);
    void backfill(uint64_t from_slot, uint64_t to_slot);
    void enqueue(RawUpdate update);
    void sleep_backoff(int attempt);
};
