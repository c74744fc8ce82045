#include "stream_subscriber.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

StreamSubscriber::StreamSubscriber(std::shared_ptr<FeedSource> feed,
                                   std::shared_ptr<BlockFetcher> fetcher,
                                   std::shared_ptr<BlockParser> parser,
                                   SubscriberOptions options,
                                   std::shared_ptr<Metrics> metrics)
    : feed_(std::move(feed))
    , fetcher_(std::move(fetcher))
    , parser_(std::move(parser))
    , options_(std::move(options))
    , metrics_(std::move(metrics))
    , queue_(options_.queue_capacity) {}

StreamSubscriber::~StreamSubscriber() {
    stop();
}

void StreamSubscriber::start() {
    if (running_.exchange(true)) {
        return;
    }
    reader_ = std::thread(&StreamSubscriber::run, this);
}

void StreamSubscriber::stop() {
    running_ = false;
    queue_.close();
    feed_->close();
    wait_cv_.notify_all();
    if (reader_.joinable()) {
        reader_.join();
    }
}

std::optional<RawUpdate> StreamSubscriber::next() {
    auto update = queue_.pop();
    if (!update) {
        std::lock_guard<std::mutex> lock(fatal_mutex_);
        if (fatal_) {
            throw FatalIngestionError(*fatal_);
        }
    }
    return update;
}

void StreamSubscriber::run() {
    int failures = 0;

    while (running_) {
        try {
            feed_->connect();
            subscribe();
            connected_ = true;
            failures = 0;
            check_gap_ = last_slot_ > 0;

            while (running_) {
                auto message = feed_->read();
                if (!message) {
                    spdlog::warn("Upstream closed the subscription");
                    break;
                }
                handle_message(*message);
            }
        } catch (const std::exception& e) {
            if (running_) {
                spdlog::warn("Stream error: {}", e.what());
            }
        }

        connected_ = false;
        if (!running_) {
            break;
        }

        ++failures;
        metrics_->reconnects++;
        if (failures >= options_.max_connect_attempts) {
            std::string reason = "stream subscription failed " + std::to_string(failures) +
                                 " consecutive times";
            spdlog::critical("{}", reason);
            {
                std::lock_guard<std::mutex> lock(fatal_mutex_);
                fatal_ = reason;
            }
            queue_.close();
            return;
        }

        sleep_backoff(failures - 1);
    }

    queue_.close();
}

void StreamSubscriber::sleep_backoff(int attempt) {
    int delay = util::backoff_ms(attempt, options_.backoff_min_ms, options_.backoff_max_ms);
    spdlog::warn("Reconnecting in {} ms (attempt {})", delay, attempt + 1);
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(delay), [this] { return !running_; });
}

void StreamSubscriber::subscribe() {
    pending_.clear();
    subscriptions_.clear();

    for (const auto& program : options_.programs) {
        nlohmann::json block_sub = {
            {"jsonrpc", "2.0"},
            {"id", ++request_id_},
            {"method", "blockSubscribe"},
            {"params", nlohmann::json::array({
                {{"mentionsAccountOrProgram", program}},
                {
                    {"commitment", options_.commitment},
                    {"encoding", "json"},
                    {"transactionDetails", "full"},
                    {"maxSupportedTransactionVersion", 0},
                    {"showRewards", false}
                }
            })}
        };
        pending_[request_id_] = SubscriptionKind::Block;
        feed_->send(block_sub.dump());

        nlohmann::json program_sub = {
            {"jsonrpc", "2.0"},
            {"id", ++request_id_},
            {"method", "programSubscribe"},
            {"params", nlohmann::json::array({
                program,
                {{"commitment", options_.commitment}, {"encoding", "base64"}}
            })}
        };
        pending_[request_id_] = SubscriptionKind::Program;
        feed_->send(program_sub.dump());
    }

    spdlog::info("Subscribed to {} programs", options_.programs.size());
}

void StreamSubscriber::handle_message(const std::string& message) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(message);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Unparseable stream message: {}", e.what());
        return;
    }

    if (msg.contains("id") && msg["id"].is_number()) {
        auto id = msg["id"].get<uint64_t>();
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        if (msg.contains("error")) {
            throw std::runtime_error("subscription rejected: " + msg["error"].dump());
        }
        subscriptions_[msg.at("result").get<uint64_t>()] = it->second;
        pending_.erase(it);
        return;
    }

    std::string method = msg.value("method", "");
    if (!msg.contains("params")) return;
    const auto& result = msg["params"].at("result");

    if (method == "blockNotification") {
        const auto& value = result.at("value");
        uint64_t slot = value.contains("slot") ? value["slot"].get<uint64_t>()
                                               : result.at("context").at("slot").get<uint64_t>();
        if (value.contains("err") && !value["err"].is_null()) {
            spdlog::debug("Block notification error at slot {}: {}", slot, value["err"].dump());
            return;
        }
        handle_block(value.value("block", nlohmann::json()), slot);
    } else if (method == "programNotification") {
        uint64_t slot = result.at("context").at("slot").get<uint64_t>();
        auto update = parser_->parse_account(result.at("value"), slot);
        if (update) {
            enqueue(std::move(*update));
        }
    }
}

void StreamSubscriber::handle_block(const nlohmann::json& block, uint64_t slot) {
    if (check_gap_) {
        check_gap_ = false;
        uint64_t last = last_slot_;
        if (slot > last + 1) {
            backfill(last + 1, slot - 1);
        }
    }

    for (auto& update : parser_->parse_block(block, slot)) {
        enqueue(std::move(update));
    }

    if (slot > last_slot_) {
        last_slot_ = slot;
    }
    metrics_->observe_slot(slot);
}

void StreamSubscriber::backfill(uint64_t from_slot, uint64_t to_slot) {
    if (options_.backfill_max_slots == 0) {
        spdlog::warn("Slot gap {}..{} not backfilled", from_slot, to_slot);
        return;
    }

    uint64_t gap = to_slot - from_slot + 1;
    if (gap > options_.backfill_max_slots) {
        spdlog::warn("Slot gap {}..{} exceeds backfill limit, keeping the last {} slots",
                     from_slot, to_slot, options_.backfill_max_slots);
        from_slot = to_slot - options_.backfill_max_slots + 1;
    }

    spdlog::info("Backfilling slots {}..{}", from_slot, to_slot);
    for (uint64_t slot = from_slot; slot <= to_slot && running_; ++slot) {
        try {
            auto block = fetcher_->get_block(slot);
            if (!block) continue;
            for (auto& update : parser_->parse_block(*block, slot)) {
                enqueue(std::move(update));
            }
            metrics_->backfilled_slots++;
        } catch (const std::exception& e) {
            spdlog::warn("Backfill of slot {} failed: {}", slot, e.what());
        }
    }
}

void StreamSubscriber::enqueue(RawUpdate update) {
    update.seq = ++seq_;
    metrics_->updates_received++;
    if (!queue_.push(std::move(update))) {
        spdlog::debug("Update dropped after shutdown");
    }
}
