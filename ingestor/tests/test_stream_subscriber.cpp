#include <catch2/catch_test_macros.hpp>
#include "../src/stream_subscriber.hpp"
#include "test_helpers.hpp"

using namespace fixtures;

namespace {

SubscriberOptions fast_options() {
    SubscriberOptions options;
    options.programs = {PUMPFUN_PROGRAM};
    options.queue_capacity = 64;
    options.max_connect_attempts = 3;
    options.backfill_max_slots = 150;
    options.backoff_min_ms = 1;
    options.backoff_max_ms = 5;
    return options;
}

std::string subscription_ack(uint64_t id, uint64_t subscription) {
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", subscription}}.dump();
}

nlohmann::json one_trade_block(const std::string& txid) {
    return block_of({pumpfun_tx(txid, key(20), key(21), 10, 20, true)});
}

} // namespace

TEST_CASE("Subscriber delivers block updates in arrival order", "[subscriber]") {
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::vector<std::string>{
            subscription_ack(1, 11),
            subscription_ack(2, 12),
            block_notification(100, one_trade_block("s100")),
            "not json at all",
            block_notification(101, one_trade_block("s101")),
        },
    }, true);
    auto fetcher = std::make_shared<FakeFetcher>();
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    auto metrics = std::make_shared<Metrics>();

    StreamSubscriber subscriber(feed, fetcher, parser, fast_options(), metrics);
    subscriber.start();

    auto first = subscriber.next();
    auto second = subscriber.next();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->txid == "s100");
    REQUIRE(second->txid == "s101");
    REQUIRE(first->seq < second->seq);

    subscriber.stop();
    REQUIRE(subscriber.last_slot() == 101);
    REQUIRE(fetcher->requested.empty());

    // blockSubscribe and programSubscribe for the watched program
    REQUIRE(feed->sent.size() == 2);
    REQUIRE(nlohmann::json::parse(feed->sent[0])["method"] == "blockSubscribe");
    REQUIRE(nlohmann::json::parse(feed->sent[1])["method"] == "programSubscribe");
}

TEST_CASE("Reconnect backfills the missed slots", "[subscriber]") {
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::vector<std::string>{block_notification(100, one_trade_block("s100"))},
        std::nullopt,
        std::vector<std::string>{block_notification(104, one_trade_block("s104"))},
    }, true);
    auto fetcher = std::make_shared<FakeFetcher>();
    fetcher->blocks[102] = one_trade_block("s102");
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    auto metrics = std::make_shared<Metrics>();

    StreamSubscriber subscriber(feed, fetcher, parser, fast_options(), metrics);
    subscriber.start();

    std::vector<std::string> txids;
    for (int i = 0; i < 3; ++i) {
        auto update = subscriber.next();
        REQUIRE(update.has_value());
        txids.push_back(update->txid);
    }
    subscriber.stop();

    REQUIRE(txids == std::vector<std::string>{"s100", "s102", "s104"});
    REQUIRE(fetcher->requested == std::vector<uint64_t>{101, 102, 103});
    REQUIRE(metrics->backfilled_slots.load() == 1);
    REQUIRE(metrics->reconnects.load() == 2);
    REQUIRE(feed->connects == 3);
}

TEST_CASE("Backfill keeps only the most recent slots of a long gap", "[subscriber]") {
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::vector<std::string>{block_notification(100, one_trade_block("s100"))},
        std::vector<std::string>{block_notification(200, one_trade_block("s200"))},
    }, true);
    auto fetcher = std::make_shared<FakeFetcher>();
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    auto options = fast_options();
    options.backfill_max_slots = 5;

    StreamSubscriber subscriber(feed, fetcher, parser, options, std::make_shared<Metrics>());
    subscriber.start();
    REQUIRE(subscriber.next()->txid == "s100");
    REQUIRE(subscriber.next()->txid == "s200");
    subscriber.stop();

    REQUIRE(fetcher->requested == std::vector<uint64_t>{195, 196, 197, 198, 199});
}

TEST_CASE("Exhausted reconnects are fatal", "[subscriber]") {
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::nullopt, std::nullopt, std::nullopt,
    });
    auto fetcher = std::make_shared<FakeFetcher>();
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    auto metrics = std::make_shared<Metrics>();

    StreamSubscriber subscriber(feed, fetcher, parser, fast_options(), metrics);
    subscriber.start();

    REQUIRE_THROWS_AS(subscriber.next(), FatalIngestionError);
    REQUIRE(metrics->reconnects.load() == 3);
    REQUIRE_FALSE(subscriber.is_connected());
    subscriber.stop();
}

TEST_CASE("Rejected subscriptions force a reconnect", "[subscriber]") {
    nlohmann::json rejection = {
        {"jsonrpc", "2.0"}, {"id", 1},
        {"error", {{"code", -32601}, {"message", "Method not found"}}}
    };
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::vector<std::string>{rejection.dump()},
    });
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    auto options = fast_options();
    options.max_connect_attempts = 1;

    StreamSubscriber subscriber(feed, std::make_shared<FakeFetcher>(), parser, options,
                                std::make_shared<Metrics>());
    subscriber.start();
    REQUIRE_THROWS_AS(subscriber.next(), FatalIngestionError);
    subscriber.stop();
}

TEST_CASE("Stop unblocks a waiting reader and consumer", "[subscriber]") {
    auto feed = std::make_shared<FakeFeed>(std::vector<std::optional<std::vector<std::string>>>{
        std::vector<std::string>{},
    }, true);
    auto parser = std::make_shared<BlockParser>(std::vector<std::string>{PUMPFUN_PROGRAM});
    StreamSubscriber subscriber(feed, std::make_shared<FakeFetcher>(), parser, fast_options(),
                                std::make_shared<Metrics>());
    subscriber.start();

    std::optional<RawUpdate> result = RawUpdate();
    std::thread consumer([&] { result = subscriber.next(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(subscriber.is_connected());
    subscriber.stop();
    consumer.join();

    REQUIRE_FALSE(result.has_value());
    REQUIRE_FALSE(subscriber.is_connected());
}
