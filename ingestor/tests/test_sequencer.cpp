#include <catch2/catch_test_macros.hpp>
#include "../src/sequencer.hpp"

namespace {

Trade trade(const std::string& txid, uint64_t slot, uint64_t idx, uint64_t tx_index = 0) {
    Trade t;
    t.txid = txid;
    t.slot = slot;
    t.idx = idx;
    t.tx_index = tx_index;
    t.sol_amt = 1;
    t.token_amt = 1;
    return t;
}

std::vector<std::string> keys(const std::vector<Trade>& trades) {
    std::vector<std::string> out;
    for (const auto& t : trades) {
        out.push_back(t.txid + ":" + std::to_string(t.idx));
    }
    return out;
}

} // namespace

TEST_CASE("Sequencer release order", "[sequencer]") {
    auto metrics = std::make_shared<Metrics>();
    Sequencer seq(1000, 2, metrics);

    REQUIRE(seq.admit(trade("b", 10, 3, 1)));
    REQUIRE(seq.admit(trade("a", 10, 1, 5)));
    REQUIRE(seq.admit(trade("c", 11, 0)));
    REQUIRE(seq.admit(trade("d", 10, 3, 0)));

    SECTION("Slots wait for the seal lag") {
        REQUIRE(seq.advance(11).empty());
        REQUIRE(seq.pending() == 4);
    }

    SECTION("Sealed slots release ordered by idx then position") {
        auto out = seq.advance(12);
        REQUIRE(keys(out) == std::vector<std::string>{"a:1", "d:3", "b:3"});
        REQUIRE(seq.pending() == 1);

        out = seq.advance(13);
        REQUIRE(keys(out) == std::vector<std::string>{"c:0"});
        REQUIRE(seq.pending() == 0);
    }

    SECTION("Drain releases everything in slot order") {
        auto out = seq.drain();
        REQUIRE(keys(out) == std::vector<std::string>{"a:1", "d:3", "b:3", "c:0"});
    }

    REQUIRE(metrics->trades_admitted.load() == 4);
}

TEST_CASE("Sequencer drops duplicates", "[sequencer]") {
    auto metrics = std::make_shared<Metrics>();
    Sequencer seq(1000, 0, metrics);

    REQUIRE(seq.admit(trade("tx", 5, 0)));
    REQUIRE_FALSE(seq.admit(trade("tx", 5, 0)));
    REQUIRE(seq.admit(trade("tx", 5, 1)));

    auto out = seq.advance(5);
    REQUIRE(out.size() == 2);

    SECTION("Replays after release are still caught") {
        REQUIRE_FALSE(seq.admit(trade("tx", 5, 0)));
        REQUIRE(seq.advance(6).empty());
    }

    REQUIRE(metrics->duplicates.load() >= 1);
}

TEST_CASE("Dedup window forgets the oldest keys", "[sequencer]") {
    auto metrics = std::make_shared<Metrics>();
    Sequencer seq(2, 0, metrics);

    REQUIRE(seq.admit(trade("a", 1, 0)));
    REQUIRE(seq.admit(trade("b", 1, 0)));
    REQUIRE(seq.admit(trade("c", 1, 0)));

    REQUIRE_FALSE(seq.admit(trade("c", 1, 0)));
    REQUIRE(seq.admit(trade("a", 1, 0)));
}

TEST_CASE("Late trades for released slots are flushed on the next advance", "[sequencer]") {
    auto metrics = std::make_shared<Metrics>();
    Sequencer seq(100, 1, metrics);

    REQUIRE(seq.admit(trade("a", 20, 0)));
    REQUIRE(seq.advance(21).size() == 1);

    REQUIRE(seq.admit(trade("late", 19, 2)));
    REQUIRE(seq.admit(trade("later", 20, 1)));
    REQUIRE(seq.admit(trade("early", 19, 0)));
    REQUIRE(seq.admit(trade("next", 22, 0)));
    REQUIRE(seq.pending() == 4);
    REQUIRE(metrics->late_trades.load() == 3);

    auto out = seq.advance(21);
    REQUIRE(keys(out) == std::vector<std::string>{"early:0", "late:2", "later:1"});
    REQUIRE(seq.pending() == 1);
}
