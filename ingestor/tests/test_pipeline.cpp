#include <catch2/catch_test_macros.hpp>
#include "../src/pipeline.hpp"
#include "test_helpers.hpp"

using namespace fixtures;

namespace {

// Full in-process stack over fake storage
struct Harness {
    std::shared_ptr<Metrics> metrics = std::make_shared<Metrics>();
    std::shared_ptr<FakeStore> store;
    std::shared_ptr<FakePublisher> publisher = std::make_shared<FakePublisher>();
    std::shared_ptr<FakeSource> source = std::make_shared<FakeSource>();
    std::shared_ptr<const Decoder> decoder =
        std::make_shared<const Decoder>(std::make_shared<const LayoutBook>(LayoutBook::defaults()));
    std::shared_ptr<PersistenceWriter> writer;
    std::shared_ptr<PoolRegistry> registry;
    std::unique_ptr<Pipeline> pipeline;

    explicit Harness(std::shared_ptr<FakeStore> shared_store = std::make_shared<FakeStore>(), size_t lanes = 4)
        : store(std::move(shared_store)) {
        WriterOptions wo;
        wo.batch_size = 50;
        wo.flush_interval_ms = 20;
        wo.max_attempts = 2;
        wo.backoff_min_ms = 1;
        wo.backoff_max_ms = 2;
        writer = std::make_shared<PersistenceWriter>(store, publisher, wo, metrics);

        auto w = writer;
        registry = std::make_shared<PoolRegistry>(
            source, decoder, [w](const PoolMetadata& pool) { w->submit_pool(pool); },
            std::chrono::seconds(5), metrics);

        PipelineOptions po;
        po.lanes = lanes;
        po.queue_capacity = 256;
        po.dedup_window = 1000;
        po.seal_lag_slots = 2;
        pipeline = std::make_unique<Pipeline>(decoder, registry, writer, po, metrics);

        writer->start();
        pipeline->start();
    }
};

} // namespace

TEST_CASE("Swaps flow through to the ledger", "[pipeline]") {
    Harness h;
    auto mint = key(60);
    auto curve = key(61);

    h.pipeline->dispatch(pumpfun_update("tx1", 500, 1, mint, curve, 2000000000, 5000000, true));
    h.pipeline->dispatch(pumpfun_update("tx2", 500, 3, mint, curve, 1000000000, 2000000, false));
    h.pipeline->stop();

    REQUIRE(h.store->row_count() == 2);
    REQUIRE(h.store->pools.count(curve) == 1);
    REQUIRE(h.store->pools[curve].mint_a == mint);

    auto trades = h.store->ordered();
    REQUIRE(trades[0].txid == "tx1");
    REQUIRE(trades[0].is_buy);
    REQUIRE(trades[0].sol_amt == 2000000000);
    REQUIRE(trades[0].token_amt == 5000000);
    REQUIRE(trades[0].decimals == 6);
    REQUIRE(trades[1].txid == "tx2");
    REQUIRE_FALSE(trades[1].is_buy);

    // Pool registration is published before the trades that reference it
    auto events = h.publisher->snapshot();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0]["kind"] == "PoolCreated");
    REQUIRE(events[1]["kind"] == "Trade");
    REQUIRE(events[1].contains("pool_sol_amt"));
    REQUIRE(events[1].contains("pool_token_amt"));
    REQUIRE_FALSE(h.pipeline->fatal().has_value());
}

TEST_CASE("Re-delivered events are written once", "[pipeline]") {
    auto store = std::make_shared<FakeStore>();
    auto mint = key(62);
    auto curve = key(63);
    std::vector<RawUpdate> updates = {
        pumpfun_update("a", 600, 1, mint, curve, 10, 20, true),
        pumpfun_update("b", 600, 2, mint, curve, 30, 40, false),
        pumpfun_update("c", 601, 1, mint, curve, 50, 60, true),
    };

    SECTION("Within one run") {
        Harness h(store);
        for (const auto& u : updates) h.pipeline->dispatch(u);
        for (const auto& u : updates) h.pipeline->dispatch(u);
        h.pipeline->stop();

        REQUIRE(store->row_count() == 3);
        REQUIRE(h.metrics->duplicates.load() == 3);
    }

    SECTION("Across a restart") {
        {
            Harness first(store);
            for (const auto& u : updates) first.pipeline->dispatch(u);
            first.pipeline->stop();
        }
        Harness second(store);
        for (const auto& u : updates) second.pipeline->dispatch(u);
        second.pipeline->stop();

        REQUIRE(store->row_count() == 3);
        REQUIRE(second.metrics->conflicts.load() == 3);
        REQUIRE(second.metrics->trades_written.load() == 0);
        REQUIRE(store->pool_calls == 2);
    }
}

TEST_CASE("Decode failures are counted and skipped", "[pipeline]") {
    Harness h;
    auto mint = key(64);
    auto curve = key(65);

    auto broken = pumpfun_update("bad", 700, 1, mint, curve, 10, 20, true);
    broken.payloads[0].resize(30);

    h.pipeline->dispatch(broken);
    h.pipeline->dispatch(pumpfun_update("good", 700, 2, mint, curve, 10, 20, true));
    h.pipeline->stop();

    REQUIRE(h.metrics->decode_errors.load() == 1);
    REQUIRE(h.store->row_count() == 1);
    REQUIRE(h.store->ordered()[0].txid == "good");
}

TEST_CASE("Trades within a slot are written in execution order", "[pipeline]") {
    Harness h;
    std::vector<std::pair<std::string, uint64_t>> arrivals = {
        {"t7", 7}, {"t2", 2}, {"t9", 9}, {"t4", 4}, {"t1", 1},
    };
    uint8_t seed = 100;
    for (const auto& [txid, idx] : arrivals) {
        // Different pools land on different lanes
        h.pipeline->dispatch(pumpfun_update(txid, 800, idx, key(seed), key(seed + 1), 10, 20, true));
        seed += 2;
    }
    h.pipeline->dispatch(pumpfun_update("next", 801, 0, key(150), key(151), 10, 20, true));
    h.pipeline->stop();

    auto trades = h.store->ordered();
    REQUIRE(trades.size() == 6);
    std::vector<std::string> order;
    for (const auto& t : trades) order.push_back(t.txid);
    REQUIRE(order == std::vector<std::string>{"t1", "t2", "t4", "t7", "t9", "next"});
}

TEST_CASE("A slot is not sealed while a lane is still resolving one of its trades", "[pipeline]") {
    Harness h(std::make_shared<FakeStore>(), 2);
    h.source->delay = std::chrono::milliseconds(300);

    auto lane_of = [](const std::string& pool) { return std::hash<std::string>{}(pool) % 2; };
    auto slow_pool = key(160);
    uint8_t seed = 161;
    while (lane_of(key(seed)) == lane_of(slow_pool)) ++seed;
    auto cached_pool = key(seed);
    auto cached_mint = key(200);

    PoolMetadata cached;
    cached.address = cached_pool;
    cached.dex = DexKind::PumpFun;
    cached.mint_a = cached_mint;
    cached.mint_b = WSOL_MINT;
    cached.decimals_a = 6;
    cached.decimals_b = WSOL_DECIMALS;
    h.registry->warm({cached});

    // The first sight of slow_pool holds its lane while the other lane and
    // a later slot move on
    h.pipeline->dispatch(pumpfun_update("first", 800, 0, key(201), slow_pool, 10, 20, true));
    h.pipeline->dispatch(pumpfun_update("second", 800, 1, cached_mint, cached_pool, 10, 20, true));
    h.pipeline->dispatch(pumpfun_update("later", 802, 0, cached_mint, cached_pool, 10, 20, true));

    // Slot 802 seals slot 800 once both lanes pass its mark
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (h.store->row_count() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    h.pipeline->stop();

    auto trades = h.store->ordered();
    REQUIRE(trades.size() == 3);
    std::vector<std::pair<uint64_t, uint64_t>> order;
    for (const auto& t : trades) order.emplace_back(t.slot, t.idx);
    REQUIRE(order == std::vector<std::pair<uint64_t, uint64_t>>{{800, 0}, {800, 1}, {802, 0}});
    REQUIRE(h.metrics->late_trades.load() == 0);
    REQUIRE(h.source->fetches.load() == 1);
}

TEST_CASE("Completed bonding curves are announced", "[pipeline]") {
    Harness h;
    auto mint = key(210);
    auto curve = key(211);

    Bytes body(104);
    body.pubkey(0, key(212)).pubkey(32, mint).pubkey(64, curve);
    RawUpdate update;
    update.slot = 950;
    update.block_ts = 1700002000;
    update.txid = "done";
    update.idx = 2;
    update.program_id = PUMPFUN_PROGRAM;
    update.payloads.push_back(concat({95, 114, 97, 156, 212, 46, 152, 8}, body.data()));

    h.pipeline->dispatch(update);
    h.pipeline->stop();

    auto events = h.publisher->snapshot();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]["kind"] == "PumpfunComplete");
    REQUIRE(events[0]["mint"] == mint);
    REQUIRE(events[0]["bonding_curve"] == curve);
    REQUIRE(events[0]["user"] == key(212));
    REQUIRE(events[0]["slot"] == 950);
    REQUIRE(events[0]["idx"] == 2);
    REQUIRE(h.metrics->curves_completed.load() == 1);
    REQUIRE(h.store->row_count() == 0);
}

TEST_CASE("Swaps on pools without WSOL are dropped", "[pipeline]") {
    Harness h;

    // DLMM hint is read from vault balances; neither vault is WSOL
    Bytes body(89);
    body.pubkey(0, key(70)).pubkey(32, key(71)).u64(72, 500).u64(80, 600).u8(88, 1);
    RawUpdate update;
    update.slot = 900;
    update.txid = "usdc";
    update.idx = 0;
    update.program_id = DLMM_PROGRAM;
    for (uint8_t i = 0; i < 4; ++i) {
        IxAccount account;
        account.pubkey = key(72 + i);
        if (i >= 2) {
            TokenBalance balance;
            balance.mint = key(80 + i);
            balance.decimals = 6;
            account.post = balance;
        }
        update.accounts.push_back(account);
    }
    update.payloads.push_back(concat({81, 108, 227, 190, 205, 208, 10, 196}, body.data()));

    h.pipeline->dispatch(update);
    h.pipeline->stop();

    REQUIRE(h.metrics->non_sol_pool.load() == 1);
    REQUIRE(h.store->row_count() == 0);
}

TEST_CASE("Writer failure surfaces as a pipeline fatal", "[pipeline]") {
    auto store = std::make_shared<FakeStore>();
    store->always_fail = true;
    Harness h(store);

    std::atomic<int> calls{0};
    h.pipeline->set_fatal_handler([&](const std::string&) { calls++; });
    auto* pipeline = h.pipeline.get();
    h.writer->set_fatal_handler([pipeline](const std::string& reason) { pipeline->fail(reason); });

    // The pool is inserted fine; the trade batch is not
    h.pipeline->dispatch(pumpfun_update("x", 1000, 0, key(90), key(91), 10, 20, true));
    h.pipeline->stop();

    REQUIRE(h.pipeline->fatal().has_value());
    REQUIRE(calls.load() == 1);
    REQUIRE(h.metrics->batch_failures.load() == 1);
}
