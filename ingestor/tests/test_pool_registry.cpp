#include <catch2/catch_test_macros.hpp>
#include "../src/pool_registry.hpp"
#include "test_helpers.hpp"

using namespace fixtures;

namespace {

struct PersistLog {
    std::mutex mutex;
    std::vector<PoolMetadata> pools;

    PoolRegistry::PersistFn fn() {
        return [this](const PoolMetadata& pool) {
            std::lock_guard<std::mutex> lock(mutex);
            pools.push_back(pool);
        };
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return pools.size();
    }
};

PoolHint complete_hint(const std::string& mint) {
    PoolHint hint;
    hint.dex = DexKind::PumpAmm;
    hint.mint_a = mint;
    hint.mint_b = std::string(WSOL_MINT);
    hint.decimals_a = 6;
    hint.decimals_b = 9;
    return hint;
}

std::shared_ptr<const Decoder> default_decoder() {
    return std::make_shared<const Decoder>(std::make_shared<const LayoutBook>(LayoutBook::defaults()));
}

} // namespace

TEST_CASE("Concurrent lookups share one fetch", "[registry]") {
    auto source = std::make_shared<FakeSource>();
    source->delay = std::chrono::milliseconds(100);
    auto metrics = std::make_shared<Metrics>();
    PersistLog log;
    PoolRegistry registry(source, default_decoder(), log.fn(), std::chrono::seconds(5), metrics);

    auto pool = key(1);
    auto hint = complete_hint(key(2));
    std::vector<std::thread> threads;
    std::atomic<int> resolved{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto meta = registry.resolve(pool, hint);
            if (meta.address == pool && meta.mint_a == key(2)) {
                resolved++;
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(resolved.load() == 8);
    REQUIRE(source->fetches.load() == 1);
    REQUIRE(log.count() == 1);
    REQUIRE(metrics->pool_fetches.load() == 1);

    SECTION("Later lookups are served from the cache") {
        registry.resolve(pool);
        REQUIRE(source->fetches.load() == 1);
        REQUIRE(registry.size() == 1);
    }
}

TEST_CASE("Unresolvable pools are not cached", "[registry]") {
    auto source = std::make_shared<FakeSource>();
    auto metrics = std::make_shared<Metrics>();
    PersistLog log;
    PoolRegistry registry(source, default_decoder(), log.fn(), std::chrono::seconds(5), metrics);

    REQUIRE_THROWS_AS(registry.resolve(key(3)), MetadataUnresolvable);
    REQUIRE_THROWS_AS(registry.resolve(key(3)), MetadataUnresolvable);
    REQUIRE(source->fetches.load() == 2);
    REQUIRE_FALSE(registry.find(key(3)).has_value());
    REQUIRE(log.count() == 0);

    SECTION("A pool that becomes known resolves on the next lookup") {
        PoolMetadata meta;
        meta.address = key(3);
        meta.dex = DexKind::RaydiumAmm;
        meta.mint_a = key(4);
        meta.mint_b = WSOL_MINT;
        meta.decimals_a = 5;
        meta.decimals_b = 9;
        source->known[key(3)] = meta;

        auto resolved = registry.resolve(key(3));
        REQUIRE(resolved.decimals_a == 5);
        REQUIRE(registry.find(key(3)).has_value());
    }
}

TEST_CASE("Slow fetches time out without blocking the registry", "[registry]") {
    auto source = std::make_shared<FakeSource>();
    source->delay = std::chrono::milliseconds(300);
    auto metrics = std::make_shared<Metrics>();
    PersistLog log;
    PoolRegistry registry(source, default_decoder(), log.fn(), std::chrono::milliseconds(50), metrics);

    REQUIRE_THROWS_AS(registry.resolve(key(5), complete_hint(key(6))), MetadataUnresolvable);

    // The fetch completes in the background and fills the cache
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    REQUIRE(registry.find(key(5)).has_value());
    REQUIRE(log.count() == 1);
}

TEST_CASE("Persist failures propagate to the caller", "[registry]") {
    auto source = std::make_shared<FakeSource>();
    auto metrics = std::make_shared<Metrics>();
    PoolRegistry registry(source, default_decoder(),
                          [](const PoolMetadata&) { throw FatalIngestionError("database gone"); },
                          std::chrono::seconds(5), metrics);

    REQUIRE_THROWS_AS(registry.resolve(key(7), complete_hint(key(8))), FatalIngestionError);
    REQUIRE_FALSE(registry.find(key(7)).has_value());
}

TEST_CASE("Pools registered from creation events and account writes", "[registry]") {
    auto source = std::make_shared<FakeSource>();
    auto metrics = std::make_shared<Metrics>();
    PersistLog log;
    PoolRegistry registry(source, default_decoder(), log.fn(), std::chrono::seconds(5), metrics);

    SECTION("Creation events persist once") {
        PoolMetadata meta;
        meta.address = key(10);
        meta.dex = DexKind::PumpFun;
        meta.mint_a = key(11);
        meta.mint_b = WSOL_MINT;
        meta.decimals_a = 6;
        meta.decimals_b = 9;

        registry.register_pool(meta);
        registry.register_pool(meta);

        REQUIRE(log.count() == 1);
        REQUIRE(registry.resolve(key(10)).mint_a == key(11));
        REQUIRE(source->fetches.load() == 0);
    }

    SECTION("Raydium state carries its own decimals") {
        Bytes data(752);
        data.u64(32, 6).u64(40, 9).pubkey(400, key(12)).pubkey(432, WSOL_MINT);

        registry.observe_account(key(13), DexKind::RaydiumAmm, data.data());

        auto found = registry.find(key(13));
        REQUIRE(found.has_value());
        REQUIRE(found->decimals_a == 6);
        REQUIRE(log.count() == 1);
    }

    SECTION("Anchor pool state needs known mint decimals") {
        Bytes data(211);
        data.u8(0, 241).u8(1, 154).u8(2, 109).u8(3, 4).u8(4, 17).u8(5, 177).u8(6, 109).u8(7, 188);
        data.pubkey(43, key(14)).pubkey(75, WSOL_MINT);

        registry.observe_account(key(15), DexKind::PumpAmm, data.data());
        REQUIRE_FALSE(registry.find(key(15)).has_value());

        PoolMetadata sibling;
        sibling.address = key(16);
        sibling.dex = DexKind::PumpFun;
        sibling.mint_a = key(14);
        sibling.mint_b = WSOL_MINT;
        sibling.decimals_a = 6;
        sibling.decimals_b = 9;
        registry.warm({sibling});

        registry.observe_account(key(15), DexKind::PumpAmm, data.data());
        auto found = registry.find(key(15));
        REQUIRE(found.has_value());
        REQUIRE(found->decimals_a == 6);
        REQUIRE(found->decimals_b == 9);
        REQUIRE(log.count() == 1);
    }

    SECTION("Warm pools are not persisted again") {
        PoolMetadata meta;
        meta.address = key(17);
        meta.mint_a = key(18);
        meta.mint_b = WSOL_MINT;
        registry.warm({meta});

        REQUIRE(registry.size() == 1);
        registry.observe_account(key(17), DexKind::RaydiumAmm, Bytes(752).data());
        REQUIRE(log.count() == 0);
    }
}
