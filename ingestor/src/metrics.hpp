#pragma once

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>

// Process-wide pipeline counters, shared by pointer between components
struct Metrics {
    // Upstream
    std::atomic<uint64_t> updates_received{0};
    std::atomic<uint64_t> reconnects{0};
    std::atomic<uint64_t> backfilled_slots{0};
    std::atomic<uint64_t> last_slot{0};

    // Drops
    std::atomic<uint64_t> decode_errors{0};
    std::atomic<uint64_t> unresolvable{0};
    std::atomic<uint64_t> inconsistent{0};
    std::atomic<uint64_t> non_sol_pool{0};
    std::atomic<uint64_t> zero_amount{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> late_trades{0};

    // Pools
    std::atomic<uint64_t> pool_fetches{0};
    std::atomic<uint64_t> pools_registered{0};
    std::atomic<uint64_t> curves_completed{0};

    // Writes
    std::atomic<uint64_t> swaps_decoded{0};
    std::atomic<uint64_t> trades_admitted{0};
    std::atomic<uint64_t> trades_written{0};
    std::atomic<uint64_t> conflicts{0};
    std::atomic<uint64_t> batches_written{0};
    std::atomic<uint64_t> batch_retries{0};
    std::atomic<uint64_t> batch_failures{0};
    std::atomic<uint64_t> publish_failures{0};

    void observe_slot(uint64_t slot) {
        uint64_t current = last_slot.load();
        while (slot > current && !last_slot.compare_exchange_weak(current, slot)) {
        }
    }

    nlohmann::json to_json() const;
};
