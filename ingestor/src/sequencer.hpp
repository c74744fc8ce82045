#pragma once

#include "metrics.hpp"
#include "types.hpp"
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

// Drops recently seen (txid, idx) keys and holds trades per slot until the
// slot is sealed. Owned by a single thread.
class Sequencer {
public:
    Sequencer(size_t dedup_window, uint64_t seal_lag_slots, std::shared_ptr<Metrics> metrics);

    // False when the trade is a duplicate within the window
    bool admit(const Trade& trade);

    // Releases every slot at least seal_lag_slots behind upstream_slot,
    // preceded by any trades that arrived for already-released slots.
    // upstream_slot must only cover trades already admitted.
    std::vector<Trade> advance(uint64_t upstream_slot);

    // Releases everything held
    std::vector<Trade> drain();

    size_t pending() const;

private:
    size_t window_;
    uint64_t seal_lag_;
    std::shared_ptr<Metrics> metrics_;

    std::unordered_set<std::string> seen_;
    std::deque<std::string> seen_order_;
    std::map<uint64_t, std::vector<Trade>> slots_;
    std::vector<Trade> late_;
    bool released_any_ = false;
    uint64_t released_through_ = 0;

    void release_slot(std::vector<Trade>& trades, std::vector<Trade>& out);
    static std::string key_of(const Trade& trade);
};
