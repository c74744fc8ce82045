#include "sequencer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <tuple>

Sequencer::Sequencer(size_t dedup_window, uint64_t seal_lag_slots, std::shared_ptr<Metrics> metrics)
    : window_(dedup_window == 0 ? 1 : dedup_window)
    , seal_lag_(seal_lag_slots)
    , metrics_(std::move(metrics)) {}

std::string Sequencer::key_of(const Trade& trade) {
    return trade.txid + ":" + std::to_string(trade.idx);
}

bool Sequencer::admit(const Trade& trade) {
    auto key = key_of(trade);
    if (!seen_.insert(key).second) {
        metrics_->duplicates++;
        spdlog::debug("Duplicate trade {}", key);
        return false;
    }
    seen_order_.push_back(std::move(key));
    while (seen_order_.size() > window_) {
        seen_.erase(seen_order_.front());
        seen_order_.pop_front();
    }

    metrics_->trades_admitted++;
    if (released_any_ && trade.slot <= released_through_) {
        metrics_->late_trades++;
        spdlog::warn("Trade {} arrived after slot {} was sealed", key_of(trade), trade.slot);
        late_.push_back(trade);
    } else {
        slots_[trade.slot].push_back(trade);
    }
    return true;
}

void Sequencer::release_slot(std::vector<Trade>& trades, std::vector<Trade>& out) {
    std::stable_sort(trades.begin(), trades.end(), [](const Trade& a, const Trade& b) {
        return std::tie(a.slot, a.idx, a.tx_index, a.txid) < std::tie(b.slot, b.idx, b.tx_index, b.txid);
    });
    for (auto& trade : trades) {
        out.push_back(std::move(trade));
    }
}

std::vector<Trade> Sequencer::advance(uint64_t upstream_slot) {
    std::vector<Trade> out;
    release_slot(late_, out);
    late_.clear();

    if (upstream_slot < seal_lag_) {
        return out;
    }
    uint64_t sealed = upstream_slot - seal_lag_;

    auto it = slots_.begin();
    while (it != slots_.end() && it->first <= sealed) {
        release_slot(it->second, out);
        it = slots_.erase(it);
    }
    if (!released_any_ || sealed > released_through_) {
        released_through_ = sealed;
        released_any_ = true;
    }
    return out;
}

std::vector<Trade> Sequencer::drain() {
    std::vector<Trade> out;
    release_slot(late_, out);
    late_.clear();

    for (auto& [slot, trades] : slots_) {
        release_slot(trades, out);
        if (!released_any_ || slot > released_through_) {
            released_through_ = slot;
            released_any_ = true;
        }
    }
    slots_.clear();
    return out;
}

size_t Sequencer::pending() const {
    size_t count = late_.size();
    for (const auto& [slot, trades] : slots_) {
        count += trades.size();
    }
    return count;
}
