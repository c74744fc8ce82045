#pragma once

#include "types.hpp"
#include <vector>

struct WriteResult {
    size_t attempted = 0;
    // Positions in the submitted batch of the rows that were actually inserted
    std::vector<size_t> inserted;

    size_t conflicts() const { return attempted - inserted.size(); }
};

// Relational ledger. Inserts are insert-or-ignore on the natural keys and
// each call is one transaction.
class TradeStore {
public:
    virtual ~TradeStore() = default;

    virtual WriteResult insert_trades(const std::vector<Trade>& trades) = 0;
    // True when the pool row was new
    virtual bool insert_pool(const PoolMetadata& pool) = 0;
    virtual std::vector<PoolMetadata> load_pools() = 0;
    virtual bool ping() = 0;
};
