#include "pool_registry.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <thread>

RpcPoolSource::RpcPoolSource(std::shared_ptr<SolanaRPC> rpc, std::shared_ptr<const Decoder> decoder)
    : rpc_(std::move(rpc)), decoder_(std::move(decoder)) {}

uint8_t RpcPoolSource::mint_decimals(const std::optional<AccountInfo>& mint_account,
                                     const std::string& mint) {
    if (mint == WSOL_MINT) {
        return WSOL_DECIMALS;
    }
    if (!mint_account || mint_account->data.size() <= MINT_DECIMALS_OFFSET) {
        throw MetadataUnresolvable("mint account " + mint + " not found");
    }
    return mint_account->data[MINT_DECIMALS_OFFSET];
}

PoolMetadata RpcPoolSource::fetch(const std::string& address, const PoolHint& hint) {
    PoolMetadata pool;
    pool.address = address;
    pool.dex = hint.dex;

    if (hint.is_complete()) {
        pool.mint_a = *hint.mint_a;
        pool.mint_b = *hint.mint_b;
        pool.decimals_a = *hint.decimals_a;
        pool.decimals_b = *hint.decimals_b;
        return pool;
    }

    try {
        auto account = rpc_->get_account_info(address);
        if (!account) {
            throw MetadataUnresolvable("pool account " + address + " does not exist");
        }

        auto view = decoder_->decode_pool_account(hint.dex, account->data);
        if (!view) {
            throw MetadataUnresolvable("pool account " + address + " matches no " +
                                       to_string(hint.dex) + " layout");
        }
        pool.mint_a = view->mint_a;
        pool.mint_b = view->mint_b;

        if (view->decimals_a && view->decimals_b) {
            pool.decimals_a = *view->decimals_a;
            pool.decimals_b = *view->decimals_b;
            return pool;
        }

        auto mints = rpc_->get_multiple_accounts({pool.mint_a, pool.mint_b});
        pool.decimals_a = mint_decimals(mints[0], pool.mint_a);
        pool.decimals_b = mint_decimals(mints[1], pool.mint_b);
        return pool;

    } catch (const RpcError& e) {
        throw MetadataUnresolvable("RPC lookup of " + address + " failed: " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw MetadataUnresolvable("RPC lookup of " + address + " returned bad JSON: " + e.what());
    }
}

PoolRegistry::PoolRegistry(std::shared_ptr<PoolMetadataSource> source,
                           std::shared_ptr<const Decoder> decoder,
                           PersistFn persist,
                           std::chrono::milliseconds timeout,
                           std::shared_ptr<Metrics> metrics)
    : source_(std::move(source))
    , decoder_(std::move(decoder))
    , persist_(std::move(persist))
    , timeout_(timeout)
    , metrics_(std::move(metrics)) {
    mint_decimals_[WSOL_MINT] = WSOL_DECIMALS;
}

PoolRegistry::~PoolRegistry() {
    // Fetch threads hold `this`; wait for the stragglers of timed-out lookups
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
}

PoolMetadata PoolRegistry::resolve(const std::string& address, const PoolHint& hint) {
    std::shared_future<PoolMetadata> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = pools_.find(address);
        if (cached != pools_.end()) {
            return cached->second;
        }

        auto pending = inflight_.find(address);
        if (pending != inflight_.end()) {
            result = pending->second;
        } else {
            auto promise = std::make_shared<std::promise<PoolMetadata>>();
            result = promise->get_future().share();
            inflight_[address] = result;
            ++outstanding_;
            metrics_->pool_fetches++;
            std::thread(&PoolRegistry::run_fetch, this, address, hint, promise).detach();
        }
    }

    if (result.wait_for(timeout_) == std::future_status::timeout) {
        throw MetadataUnresolvable("metadata fetch for " + address + " timed out");
    }
    return result.get();
}

void PoolRegistry::run_fetch(const std::string& address, PoolHint hint,
                             std::shared_ptr<std::promise<PoolMetadata>> promise) {
    try {
        auto pool = source_->fetch(address, hint);
        pool.address = address;
        // Persist first; the cache only ever holds pools that have a row
        if (persist_) {
            persist_(pool);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remember(pool);
            inflight_.erase(address);
        }
        promise->set_value(pool);
    } catch (const std::exception& e) {
        spdlog::debug("Pool {} unresolved: {}", address, e.what());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inflight_.erase(address);
        }
        promise->set_exception(std::current_exception());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --outstanding_;
    idle_cv_.notify_all();
}

void PoolRegistry::observe_account(const std::string& address, DexKind dex,
                                   const std::vector<uint8_t>& data) {
    PoolMetadata pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pools_.count(address) || inflight_.count(address)) {
            return;
        }

        auto view = decoder_->decode_pool_account(dex, data);
        if (!view) {
            return;
        }

        pool.address = address;
        pool.dex = dex;
        pool.mint_a = view->mint_a;
        pool.mint_b = view->mint_b;

        auto known_a = mint_decimals_.find(view->mint_a);
        auto known_b = mint_decimals_.find(view->mint_b);
        if (view->decimals_a) {
            pool.decimals_a = *view->decimals_a;
        } else if (known_a != mint_decimals_.end()) {
            pool.decimals_a = known_a->second;
        } else {
            return;
        }
        if (view->decimals_b) {
            pool.decimals_b = *view->decimals_b;
        } else if (known_b != mint_decimals_.end()) {
            pool.decimals_b = known_b->second;
        } else {
            return;
        }
    }

    register_pool(pool);
}

void PoolRegistry::register_pool(const PoolMetadata& pool) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pools_.count(pool.address) || inflight_.count(pool.address)) {
            return;
        }
    }

    if (persist_) {
        persist_(pool);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!pools_.count(pool.address)) {
        remember(pool);
    }
}

void PoolRegistry::warm(const std::vector<PoolMetadata>& pools) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pool : pools) {
        remember(pool);
    }
    spdlog::info("Pool registry warmed with {} pools", pools.size());
}

std::optional<PoolMetadata> PoolRegistry::find(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(address);
    if (it == pools_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t PoolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.size();
}

void PoolRegistry::remember(const PoolMetadata& pool) {
    pools_.emplace(pool.address, pool);
    mint_decimals_.emplace(pool.mint_a, pool.decimals_a);
    mint_decimals_.emplace(pool.mint_b, pool.decimals_b);
}
