#pragma once

#include "decoder.hpp"
#include "metrics.hpp"
#include "rpc_client.hpp"
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Where the registry gets metadata for an address it has never seen
class PoolMetadataSource {
public:
    virtual ~PoolMetadataSource() = default;
    // Throws MetadataUnresolvable
    virtual PoolMetadata fetch(const std::string& address, const PoolHint& hint) = 0;
};

// Observation hint first, then the pool account and its mint accounts over RPC
class RpcPoolSource : public PoolMetadataSource {
public:
    RpcPoolSource(std::shared_ptr<SolanaRPC> rpc, std::shared_ptr<const Decoder> decoder);

    PoolMetadata fetch(const std::string& address, const PoolHint& hint) override;

private:
    std::shared_ptr<SolanaRPC> rpc_;
    std::shared_ptr<const Decoder> decoder_;

    uint8_t mint_decimals(const std::optional<AccountInfo>& mint_account, const std::string& mint);
};

// Byte offset of `decimals` in an SPL token mint account
constexpr size_t MINT_DECIMALS_OFFSET = 44;

class PoolRegistry {
public:
    using PersistFn = std::function<void(const PoolMetadata&)>;

    PoolRegistry(std::shared_ptr<PoolMetadataSource> source,
                 std::shared_ptr<const Decoder> decoder,
                 PersistFn persist,
                 std::chrono::milliseconds timeout,
                 std::shared_ptr<Metrics> metrics);
    ~PoolRegistry();

    // Cached metadata, or a single-flight fetch shared by concurrent callers.
    // Throws MetadataUnresolvable.
    PoolMetadata resolve(const std::string& address, const PoolHint& hint = PoolHint());

    // Account write from a watched program; registers the pool if its state decodes
    void observe_account(const std::string& address, DexKind dex, const std::vector<uint8_t>& data);

    // Pool announced by a creation event
    void register_pool(const PoolMetadata& pool);

    // Preload pools already persisted
    void warm(const std::vector<PoolMetadata>& pools);

    std::optional<PoolMetadata> find(const std::string& address) const;
    size_t size() const;

private:
    std::shared_ptr<PoolMetadataSource> source_;
    std::shared_ptr<const Decoder> decoder_;
    PersistFn persist_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Metrics> metrics_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PoolMetadata> pools_;
    std::unordered_map<std::string, std::shared_future<PoolMetadata>> inflight_;
    std::unordered_map<std::string, uint8_t> mint_decimals_;
    size_t outstanding_ = 0;
    std::condition_variable idle_cv_;

    void run_fetch(const std::string& address, PoolHint hint,
                   std::shared_ptr<std::promise<PoolMetadata>> promise);
    void remember(const PoolMetadata& pool);
};
