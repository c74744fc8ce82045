#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

constexpr const char* WSOL_MINT = "So11111111111111111111111111111111111111112";
constexpr uint8_t WSOL_DECIMALS = 9;

enum class DexKind : uint8_t {
    PumpFun = 0,
    PumpAmm,
    RaydiumAmm,
    MeteoraDlmm,
    MeteoraDamm,
};

constexpr size_t kDexKindCount = 5;

std::string to_string(DexKind dex);
std::optional<DexKind> dex_from_string(const std::string& name);

// Static metadata of a liquidity pool. Never mutated after first sight.
struct PoolMetadata {
    std::string address;
    DexKind dex = DexKind::PumpFun;
    std::string mint_a;
    std::string mint_b;
    uint8_t decimals_a = 0;
    uint8_t decimals_b = 0;

    bool is_sol_pool() const { return mint_a == WSOL_MINT || mint_b == WSOL_MINT; }
    // The non-SOL side of a SOL pool
    const std::string& token_mint() const { return mint_a == WSOL_MINT ? mint_b : mint_a; }
    uint8_t token_decimals() const { return mint_a == WSOL_MINT ? decimals_b : decimals_a; }
};

// Partial metadata observed alongside an event (vault balances, event fields)
struct PoolHint {
    DexKind dex = DexKind::PumpFun;
    std::optional<std::string> mint_a;
    std::optional<std::string> mint_b;
    std::optional<uint8_t> decimals_a;
    std::optional<uint8_t> decimals_b;

    bool is_complete() const {
        return mint_a && mint_b && decimals_a && decimals_b;
    }
};

struct TokenBalance {
    std::string mint;
    uint8_t decimals = 0;
    uint64_t amount = 0;
};

// Instruction account as seen in the transaction, with token balances if it is a token account
struct IxAccount {
    std::string pubkey;
    std::optional<TokenBalance> pre;
    std::optional<TokenBalance> post;
};

enum class UpdateKind : uint8_t {
    Instruction,
    AccountWrite,
};

// One unit of upstream activity: a watched-program invocation inside a
// transaction, or a write to an account owned by a watched program.
struct RawUpdate {
    UpdateKind kind = UpdateKind::Instruction;
    uint64_t slot = 0;
    uint64_t seq = 0;               // arrival order, assigned by the subscriber
    int64_t block_ts = 0;           // unix seconds
    std::string program_id;

    // Instruction updates
    std::string txid;
    uint64_t tx_index = 0;          // position of the transaction in its block
    uint64_t idx = 0;               // invocation ordinal within the transaction
    std::vector<IxAccount> accounts;
    std::vector<uint8_t> ix_data;
    std::vector<std::vector<uint8_t>> payloads;   // event logs and self-CPI event data

    // Account-write updates
    std::string account;
    std::vector<uint8_t> account_data;
};

struct SwapEvent {
    std::string pool_address;
    DexKind dex = DexKind::PumpFun;
    uint64_t slot = 0;
    std::string txid;
    uint64_t idx = 0;
    uint64_t tx_index = 0;
    int64_t block_ts = 0;
    std::string trader;
    uint64_t raw_in_amount = 0;
    uint64_t raw_out_amount = 0;
    // Input leg is the pool's base-side mint (mint_a)
    bool in_is_base = false;
    // Traded mint named by the payload, checked against the pool
    std::optional<std::string> mint;
    // Input mint, when the layout identifies the input side by mint only
    std::optional<std::string> in_mint;
    // Output mint, the fallback when the input account carries no balance
    std::optional<std::string> out_mint;
    PoolHint hint;
    // Reserves after the swap on the hint's mint_a / mint_b sides
    std::optional<uint64_t> reserve_a;
    std::optional<uint64_t> reserve_b;
};

struct Trade {
    int64_t blk_ts = 0;
    uint64_t slot = 0;
    std::string txid;
    uint64_t idx = 0;
    uint64_t tx_index = 0;
    std::string mint;
    uint8_t decimals = 0;
    std::string trader;
    DexKind dex = DexKind::PumpFun;
    std::string pool;
    bool is_buy = false;
    uint64_t sol_amt = 0;
    uint64_t token_amt = 0;
    double price_sol = 0.0;
    // Pool reserves after the swap; published, not persisted. 0 when unknown.
    uint64_t pool_sol_amt = 0;
    uint64_t pool_token_amt = 0;
};

// Pump.fun bonding curve completion
struct CurveComplete {
    int64_t blk_ts = 0;
    uint64_t slot = 0;
    std::string txid;
    uint64_t idx = 0;
    std::string user;
    std::string mint;
    std::string bonding_curve;
};

nlohmann::json to_json(const Trade& trade);
nlohmann::json to_json(const PoolMetadata& pool);
nlohmann::json to_json(const CurveComplete& complete);

// Error taxonomy

// Pool address does not match any supported pool layout, or the fetch timed out
class MetadataUnresolvable : public std::runtime_error {
public:
    explicit MetadataUnresolvable(const std::string& msg) : std::runtime_error(msg) {}
};

// Event names a mint that is on neither side of its pool
class InconsistentPool : public std::runtime_error {
public:
    explicit InconsistentPool(const std::string& msg) : std::runtime_error(msg) {}
};

// Unrecoverable ingestion failure that must reach the operator
class FatalIngestionError : public std::runtime_error {
public:
    explicit FatalIngestionError(const std::string& msg) : std::runtime_error(msg) {}
};
