#pragma once

#include "types.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Flattens Solana blocks (getBlock or blockNotification, "json" encoding)
// into one RawUpdate per watched-program invocation.
class BlockParser {
public:
    explicit BlockParser(const std::vector<std::string>& watched_programs);

    std::vector<RawUpdate> parse_block(const nlohmann::json& block, uint64_t slot) const;

    // programNotification value: {pubkey, account: {data, owner, ...}}
    std::optional<RawUpdate> parse_account(const nlohmann::json& value, uint64_t slot) const;

    bool is_watched(const std::string& program_id) const;

private:
    std::set<std::string> watched_;

    void parse_transaction(const nlohmann::json& entry, uint64_t slot, uint64_t tx_index,
                           int64_t block_ts, std::vector<RawUpdate>& out) const;
};
