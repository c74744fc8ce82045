#include "types.hpp"
#include "util.hpp"

std::string to_string(DexKind dex) {
    switch (dex) {
        case DexKind::PumpFun: return "Pumpfun";
        case DexKind::PumpAmm: return "PumpAmm";
        case DexKind::RaydiumAmm: return "RaydiumAmm";
        case DexKind::MeteoraDlmm: return "MeteoraDlmm";
        case DexKind::MeteoraDamm: return "MeteoraDamm";
    }
    return "Unknown";
}

std::optional<DexKind> dex_from_string(const std::string& name) {
    for (size_t i = 0; i < kDexKindCount; ++i) {
        auto dex = static_cast<DexKind>(i);
        if (to_string(dex) == name) {
            return dex;
        }
    }
    return std::nullopt;
}

nlohmann::json to_json(const Trade& trade) {
    return {
        {"kind", "Trade"},
        {"blk_ts", trade.blk_ts},
        {"slot", trade.slot},
        {"txid", trade.txid},
        {"idx", trade.idx},
        {"mint", trade.mint},
        {"decimals", trade.decimals},
        {"trader", trade.trader},
        {"dex", to_string(trade.dex)},
        {"pool", trade.pool},
        {"pool_sol_amt", trade.pool_sol_amt},
        {"pool_token_amt", trade.pool_token_amt},
        {"is_buy", trade.is_buy},
        {"sol_amt", trade.sol_amt},
        {"token_amt", trade.token_amt},
        {"price_sol", trade.price_sol},
        {"ts", util::current_iso8601()}
    };
}

nlohmann::json to_json(const PoolMetadata& pool) {
    return {
        {"kind", "PoolCreated"},
        {"addr", pool.address},
        {"dex", to_string(pool.dex)},
        {"mint_a", pool.mint_a},
        {"mint_b", pool.mint_b},
        {"decimals_a", pool.decimals_a},
        {"decimals_b", pool.decimals_b},
        {"ts", util::current_iso8601()}
    };
}

nlohmann::json to_json(const CurveComplete& complete) {
    return {
        {"kind", "PumpfunComplete"},
        {"blk_ts", complete.blk_ts},
        {"slot", complete.slot},
        {"txid", complete.txid},
        {"idx", complete.idx},
        {"user", complete.user},
        {"mint", complete.mint},
        {"bonding_curve", complete.bonding_curve},
        {"ts", util::current_iso8601()}
    };
}
