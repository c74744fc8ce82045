#include "normalizer.hpp"
#include <cmath>

namespace {

using u128 = unsigned __int128;

// 10^38 is the largest power of ten below 2^128
constexpr unsigned kMaxPow10 = 38;

u128 pow10(unsigned exp) {
    u128 value = 1;
    for (unsigned i = 0; i < exp; ++i) {
        value *= 10;
    }
    return value;
}

bool fits_scaled(uint64_t amount, unsigned exp) {
    if (exp > kMaxPow10) return false;
    return amount == 0 || pow10(exp) <= (~static_cast<u128>(0)) / amount;
}

// Which side of the pool the input leg is on
bool resolve_in_is_base(const SwapEvent& event, const PoolMetadata& pool) {
    if (event.in_mint) {
        if (*event.in_mint == pool.mint_a) return true;
        if (*event.in_mint == pool.mint_b) return false;
        throw InconsistentPool("input mint " + *event.in_mint + " is not in pool " + pool.address);
    }
    if (event.out_mint) {
        if (*event.out_mint == pool.mint_a) return false;
        if (*event.out_mint == pool.mint_b) return true;
        throw InconsistentPool("output mint " + *event.out_mint + " is not in pool " + pool.address);
    }
    return event.in_is_base;
}

// Reserves are reported on the hint's sides, which need not match the
// pool's orientation
bool sol_reserve_is_a(const SwapEvent& event, const PoolMetadata& pool) {
    if (event.hint.mint_a) return *event.hint.mint_a == WSOL_MINT;
    if (event.hint.mint_b) return *event.hint.mint_b != WSOL_MINT;
    return pool.mint_a == WSOL_MINT;
}

} // namespace

double Normalizer::price_sol(uint64_t sol_amt, uint64_t token_amt, uint8_t token_decimals) {
    if (token_amt == 0) {
        throw ZeroAmount("token amount is zero");
    }

    // sol * 10^dec / (token * 10^9), with the common power of ten cancelled
    u128 numerator = sol_amt;
    u128 denominator = token_amt;
    if (token_decimals >= WSOL_DECIMALS) {
        unsigned exp = token_decimals - WSOL_DECIMALS;
        if (!fits_scaled(sol_amt, exp)) {
            return static_cast<double>(static_cast<long double>(sol_amt) *
                                       std::pow(10.0L, static_cast<long double>(exp)) /
                                       static_cast<long double>(token_amt));
        }
        numerator *= pow10(exp);
    } else {
        denominator *= pow10(WSOL_DECIMALS - token_decimals);
    }

    u128 whole = numerator / denominator;
    u128 rest = numerator % denominator;
    return static_cast<double>(static_cast<long double>(whole) +
                               static_cast<long double>(rest) / static_cast<long double>(denominator));
}

Trade Normalizer::normalize(const SwapEvent& event, const PoolMetadata& pool) {
    if (!pool.is_sol_pool()) {
        throw NonSolPool("pool " + pool.address + " has no WSOL side");
    }
    if (event.mint && *event.mint != pool.mint_a && *event.mint != pool.mint_b) {
        throw InconsistentPool("mint " + *event.mint + " is not in pool " + pool.address);
    }

    bool in_is_base = resolve_in_is_base(event, pool);
    bool sol_is_base = pool.mint_a == WSOL_MINT;
    bool sol_in = in_is_base == sol_is_base;

    Trade trade;
    trade.blk_ts = event.block_ts;
    trade.slot = event.slot;
    trade.txid = event.txid;
    trade.idx = event.idx;
    trade.tx_index = event.tx_index;
    trade.mint = pool.token_mint();
    trade.decimals = pool.token_decimals();
    trade.trader = event.trader;
    trade.dex = pool.dex;
    trade.pool = pool.address;
    trade.is_buy = sol_in;
    trade.sol_amt = sol_in ? event.raw_in_amount : event.raw_out_amount;
    trade.token_amt = sol_in ? event.raw_out_amount : event.raw_in_amount;

    if (trade.sol_amt == 0 || trade.token_amt == 0) {
        throw ZeroAmount("zero amount in " + event.txid + ":" + std::to_string(event.idx));
    }

    trade.price_sol = price_sol(trade.sol_amt, trade.token_amt, trade.decimals);

    bool sol_a = sol_reserve_is_a(event, pool);
    trade.pool_sol_amt = (sol_a ? event.reserve_a : event.reserve_b).value_or(0);
    trade.pool_token_amt = (sol_a ? event.reserve_b : event.reserve_a).value_or(0);
    return trade;
}
