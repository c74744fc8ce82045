#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

// Swap on a pool without WSOL on either side
class NonSolPool : public std::runtime_error {
public:
    explicit NonSolPool(const std::string& msg) : std::runtime_error(msg) {}
};

// Swap with a zero SOL or token leg
class ZeroAmount : public std::runtime_error {
public:
    explicit ZeroAmount(const std::string& msg) : std::runtime_error(msg) {}
};

class Normalizer {
public:
    // Throws InconsistentPool, NonSolPool or ZeroAmount
    static Trade normalize(const SwapEvent& event, const PoolMetadata& pool);

    // (sol / 10^9) / (token / 10^token_decimals), exact up to the final division
    static double price_sol(uint64_t sol_amt, uint64_t token_amt, uint8_t token_decimals);
};
