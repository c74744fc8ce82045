#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <random>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::vector<std::string> split(const std::string& str, char delim);
    int random_jitter(int min_ms, int max_ms);

    // Exponential backoff for the given 0-based attempt, capped and jittered.
    int backoff_ms(int attempt, int min_ms, int max_ms);

    std::string redact_dsn(const std::string& dsn);
    std::string short_addr(const std::string& addr);

    // Codecs used by Solana payloads. Decoders return false on malformed input.
    std::string base58_encode(const std::vector<uint8_t>& bytes);
    bool base58_decode(const std::string& str, std::vector<uint8_t>& out);
    std::string base64_encode(const std::vector<uint8_t>& bytes);
    bool base64_decode(const std::string& str, std::vector<uint8_t>& out);
    bool is_valid_solana_address(const std::string& address);
}
