#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& msg) : std::runtime_error(msg) {}
};

struct AccountInfo {
    std::string owner;
    uint64_t lamports = 0;
    std::vector<uint8_t> data;
};

// Block retrieval used for gap backfill
class BlockFetcher {
public:
    virtual ~BlockFetcher() = default;

    // Returns nullopt for a skipped slot
    virtual std::optional<nlohmann::json> get_block(uint64_t slot) = 0;
    virtual uint64_t get_slot() = 0;
};

class SolanaRPC : public BlockFetcher {
public:
    SolanaRPC(const std::vector<std::string>& rpc_urls, int timeout_ms = 8000,
              const std::string& commitment = "confirmed");
    ~SolanaRPC() override;

    SolanaRPC(const SolanaRPC&) = delete;
    SolanaRPC& operator=(const SolanaRPC&) = delete;

    std::optional<AccountInfo> get_account_info(const std::string& address);
    std::vector<std::optional<AccountInfo>> get_multiple_accounts(const std::vector<std::string>& addresses);
    std::optional<nlohmann::json> get_block(uint64_t slot) override;
    uint64_t get_slot() override;
    bool is_healthy();

private:
    std::vector<std::string> rpc_urls_;
    int timeout_ms_;
    std::string commitment_;
    CURL* curl_;
    size_t current_rpc_index_;
    uint64_t request_id_;
    std::mutex mutex_;

    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);
    nlohmann::json post(const nlohmann::json& payload);
    void rotate_rpc();

    static std::optional<AccountInfo> parse_account(const nlohmann::json& value);
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
