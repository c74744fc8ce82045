#include "rpc_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// Slot skipped or not available in long-term storage
bool is_missing_block(int code) {
    return code == -32007 || code == -32009 || code == -32004;
}

} // namespace

SolanaRPC::SolanaRPC(const std::vector<std::string>& rpc_urls, int timeout_ms,
                     const std::string& commitment)
    : rpc_urls_(rpc_urls)
    , timeout_ms_(timeout_ms)
    , commitment_(commitment)
    , curl_(curl_easy_init())
    , current_rpc_index_(0)
    , request_id_(0)
{
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
    if (rpc_urls_.empty()) {
        curl_easy_cleanup(curl_);
        throw std::runtime_error("At least one RPC URL is required");
    }

    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
}

SolanaRPC::~SolanaRPC() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

size_t SolanaRPC::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

void SolanaRPC::rotate_rpc() {
    current_rpc_index_ = (current_rpc_index_ + 1) % rpc_urls_.size();
    spdlog::warn("Rotated to RPC endpoint: {}", rpc_urls_[current_rpc_index_]);
}

nlohmann::json SolanaRPC::post(const nlohmann::json& payload) {
    std::string body = payload.dump();

    // One pass over the endpoint list; a transport failure moves to the next one
    for (size_t attempt = 0; attempt < rpc_urls_.size(); ++attempt) {
        std::string response_string;
        const std::string& url = rpc_urls_[current_rpc_index_];

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_string);

        struct curl_slist* headers = NULL;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl_);
        curl_slist_free_all(headers);

        if (res != CURLE_OK) {
            spdlog::error("RPC request failed: {}", curl_easy_strerror(res));
            rotate_rpc();
            continue;
        }

        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        if (status == 429 || status >= 500) {
            spdlog::warn("RPC endpoint {} answered HTTP {}", url, status);
            rotate_rpc();
            continue;
        }

        try {
            return nlohmann::json::parse(response_string);
        } catch (const std::exception& e) {
            spdlog::error("Failed to parse RPC response: {}", e.what());
            rotate_rpc();
        }
    }

    throw RpcError("all RPC endpoints failed for " + payload.value("method", std::string("request")));
}

nlohmann::json SolanaRPC::make_request(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", ++request_id_},
        {"method", method},
        {"params", params}
    };

    return post(payload);
}

std::optional<AccountInfo> SolanaRPC::parse_account(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::nullopt;
    }

    AccountInfo info;
    info.owner = value.at("owner").get<std::string>();
    info.lamports = value.value("lamports", static_cast<uint64_t>(0));

    const auto& data = value.at("data");
    if (!data.is_array() || data.empty() || !util::base64_decode(data[0].get<std::string>(), info.data)) {
        throw RpcError("account data is not base64");
    }
    return info;
}

std::optional<AccountInfo> SolanaRPC::get_account_info(const std::string& address) {
    auto response = make_request("getAccountInfo", {
        address,
        {{"encoding", "base64"}, {"commitment", commitment_}}
    });

    if (response.contains("error")) {
        throw RpcError("getAccountInfo " + address + ": " + response["error"].dump());
    }

    return parse_account(response.at("result").at("value"));
}

std::vector<std::optional<AccountInfo>> SolanaRPC::get_multiple_accounts(
    const std::vector<std::string>& addresses) {
    auto response = make_request("getMultipleAccounts", {
        addresses,
        {{"encoding", "base64"}, {"commitment", commitment_}}
    });

    if (response.contains("error")) {
        throw RpcError("getMultipleAccounts: " + response["error"].dump());
    }

    std::vector<std::optional<AccountInfo>> accounts;
    for (const auto& value : response.at("result").at("value")) {
        accounts.push_back(parse_account(value));
    }
    if (accounts.size() != addresses.size()) {
        throw RpcError("getMultipleAccounts returned " + std::to_string(accounts.size()) +
                       " accounts for " + std::to_string(addresses.size()) + " addresses");
    }
    return accounts;
}

std::optional<nlohmann::json> SolanaRPC::get_block(uint64_t slot) {
    auto response = make_request("getBlock", {
        slot,
        {
            {"encoding", "json"},
            {"transactionDetails", "full"},
            {"maxSupportedTransactionVersion", 0},
            {"rewards", false},
            {"commitment", commitment_}
        }
    });

    if (response.contains("error")) {
        int code = response["error"].value("code", 0);
        if (is_missing_block(code)) {
            spdlog::debug("Slot {} has no block: {}", slot, response["error"].value("message", ""));
            return std::nullopt;
        }
        throw RpcError("getBlock " + std::to_string(slot) + ": " + response["error"].dump());
    }

    const auto& result = response.at("result");
    if (result.is_null()) {
        return std::nullopt;
    }
    return result;
}

uint64_t SolanaRPC::get_slot() {
    nlohmann::json params = nlohmann::json::array();
    params.push_back({{"commitment", commitment_}});
    auto response = make_request("getSlot", params);
    if (response.contains("error")) {
        throw RpcError("getSlot: " + response["error"].dump());
    }
    return response.at("result").get<uint64_t>();
}

bool SolanaRPC::is_healthy() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json payload = {
            {"jsonrpc", "2.0"},
            {"id", ++request_id_},
            {"method", "getHealth"}
        };
        auto response = post(payload);
        return response.contains("result") && response["result"] == "ok";
    } catch (const RpcError& e) {
        spdlog::warn("RPC health check failed: {}", e.what());
        return false;
    }
}
