#include "block_parser.hpp"
#include "layouts.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <map>

namespace {

const std::string INVOKE_PREFIX = "Program ";
const std::string DATA_PREFIX = "Program data: ";
const std::string RAY_LOG_PREFIX = "Program log: ray_log: ";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

struct FlatInstruction {
    size_t program_index = 0;
    std::vector<size_t> accounts;
    std::string data;
    int stack_height = 1;
};

std::vector<std::string> account_keys(const nlohmann::json& tx, const nlohmann::json& meta) {
    std::vector<std::string> keys;
    for (const auto& key : tx.at("message").at("accountKeys")) {
        // jsonParsed encoding wraps keys in objects
        keys.push_back(key.is_string() ? key.get<std::string>() : key.at("pubkey").get<std::string>());
    }

    if (meta.contains("loadedAddresses") && meta["loadedAddresses"].is_object()) {
        const auto& loaded = meta["loadedAddresses"];
        for (const char* part : {"writable", "readonly"}) {
            if (loaded.contains(part)) {
                for (const auto& key : loaded[part]) {
                    keys.push_back(key.get<std::string>());
                }
            }
        }
    }
    return keys;
}

FlatInstruction flat_instruction(const nlohmann::json& ix, int default_height) {
    FlatInstruction flat;
    flat.program_index = ix.at("programIdIndex").get<size_t>();
    flat.accounts = ix.value("accounts", std::vector<size_t>{});
    flat.data = ix.value("data", std::string());
    if (ix.contains("stackHeight") && ix["stackHeight"].is_number()) {
        flat.stack_height = ix["stackHeight"].get<int>();
    } else {
        flat.stack_height = default_height;
    }
    return flat;
}

std::map<size_t, TokenBalance> token_balances(const nlohmann::json& meta, const char* field) {
    std::map<size_t, TokenBalance> balances;
    if (!meta.contains(field) || !meta[field].is_array()) {
        return balances;
    }
    for (const auto& b : meta[field]) {
        TokenBalance balance;
        balance.mint = b.at("mint").get<std::string>();
        const auto& ui = b.at("uiTokenAmount");
        balance.decimals = ui.at("decimals").get<uint8_t>();
        balance.amount = std::stoull(ui.at("amount").get<std::string>());
        balances[b.at("accountIndex").get<size_t>()] = balance;
    }
    return balances;
}

// Event payloads keyed by invocation ordinal, following the invoke/success
// structure of the transaction log.
std::map<uint64_t, std::vector<std::vector<uint8_t>>> log_payloads(const nlohmann::json& meta) {
    std::map<uint64_t, std::vector<std::vector<uint8_t>>> payloads;
    if (!meta.contains("logMessages") || !meta["logMessages"].is_array()) {
        return payloads;
    }

    std::vector<uint64_t> stack;
    uint64_t ordinal = 0;

    for (const auto& entry : meta["logMessages"]) {
        if (!entry.is_string()) continue;
        const auto& line = entry.get_ref<const std::string&>();

        if (starts_with(line, "Log truncated")) {
            break;
        }

        if (starts_with(line, DATA_PREFIX) || starts_with(line, RAY_LOG_PREFIX)) {
            if (stack.empty()) continue;
            const auto& prefix = starts_with(line, DATA_PREFIX) ? DATA_PREFIX : RAY_LOG_PREFIX;
            std::vector<uint8_t> bytes;
            if (util::base64_decode(line.substr(prefix.size()), bytes)) {
                payloads[stack.back()].push_back(std::move(bytes));
            }
            continue;
        }

        if (starts_with(line, INVOKE_PREFIX)) {
            // "Program <id> invoke [n]", "Program <id> success", "Program <id> failed: ..."
            auto rest = line.substr(INVOKE_PREFIX.size());
            auto space = rest.find(' ');
            if (space == std::string::npos || space == 0 || rest[space - 1] == ':') continue;
            auto verb = rest.substr(space + 1);
            if (starts_with(verb, "invoke [")) {
                stack.push_back(ordinal++);
            } else if (verb == "success" || starts_with(verb, "failed")) {
                if (!stack.empty()) stack.pop_back();
            }
        }
    }

    return payloads;
}

} // namespace

BlockParser::BlockParser(const std::vector<std::string>& watched_programs)
    : watched_(watched_programs.begin(), watched_programs.end()) {}

bool BlockParser::is_watched(const std::string& program_id) const {
    return watched_.count(program_id) > 0;
}

std::vector<RawUpdate> BlockParser::parse_block(const nlohmann::json& block, uint64_t slot) const {
    std::vector<RawUpdate> updates;
    if (block.is_null() || !block.contains("transactions")) {
        return updates;
    }

    // Nodes may not know the block time yet; record ingestion time instead
    int64_t block_ts = 0;
    if (block.contains("blockTime") && block["blockTime"].is_number()) {
        block_ts = block["blockTime"].get<int64_t>();
    } else {
        block_ts = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    uint64_t tx_index = 0;
    for (const auto& entry : block["transactions"]) {
        size_t before = updates.size();
        try {
            parse_transaction(entry, slot, tx_index, block_ts, updates);
        } catch (const std::exception& e) {
            updates.erase(updates.begin() + before, updates.end());
            spdlog::warn("Skipping malformed transaction {} in slot {}: {}", tx_index, slot, e.what());
        }
        ++tx_index;
    }

    return updates;
}

void BlockParser::parse_transaction(const nlohmann::json& entry, uint64_t slot, uint64_t tx_index,
                                    int64_t block_ts, std::vector<RawUpdate>& out) const {
    const auto& meta = entry.at("meta");
    if (meta.is_null()) return;
    // Failed transactions change no pool state
    if (meta.contains("err") && !meta["err"].is_null()) return;

    const auto& tx = entry.at("transaction");
    std::string txid = tx.at("signatures").at(0).get<std::string>();
    auto keys = account_keys(tx, meta);
    auto pre = token_balances(meta, "preTokenBalances");
    auto post = token_balances(meta, "postTokenBalances");
    auto payloads = log_payloads(meta);

    std::map<size_t, const nlohmann::json*> inner_by_index;
    if (meta.contains("innerInstructions") && meta["innerInstructions"].is_array()) {
        for (const auto& group : meta["innerInstructions"]) {
            inner_by_index[group.at("index").get<size_t>()] = &group.at("instructions");
        }
    }

    // Depth-first execution order: each top-level instruction, then its CPIs
    std::vector<FlatInstruction> flat;
    const auto& top = tx.at("message").at("instructions");
    for (size_t i = 0; i < top.size(); ++i) {
        flat.push_back(flat_instruction(top[i], 1));
        auto it = inner_by_index.find(i);
        if (it != inner_by_index.end()) {
            for (const auto& ix : *it->second) {
                flat.push_back(flat_instruction(ix, 2));
            }
        }
    }

    // Per stack height, the output position of the watched invocation open at that height
    std::map<int, std::pair<std::string, size_t>> open;
    size_t first_of_tx = out.size();

    for (size_t ordinal = 0; ordinal < flat.size(); ++ordinal) {
        const auto& ix = flat[ordinal];
        if (ix.stack_height <= 1) {
            open.clear();
        }
        if (ix.program_index >= keys.size()) {
            throw std::runtime_error("programIdIndex out of range");
        }
        const auto& program = keys[ix.program_index];

        std::vector<uint8_t> data;
        if (!ix.data.empty() && !util::base58_decode(ix.data, data)) {
            data.clear();
        }

        // Anchor self-CPI event: belongs to the invoking instruction of the same program
        if (data.size() >= ANCHOR_EVENT_TAG.size() &&
            std::equal(ANCHOR_EVENT_TAG.begin(), ANCHOR_EVENT_TAG.end(), data.begin())) {
            auto parent = open.find(ix.stack_height - 1);
            if (parent != open.end() && parent->second.first == program) {
                out[parent->second.second].payloads.emplace_back(
                    data.begin() + ANCHOR_EVENT_TAG.size(), data.end());
                continue;
            }
            // Without stack heights, fall back to the latest invocation of the program
            if (parent == open.end()) {
                bool attached = false;
                for (size_t i = out.size(); i > first_of_tx; --i) {
                    if (out[i - 1].program_id == program) {
                        out[i - 1].payloads.emplace_back(data.begin() + ANCHOR_EVENT_TAG.size(), data.end());
                        attached = true;
                        break;
                    }
                }
                if (attached) continue;
            }
        }

        // Deeper frames are closed by this invocation
        for (auto it = open.begin(); it != open.end();) {
            if (it->first >= ix.stack_height) {
                it = open.erase(it);
            } else {
                ++it;
            }
        }

        if (!is_watched(program)) {
            continue;
        }

        RawUpdate update;
        update.kind = UpdateKind::Instruction;
        update.slot = slot;
        update.block_ts = block_ts;
        update.program_id = program;
        update.txid = txid;
        update.tx_index = tx_index;
        update.idx = ordinal;
        update.ix_data = std::move(data);

        for (auto account_index : ix.accounts) {
            if (account_index >= keys.size()) {
                throw std::runtime_error("account index out of range");
            }
            IxAccount account;
            account.pubkey = keys[account_index];
            auto p = pre.find(account_index);
            if (p != pre.end()) account.pre = p->second;
            auto q = post.find(account_index);
            if (q != post.end()) account.post = q->second;
            update.accounts.push_back(std::move(account));
        }

        auto logged = payloads.find(ordinal);
        if (logged != payloads.end()) {
            update.payloads = logged->second;
        }

        open[ix.stack_height] = {program, out.size()};
        out.push_back(std::move(update));
    }
}

std::optional<RawUpdate> BlockParser::parse_account(const nlohmann::json& value, uint64_t slot) const {
    const auto& account = value.at("account");
    std::string owner = account.at("owner").get<std::string>();
    if (!is_watched(owner)) {
        return std::nullopt;
    }

    RawUpdate update;
    update.kind = UpdateKind::AccountWrite;
    update.slot = slot;
    update.program_id = owner;
    update.account = value.at("pubkey").get<std::string>();

    const auto& data = account.at("data");
    std::string encoded = data.is_array() ? data.at(0).get<std::string>() : data.get<std::string>();
    if (!util::base64_decode(encoded, update.account_data)) {
        spdlog::debug("Account {} data is not base64", update.account);
        return std::nullopt;
    }
    return update;
}
