#include <catch2/catch_test_macros.hpp>
#include "../src/block_parser.hpp"
#include "test_helpers.hpp"

using namespace fixtures;

namespace {

BlockParser watching_all() {
    return BlockParser({PUMPFUN_PROGRAM, PUMPAMM_PROGRAM, RAYDIUM_PROGRAM, DLMM_PROGRAM, DAMM_PROGRAM});
}

// Raydium swap with its ray_log line and a token transfer CPI. The quote
// vault comes from an address lookup table.
nlohmann::json raydium_tx(const std::string& txid, const std::vector<uint8_t>& ray_log) {
    std::vector<std::string> keys = {key(30), RAYDIUM_PROGRAM, key(31), key(32), TOKEN_PROGRAM};
    nlohmann::json accounts = nlohmann::json::array();
    for (size_t i = 0; i < 17; ++i) accounts.push_back(i == 4 ? 3 : i == 5 ? 5 : 2);
    accounts[1] = 2;
    accounts[16] = 0;

    return {
        {"transaction", {
            {"signatures", nlohmann::json::array({txid})},
            {"message", {
                {"accountKeys", keys},
                {"instructions", nlohmann::json::array({
                    {{"programIdIndex", 1}, {"accounts", accounts}, {"data", util::base58_encode({9, 1, 0, 0, 0})}},
                })}
            }}
        }},
        {"meta", {
            {"err", nullptr},
            {"loadedAddresses", {{"writable", nlohmann::json::array({key(33)})}, {"readonly", nlohmann::json::array()}}},
            {"logMessages", nlohmann::json::array({
                "Program " + RAYDIUM_PROGRAM + " invoke [1]",
                "Program log: ray_log: " + util::base64_encode(ray_log),
                "Program " + TOKEN_PROGRAM + " invoke [2]",
                "Program log: Instruction: Transfer",
                "Program " + TOKEN_PROGRAM + " consumed 4645 of 180000 compute units",
                "Program " + TOKEN_PROGRAM + " success",
                "Program " + RAYDIUM_PROGRAM + " consumed 30000 of 200000 compute units",
                "Program " + RAYDIUM_PROGRAM + " success",
            })},
            {"innerInstructions", nlohmann::json::array({
                {{"index", 0}, {"instructions", nlohmann::json::array({
                    {{"programIdIndex", 4}, {"accounts", {2, 3, 0}}, {"data", "3Bxs4h24hBtQy9rw"}, {"stackHeight", 2}},
                })}}
            })},
            {"preTokenBalances", nlohmann::json::array()},
            {"postTokenBalances", nlohmann::json::array({
                {{"accountIndex", 3}, {"mint", key(34)},
                 {"uiTokenAmount", {{"amount", "123456"}, {"decimals", 6}}}},
                {{"accountIndex", 5}, {"mint", WSOL_MINT},
                 {"uiTokenAmount", {{"amount", "9000000000"}, {"decimals", 9}}}},
            })}
        }}
    };
}

} // namespace

TEST_CASE("Pump.fun transaction flattens to one update with its event", "[block_parser]") {
    auto parser = watching_all();
    auto mint = key(20);
    auto curve = key(21);
    auto block = block_of({pumpfun_tx("sigA", mint, curve, 2000000000, 5000000, true)}, 1700000555);

    auto updates = parser.parse_block(block, 300);

    REQUIRE(updates.size() == 1);
    const auto& u = updates[0];
    REQUIRE(u.kind == UpdateKind::Instruction);
    REQUIRE(u.slot == 300);
    REQUIRE(u.block_ts == 1700000555);
    REQUIRE(u.txid == "sigA");
    REQUIRE(u.tx_index == 0);
    // compute budget is ordinal 0
    REQUIRE(u.idx == 1);
    REQUIRE(u.program_id == PUMPFUN_PROGRAM);
    REQUIRE(u.accounts.size() == 7);
    REQUIRE(u.accounts[2].pubkey == mint);
    REQUIRE(u.accounts[3].pubkey == curve);

    REQUIRE(u.payloads.size() == 1);
    auto expected = pumpfun_trade(mint, 2000000000, 5000000, true, key(5));
    REQUIRE(u.payloads[0] == expected);
}

TEST_CASE("Blocks without a block time are stamped at ingestion", "[block_parser]") {
    auto parser = watching_all();
    auto block = block_of({pumpfun_tx("sigT", key(22), key(23), 10, 20, true)});
    block["blockTime"] = nullptr;

    auto now = [] {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
    int64_t before = now();
    auto updates = parser.parse_block(block, 301);
    int64_t after = now();

    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].block_ts >= before);
    REQUIRE(updates[0].block_ts <= after);
}

TEST_CASE("Log payloads follow the invocation that emitted them", "[block_parser]") {
    auto parser = watching_all();
    Bytes log(57);
    log.u8(0, 3).u64(1, 1000).u64(49, 7);

    auto updates = parser.parse_block(block_of({raydium_tx("sigR", log.data())}), 301);

    REQUIRE(updates.size() == 1);
    const auto& u = updates[0];
    REQUIRE(u.idx == 0);
    REQUIRE(u.payloads.size() == 1);
    REQUIRE(u.payloads[0] == log.data());
    REQUIRE(u.ix_data == std::vector<uint8_t>{9, 1, 0, 0, 0});

    SECTION("Token balances are attached by account index") {
        REQUIRE(u.accounts.size() == 17);
        REQUIRE(u.accounts[4].pubkey == key(32));
        REQUIRE(u.accounts[4].post.has_value());
        REQUIRE(u.accounts[4].post->mint == key(34));
        REQUIRE(u.accounts[4].post->decimals == 6);
        REQUIRE(u.accounts[4].post->amount == 123456);
        REQUIRE_FALSE(u.accounts[4].pre.has_value());
    }

    SECTION("Lookup table addresses extend the key list") {
        REQUIRE(u.accounts[5].pubkey == key(33));
        REQUIRE(u.accounts[5].post->mint == WSOL_MINT);
        REQUIRE(u.accounts[16].pubkey == key(30));
    }
}

TEST_CASE("Transactions are indexed by block position and failures skipped", "[block_parser]") {
    auto parser = watching_all();
    auto failed = pumpfun_tx("sigFail", key(40), key(41), 1, 1, true);
    failed["meta"]["err"] = {{"InstructionError", nlohmann::json::array({1, {{"Custom", 6002}}})}};
    auto ok1 = pumpfun_tx("sig1", key(40), key(41), 1, 1, true);
    Bytes log(57);
    log.u8(0, 3);
    auto ok2 = raydium_tx("sig2", log.data());

    auto updates = parser.parse_block(block_of({failed, ok1, ok2}), 302);

    REQUIRE(updates.size() == 2);
    REQUIRE(updates[0].txid == "sig1");
    REQUIRE(updates[0].tx_index == 1);
    REQUIRE(updates[1].txid == "sig2");
    REQUIRE(updates[1].tx_index == 2);
}

TEST_CASE("Malformed transactions do not poison the block", "[block_parser]") {
    auto parser = watching_all();
    auto broken = pumpfun_tx("sigBad", key(40), key(41), 1, 1, true);
    broken["transaction"]["message"]["instructions"][1]["programIdIndex"] = 99;
    auto ok = pumpfun_tx("sigOk", key(40), key(41), 1, 1, true);

    auto updates = parser.parse_block(block_of({broken, ok}), 303);
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].txid == "sigOk");
}

TEST_CASE("Unwatched programs produce no updates", "[block_parser]") {
    BlockParser parser({RAYDIUM_PROGRAM});
    auto updates = parser.parse_block(block_of({pumpfun_tx("sig", key(1), key(2), 1, 1, true)}), 304);
    REQUIRE(updates.empty());
    REQUIRE(parser.parse_block(nlohmann::json(), 305).empty());
}

TEST_CASE("Account notifications for watched owners", "[block_parser]") {
    auto parser = watching_all();
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    nlohmann::json value = {
        {"pubkey", key(50)},
        {"account", {
            {"owner", RAYDIUM_PROGRAM},
            {"lamports", 6124800},
            {"data", nlohmann::json::array({util::base64_encode(data), "base64"})},
            {"executable", false}
        }}
    };

    auto update = parser.parse_account(value, 400);
    REQUIRE(update.has_value());
    REQUIRE(update->kind == UpdateKind::AccountWrite);
    REQUIRE(update->slot == 400);
    REQUIRE(update->account == key(50));
    REQUIRE(update->program_id == RAYDIUM_PROGRAM);
    REQUIRE(update->account_data == data);

    value["account"]["owner"] = TOKEN_PROGRAM;
    REQUIRE_FALSE(parser.parse_account(value, 400).has_value());
}
