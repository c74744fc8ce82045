#include "layouts.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

const std::vector<uint8_t> ANCHOR_EVENT_TAG = {228, 69, 165, 46, 81, 203, 154, 29};

namespace {

const char* PUMPFUN_PROGRAM = "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P";
const char* PUMPAMM_PROGRAM = "pAMMBay6oceH9fJKBRHGP5D4bD4sWpmSwMn52FMfXEA";
const char* RAYDIUM_AMM_PROGRAM = "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8";
const char* METEORA_DLMM_PROGRAM = "LBUZKhRxPF3XUpBCjp4YzTKgLccjZhTSDM9YuVaPwxo";
const char* METEORA_DAMM_PROGRAM = "Eo7WjKq67rjJQSZxS6z3YkapzY3eMj6Xy8X5EQVn5UaB";

size_t slot_of(DexKind dex) {
    return static_cast<size_t>(dex);
}

FieldSource field_from_json(const nlohmann::json& j) {
    FieldSource f;
    if (j.is_null()) return f;

    std::string from = j.value("from", "none");
    if (from == "payload") {
        f.from = FieldSource::From::Payload;
    } else if (from == "account") {
        f.from = FieldSource::From::Account;
    } else if (from == "last_account") {
        f.from = FieldSource::From::LastAccount;
    } else if (from == "account_mint") {
        f.from = FieldSource::From::AccountMint;
    } else if (from == "account_decimals") {
        f.from = FieldSource::From::AccountDecimals;
    } else if (from == "account_amount") {
        f.from = FieldSource::From::AccountAmount;
    } else if (from == "fixed") {
        f.from = FieldSource::From::Fixed;
    } else if (from != "none") {
        throw std::runtime_error("unknown field source: " + from);
    }
    f.offset = j.value("offset", static_cast<size_t>(0));
    f.index = j.value("index", static_cast<size_t>(0));
    if (j.contains("value")) {
        f.fixed = j["value"].is_string() ? j["value"].get<std::string>() : j["value"].dump();
    }
    return f;
}

DexKind dex_field(const nlohmann::json& j) {
    auto name = j.at("dex").get<std::string>();
    auto dex = dex_from_string(name);
    if (!dex) {
        throw std::runtime_error("unknown dex kind in layout: " + name);
    }
    return *dex;
}

std::optional<size_t> optional_size(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<size_t>();
}

SwapLayout swap_from_json(const nlohmann::json& j) {
    SwapLayout l;
    l.dex = dex_field(j);
    l.name = j.at("name").get<std::string>();
    l.version = j.value("version", 1);
    l.discriminator = j.at("discriminator").get<std::vector<uint8_t>>();
    l.min_body_size = j.value("min_body_size", static_cast<size_t>(0));
    l.min_accounts = j.value("min_accounts", static_cast<size_t>(0));
    l.account_count = optional_size(j, "account_count");
    l.pool = field_from_json(j.value("pool", nlohmann::json()));
    l.trader = field_from_json(j.value("trader", nlohmann::json()));
    l.mint = field_from_json(j.value("mint", nlohmann::json()));

    l.amount_mode = j.value("amount_mode", "in_out") == "side_ab" ? AmountMode::SideAB : AmountMode::InOut;
    l.amount_first = j.at("amount_first").get<size_t>();
    l.amount_second = j.at("amount_second").get<size_t>();
    l.fee_deduct = optional_size(j, "fee_deduct");

    const auto& d = j.at("direction");
    std::string mode = d.at("mode").get<std::string>();
    if (mode == "fixed") {
        l.direction.mode = DirectionRule::Mode::Fixed;
    } else if (mode == "bool_field") {
        l.direction.mode = DirectionRule::Mode::BoolField;
    } else if (mode == "u64_field") {
        l.direction.mode = DirectionRule::Mode::U64Field;
    } else if (mode == "source_mint") {
        l.direction.mode = DirectionRule::Mode::SourceMint;
    } else {
        throw std::runtime_error("unknown direction mode: " + mode);
    }
    l.direction.in_is_base = d.value("in_is_base", false);
    l.direction.offset = d.value("offset", static_cast<size_t>(0));
    l.direction.value = d.value("value", static_cast<uint64_t>(0));
    l.direction.source_index = d.value("source_index", static_cast<size_t>(0));
    l.direction.dest_index = optional_size(d, "dest_index");

    l.hint_mint_a = field_from_json(j.value("hint_mint_a", nlohmann::json()));
    l.hint_mint_b = field_from_json(j.value("hint_mint_b", nlohmann::json()));
    l.hint_decimals_a = field_from_json(j.value("hint_decimals_a", nlohmann::json()));
    l.hint_decimals_b = field_from_json(j.value("hint_decimals_b", nlohmann::json()));
    l.reserve_a = field_from_json(j.value("reserve_a", nlohmann::json()));
    l.reserve_b = field_from_json(j.value("reserve_b", nlohmann::json()));
    return l;
}

PoolCreateLayout creation_from_json(const nlohmann::json& j) {
    PoolCreateLayout l;
    l.dex = dex_field(j);
    l.name = j.at("name").get<std::string>();
    l.discriminator = j.at("discriminator").get<std::vector<uint8_t>>();
    l.skip_strings = j.value("skip_strings", static_cast<size_t>(0));
    l.min_body_size = j.value("min_body_size", static_cast<size_t>(0));
    l.pool = field_from_json(j.at("pool"));
    l.mint_a = field_from_json(j.at("mint_a"));
    l.mint_b = field_from_json(j.at("mint_b"));
    l.decimals_a = field_from_json(j.value("decimals_a", nlohmann::json()));
    l.decimals_b = field_from_json(j.value("decimals_b", nlohmann::json()));
    return l;
}

PoolAccountLayout account_from_json(const nlohmann::json& j) {
    PoolAccountLayout l;
    l.dex = dex_field(j);
    l.name = j.at("name").get<std::string>();
    l.discriminator = j.value("discriminator", std::vector<uint8_t>{});
    l.min_size = j.at("min_size").get<size_t>();
    l.mint_a_offset = j.at("mint_a_offset").get<size_t>();
    l.mint_b_offset = j.at("mint_b_offset").get<size_t>();
    l.decimals_a_offset = optional_size(j, "decimals_a_offset");
    l.decimals_b_offset = optional_size(j, "decimals_b_offset");
    return l;
}

CurveCompleteLayout completion_from_json(const nlohmann::json& j) {
    CurveCompleteLayout l;
    l.dex = dex_field(j);
    l.name = j.at("name").get<std::string>();
    l.discriminator = j.at("discriminator").get<std::vector<uint8_t>>();
    l.min_body_size = j.value("min_body_size", static_cast<size_t>(0));
    l.user = field_from_json(j.at("user"));
    l.mint = field_from_json(j.at("mint"));
    l.bonding_curve = field_from_json(j.at("bonding_curve"));
    return l;
}

void add_pumpfun(LayoutBook& book) {
    book.add_program(PUMPFUN_PROGRAM, DexKind::PumpFun);

    // TradeEvent: mint, sol_amount, token_amount, is_buy, user, timestamp, reserves...
    SwapLayout trade;
    trade.dex = DexKind::PumpFun;
    trade.name = "pumpfun.trade";
    trade.discriminator = {189, 219, 127, 211, 78, 230, 97, 238};
    trade.min_body_size = 89;
    trade.min_accounts = 7;
    trade.pool = FieldSource::account(3);          // bonding curve
    trade.trader = FieldSource::payload(49);
    trade.mint = FieldSource::payload(0);
    trade.amount_mode = AmountMode::SideAB;
    trade.amount_first = 40;                        // token_amount
    trade.amount_second = 32;                       // sol_amount
    trade.direction.mode = DirectionRule::Mode::BoolField;
    trade.direction.offset = 48;                    // is_buy: SOL in, quote side
    trade.direction.in_is_base = false;
    trade.hint_mint_a = FieldSource::payload(0);
    trade.hint_mint_b = FieldSource::constant(WSOL_MINT);
    trade.hint_decimals_a = FieldSource::constant("6");
    trade.hint_decimals_b = FieldSource::constant("9");
    trade.reserve_a = FieldSource::payload(113);    // real_token_reserves
    trade.reserve_b = FieldSource::payload(105);    // real_sol_reserves
    book.add(trade);

    // CompleteEvent: user, mint, bonding_curve, timestamp
    CurveCompleteLayout complete;
    complete.dex = DexKind::PumpFun;
    complete.name = "pumpfun.complete";
    complete.discriminator = {95, 114, 97, 156, 212, 46, 152, 8};
    complete.min_body_size = 96;
    complete.user = FieldSource::payload(0);
    complete.mint = FieldSource::payload(32);
    complete.bonding_curve = FieldSource::payload(64);
    book.add(complete);

    // CreateEvent: name, symbol, uri, mint, bonding_curve, user
    PoolCreateLayout create;
    create.dex = DexKind::PumpFun;
    create.name = "pumpfun.create";
    create.discriminator = {27, 114, 169, 77, 222, 235, 99, 118};
    create.skip_strings = 3;
    create.min_body_size = 96;
    create.pool = FieldSource::payload(32);
    create.mint_a = FieldSource::payload(0);
    create.mint_b = FieldSource::constant(WSOL_MINT);
    create.decimals_a = FieldSource::constant("6");
    create.decimals_b = FieldSource::constant("9");
    book.add(create);
}

void add_pumpamm(LayoutBook& book) {
    book.add_program(PUMPAMM_PROGRAM, DexKind::PumpAmm);

    SwapLayout buy;
    buy.dex = DexKind::PumpAmm;
    buy.name = "pumpamm.buy";
    buy.discriminator = {103, 244, 82, 31, 44, 245, 119, 119};
    buy.min_body_size = 176;
    buy.pool = FieldSource::payload(112);
    buy.trader = FieldSource::payload(144);
    buy.amount_first = 96;                          // quote_amount_in_with_lp_fee
    buy.amount_second = 8;                          // base_amount_out
    buy.direction.mode = DirectionRule::Mode::Fixed;
    buy.direction.in_is_base = false;
    buy.hint_mint_a = FieldSource::account_mint(7);
    buy.hint_mint_b = FieldSource::account_mint(8);
    buy.hint_decimals_a = FieldSource::account_decimals(7);
    buy.hint_decimals_b = FieldSource::account_decimals(8);
    buy.reserve_a = FieldSource::account_amount(7);
    buy.reserve_b = FieldSource::account_amount(8);
    book.add(buy);

    SwapLayout sell = buy;
    sell.name = "pumpamm.sell";
    sell.discriminator = {62, 47, 55, 10, 165, 3, 220, 42};
    sell.amount_first = 8;                          // base_amount_in
    sell.amount_second = 104;                       // user_quote_amount_out
    sell.direction.in_is_base = true;
    book.add(sell);

    PoolCreateLayout create;
    create.dex = DexKind::PumpAmm;
    create.name = "pumpamm.create_pool";
    create.discriminator = {177, 49, 12, 210, 160, 118, 167, 116};
    create.min_body_size = 197;
    create.pool = FieldSource::payload(165);
    create.mint_a = FieldSource::payload(42);
    create.mint_b = FieldSource::payload(74);
    create.decimals_a = FieldSource::payload(106);
    create.decimals_b = FieldSource::payload(107);
    book.add(create);

    PoolAccountLayout pool;
    pool.dex = DexKind::PumpAmm;
    pool.name = "pumpamm.pool";
    pool.discriminator = {241, 154, 109, 4, 17, 177, 109, 188};
    pool.min_size = 211;
    pool.mint_a_offset = 43;
    pool.mint_b_offset = 75;
    book.add(pool);
}

void add_raydium(LayoutBook& book) {
    book.add_program(RAYDIUM_AMM_PROGRAM, DexKind::RaydiumAmm);

    // ray_log SwapBaseIn: amount_in, minimum_out, direction, user_source, pool_coin, pool_pc, out_amount
    SwapLayout base_in;
    base_in.dex = DexKind::RaydiumAmm;
    base_in.name = "raydium.swap_base_in";
    base_in.discriminator = {3};
    base_in.min_body_size = 56;
    base_in.account_count = 17;
    base_in.pool = FieldSource::account(1);
    base_in.trader = FieldSource::last_account();
    base_in.amount_first = 0;
    base_in.amount_second = 48;
    base_in.direction.mode = DirectionRule::Mode::U64Field;
    base_in.direction.offset = 16;
    base_in.direction.value = 2;                    // coin2pc
    base_in.hint_mint_a = FieldSource::account_mint(4);
    base_in.hint_mint_b = FieldSource::account_mint(5);
    base_in.hint_decimals_a = FieldSource::account_decimals(4);
    base_in.hint_decimals_b = FieldSource::account_decimals(5);
    base_in.reserve_a = FieldSource::account_amount(4);
    base_in.reserve_b = FieldSource::account_amount(5);
    book.add(base_in);

    // 18-account variant carries amm_target_orders before the vaults
    SwapLayout base_in_v2 = base_in;
    base_in_v2.version = 2;
    base_in_v2.account_count = 18;
    base_in_v2.hint_mint_a = FieldSource::account_mint(5);
    base_in_v2.hint_mint_b = FieldSource::account_mint(6);
    base_in_v2.hint_decimals_a = FieldSource::account_decimals(5);
    base_in_v2.hint_decimals_b = FieldSource::account_decimals(6);
    base_in_v2.reserve_a = FieldSource::account_amount(5);
    base_in_v2.reserve_b = FieldSource::account_amount(6);
    book.add(base_in_v2);

    // ray_log SwapBaseOut: max_in, amount_out, direction, user_source, pool_coin, pool_pc, deduct_in
    SwapLayout base_out = base_in;
    base_out.name = "raydium.swap_base_out";
    base_out.discriminator = {4};
    base_out.amount_first = 48;
    base_out.amount_second = 8;
    book.add(base_out);

    SwapLayout base_out_v2 = base_in_v2;
    base_out_v2.name = "raydium.swap_base_out";
    base_out_v2.discriminator = {4};
    base_out_v2.amount_first = 48;
    base_out_v2.amount_second = 8;
    book.add(base_out_v2);

    // ray_log Init: time, pc_decimals, coin_decimals, ...
    PoolCreateLayout init;
    init.dex = DexKind::RaydiumAmm;
    init.name = "raydium.init";
    init.discriminator = {0};
    init.min_body_size = 74;
    init.pool = FieldSource::account(4);
    init.mint_a = FieldSource::account(8);
    init.mint_b = FieldSource::account(9);
    init.decimals_a = FieldSource::payload(9);
    init.decimals_b = FieldSource::payload(8);
    book.add(init);

    PoolAccountLayout amm;
    amm.dex = DexKind::RaydiumAmm;
    amm.name = "raydium.amm_info";
    amm.min_size = 752;
    amm.mint_a_offset = 400;
    amm.mint_b_offset = 432;
    amm.decimals_a_offset = 32;
    amm.decimals_b_offset = 40;
    book.add(amm);
}

void add_meteora(LayoutBook& book) {
    book.add_program(METEORA_DLMM_PROGRAM, DexKind::MeteoraDlmm);
    book.add_program(METEORA_DAMM_PROGRAM, DexKind::MeteoraDamm);

    // Swap: lb_pair, from, start_bin_id, end_bin_id, amount_in, amount_out, swap_for_y, ...
    SwapLayout dlmm;
    dlmm.dex = DexKind::MeteoraDlmm;
    dlmm.name = "meteora_dlmm.swap";
    dlmm.discriminator = {81, 108, 227, 190, 205, 208, 10, 196};
    dlmm.min_body_size = 89;
    dlmm.pool = FieldSource::payload(0);
    dlmm.trader = FieldSource::payload(32);
    dlmm.amount_first = 72;
    dlmm.amount_second = 80;
    dlmm.direction.mode = DirectionRule::Mode::BoolField;
    dlmm.direction.offset = 88;
    dlmm.direction.in_is_base = true;
    dlmm.hint_mint_a = FieldSource::account_mint(2);
    dlmm.hint_mint_b = FieldSource::account_mint(3);
    dlmm.hint_decimals_a = FieldSource::account_decimals(2);
    dlmm.hint_decimals_b = FieldSource::account_decimals(3);
    dlmm.reserve_a = FieldSource::account_amount(2);
    dlmm.reserve_b = FieldSource::account_amount(3);
    book.add(dlmm);

    PoolCreateLayout lb_pair;
    lb_pair.dex = DexKind::MeteoraDlmm;
    lb_pair.name = "meteora_dlmm.lb_pair_create";
    lb_pair.discriminator = {185, 74, 252, 125, 27, 215, 188, 111};
    lb_pair.min_body_size = 98;
    lb_pair.pool = FieldSource::payload(0);
    lb_pair.mint_a = FieldSource::payload(34);
    lb_pair.mint_b = FieldSource::payload(66);
    lb_pair.decimals_a = FieldSource::account_decimals(4);
    lb_pair.decimals_b = FieldSource::account_decimals(5);
    book.add(lb_pair);

    PoolAccountLayout lb_account;
    lb_account.dex = DexKind::MeteoraDlmm;
    lb_account.name = "meteora_dlmm.lb_pair";
    lb_account.discriminator = {33, 11, 49, 98, 181, 101, 177, 13};
    lb_account.min_size = 152;
    lb_account.mint_a_offset = 88;
    lb_account.mint_b_offset = 120;
    book.add(lb_account);

    // Swap: in_amount, out_amount, trade_fee, protocol_fee, host_fee
    SwapLayout damm;
    damm.dex = DexKind::MeteoraDamm;
    damm.name = "meteora_damm.swap";
    damm.discriminator = {81, 108, 227, 190, 205, 208, 10, 196};
    damm.min_body_size = 40;
    damm.min_accounts = 13;
    damm.pool = FieldSource::account(0);
    damm.trader = FieldSource::account(12);
    damm.amount_first = 0;
    damm.amount_second = 8;
    damm.fee_deduct = 24;
    damm.direction.mode = DirectionRule::Mode::SourceMint;
    damm.direction.source_index = 1;
    damm.direction.dest_index = 2;
    damm.hint_mint_a = FieldSource::account_mint(5);
    damm.hint_mint_b = FieldSource::account_mint(6);
    damm.hint_decimals_a = FieldSource::account_decimals(5);
    damm.hint_decimals_b = FieldSource::account_decimals(6);
    damm.reserve_a = FieldSource::account_amount(5);
    damm.reserve_b = FieldSource::account_amount(6);
    book.add(damm);

    // PoolCreated: lp_mint, token_a_mint, token_b_mint, pool_type, pool
    PoolCreateLayout damm_create;
    damm_create.dex = DexKind::MeteoraDamm;
    damm_create.name = "meteora_damm.pool_created";
    damm_create.discriminator = {202, 44, 41, 88, 104, 220, 157, 82};
    damm_create.min_body_size = 129;
    damm_create.pool = FieldSource::payload(97);
    damm_create.mint_a = FieldSource::payload(32);
    damm_create.mint_b = FieldSource::payload(64);
    book.add(damm_create);

    PoolAccountLayout damm_pool;
    damm_pool.dex = DexKind::MeteoraDamm;
    damm_pool.name = "meteora_damm.pool";
    damm_pool.discriminator = {241, 154, 109, 4, 17, 177, 109, 188};
    damm_pool.min_size = 104;
    damm_pool.mint_a_offset = 40;
    damm_pool.mint_b_offset = 72;
    book.add(damm_pool);
}

} // namespace

LayoutBook LayoutBook::defaults() {
    LayoutBook book;
    add_pumpfun(book);
    add_pumpamm(book);
    add_raydium(book);
    add_meteora(book);
    return book;
}

LayoutBook LayoutBook::from_json(const nlohmann::json& doc) {
    LayoutBook book;

    for (const auto& [program_id, dex_name] : doc.at("programs").items()) {
        auto dex = dex_from_string(dex_name.get<std::string>());
        if (!dex) {
            throw std::runtime_error("unknown dex kind for program " + program_id);
        }
        book.add_program(program_id, *dex);
    }

    for (const auto& j : doc.value("swaps", nlohmann::json::array())) {
        book.add(swap_from_json(j));
    }
    for (const auto& j : doc.value("pool_creations", nlohmann::json::array())) {
        book.add(creation_from_json(j));
    }
    for (const auto& j : doc.value("pool_accounts", nlohmann::json::array())) {
        book.add(account_from_json(j));
    }
    for (const auto& j : doc.value("curve_completions", nlohmann::json::array())) {
        book.add(completion_from_json(j));
    }

    return book;
}

LayoutBook LayoutBook::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open layout file: " + path);
    }
    auto doc = nlohmann::json::parse(in);
    auto book = from_json(doc);
    spdlog::info("Loaded {} layouts for {} programs from {}",
                 book.layout_count(), book.programs_.size(), path);
    return book;
}

std::optional<DexKind> LayoutBook::classify(const std::string& program_id) const {
    auto it = programs_.find(program_id);
    if (it == programs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> LayoutBook::program_ids() const {
    std::vector<std::string> ids;
    for (const auto& [id, dex] : programs_) {
        ids.push_back(id);
    }
    return ids;
}

const std::vector<SwapLayout>& LayoutBook::swaps(DexKind dex) const {
    return swaps_[slot_of(dex)];
}

const std::vector<PoolCreateLayout>& LayoutBook::pool_creations(DexKind dex) const {
    return creations_[slot_of(dex)];
}

const std::vector<PoolAccountLayout>& LayoutBook::pool_accounts(DexKind dex) const {
    return accounts_[slot_of(dex)];
}

const std::vector<CurveCompleteLayout>& LayoutBook::curve_completions(DexKind dex) const {
    return completions_[slot_of(dex)];
}

void LayoutBook::add_program(const std::string& program_id, DexKind dex) {
    programs_[program_id] = dex;
}

void LayoutBook::add(SwapLayout layout) {
    auto slot = slot_of(layout.dex);
    swaps_[slot].push_back(std::move(layout));
}

void LayoutBook::add(PoolCreateLayout layout) {
    auto slot = slot_of(layout.dex);
    creations_[slot].push_back(std::move(layout));
}

void LayoutBook::add(PoolAccountLayout layout) {
    auto slot = slot_of(layout.dex);
    accounts_[slot].push_back(std::move(layout));
}

void LayoutBook::add(CurveCompleteLayout layout) {
    auto slot = slot_of(layout.dex);
    completions_[slot].push_back(std::move(layout));
}

size_t LayoutBook::layout_count() const {
    size_t count = 0;
    for (size_t i = 0; i < kDexKindCount; ++i) {
        count += swaps_[i].size() + creations_[i].size() + accounts_[i].size() + completions_[i].size();
    }
    return count;
}
