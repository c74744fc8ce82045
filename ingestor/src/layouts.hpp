#pragma once

#include "types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Where a decoded value is read from. Payload offsets are relative to the
// body that follows the discriminator.
struct FieldSource {
    enum class From {
        None,
        Payload,          // pubkey / integer inside the event payload
        Account,          // pubkey of an instruction account
        LastAccount,      // pubkey of the last instruction account
        AccountMint,      // token-balance mint of an instruction account
        AccountDecimals,  // token-balance decimals of an instruction account
        AccountAmount,    // post token-balance amount of an instruction account
        Fixed,            // literal value
    };

    From from = From::None;
    size_t offset = 0;
    size_t index = 0;
    std::string fixed;

    bool is_set() const { return from != From::None; }

    static FieldSource payload(size_t offset) { FieldSource f; f.from = From::Payload; f.offset = offset; return f; }
    static FieldSource account(size_t index) { FieldSource f; f.from = From::Account; f.index = index; return f; }
    static FieldSource last_account() { FieldSource f; f.from = From::LastAccount; return f; }
    static FieldSource account_mint(size_t index) { FieldSource f; f.from = From::AccountMint; f.index = index; return f; }
    static FieldSource account_decimals(size_t index) { FieldSource f; f.from = From::AccountDecimals; f.index = index; return f; }
    static FieldSource account_amount(size_t index) { FieldSource f; f.from = From::AccountAmount; f.index = index; return f; }
    static FieldSource constant(const std::string& value) { FieldSource f; f.from = From::Fixed; f.fixed = value; return f; }
};

struct DirectionRule {
    enum class Mode {
        Fixed,        // in_is_base is constant for this event type
        BoolField,    // payload bool; in_is_base when true
        U64Field,     // payload u64 equal to value means in_is_base
        SourceMint,   // input mint taken from the user's source token account
    };

    Mode mode = Mode::Fixed;
    bool in_is_base = false;
    size_t offset = 0;
    uint64_t value = 0;
    size_t source_index = 0;
    std::optional<size_t> dest_index;
};

enum class AmountMode {
    InOut,    // first = amount in, second = amount out
    SideAB,   // first = amount on the pool's base side, second = quote side
};

struct SwapLayout {
    DexKind dex = DexKind::PumpFun;
    std::string name;
    int version = 1;
    std::vector<uint8_t> discriminator;
    size_t min_body_size = 0;
    size_t min_accounts = 0;
    std::optional<size_t> account_count;

    FieldSource pool;
    FieldSource trader;
    FieldSource mint;

    AmountMode amount_mode = AmountMode::InOut;
    size_t amount_first = 0;
    size_t amount_second = 0;
    std::optional<size_t> fee_deduct;   // subtracted from the input amount

    DirectionRule direction;

    FieldSource hint_mint_a;
    FieldSource hint_mint_b;
    FieldSource hint_decimals_a;
    FieldSource hint_decimals_b;

    // Pool reserves after the swap, on the hint_mint_a and hint_mint_b sides.
    // Payload reserves past the end of a shorter event version read as absent.
    FieldSource reserve_a;
    FieldSource reserve_b;
};

struct PoolCreateLayout {
    DexKind dex = DexKind::PumpFun;
    std::string name;
    std::vector<uint8_t> discriminator;
    size_t skip_strings = 0;    // leading Borsh strings before the fixed fields
    size_t min_body_size = 0;

    FieldSource pool;
    FieldSource mint_a;
    FieldSource mint_b;
    FieldSource decimals_a;
    FieldSource decimals_b;
};

// A bonding curve that reached its target and stopped trading
struct CurveCompleteLayout {
    DexKind dex = DexKind::PumpFun;
    std::string name;
    std::vector<uint8_t> discriminator;
    size_t min_body_size = 0;

    FieldSource user;
    FieldSource mint;
    FieldSource bonding_curve;
};

// Pool account state as returned by getAccountInfo
struct PoolAccountLayout {
    DexKind dex = DexKind::PumpFun;
    std::string name;
    std::vector<uint8_t> discriminator;
    size_t min_size = 0;
    size_t mint_a_offset = 0;
    size_t mint_b_offset = 0;
    std::optional<size_t> decimals_a_offset;
    std::optional<size_t> decimals_b_offset;
};

// Anchor prefix of self-CPI event instructions
extern const std::vector<uint8_t> ANCHOR_EVENT_TAG;

class LayoutBook {
public:
    static LayoutBook defaults();
    static LayoutBook from_json(const nlohmann::json& doc);
    static LayoutBook from_file(const std::string& path);

    std::optional<DexKind> classify(const std::string& program_id) const;
    std::vector<std::string> program_ids() const;

    const std::vector<SwapLayout>& swaps(DexKind dex) const;
    const std::vector<PoolCreateLayout>& pool_creations(DexKind dex) const;
    const std::vector<PoolAccountLayout>& pool_accounts(DexKind dex) const;
    const std::vector<CurveCompleteLayout>& curve_completions(DexKind dex) const;

    void add_program(const std::string& program_id, DexKind dex);
    void add(SwapLayout layout);
    void add(PoolCreateLayout layout);
    void add(PoolAccountLayout layout);
    void add(CurveCompleteLayout layout);

    size_t layout_count() const;

private:
    std::map<std::string, DexKind> programs_;
    std::vector<std::vector<SwapLayout>> swaps_ = std::vector<std::vector<SwapLayout>>(kDexKindCount);
    std::vector<std::vector<PoolCreateLayout>> creations_ = std::vector<std::vector<PoolCreateLayout>>(kDexKindCount);
    std::vector<std::vector<PoolAccountLayout>> accounts_ = std::vector<std::vector<PoolAccountLayout>>(kDexKindCount);
    std::vector<std::vector<CurveCompleteLayout>> completions_ = std::vector<std::vector<CurveCompleteLayout>>(kDexKindCount);
};
