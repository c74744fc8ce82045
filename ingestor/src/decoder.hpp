#pragma once

#include "types.hpp"
#include "layouts.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>

struct DecodeResult {
    std::optional<SwapEvent> swap;
    std::optional<PoolMetadata> pool_created;
    std::optional<CurveComplete> completed;
    std::optional<std::string> error;
    std::string layout;     // name of the layout that matched, if any

    bool is_valid() const { return !error.has_value(); }
    bool is_empty() const { return !swap && !pool_created && !completed && !error; }
};

// Mints and decimals read from a pool account's state
struct PoolAccountView {
    std::string mint_a;
    std::string mint_b;
    std::optional<uint8_t> decimals_a;
    std::optional<uint8_t> decimals_b;
};

class Decoder {
public:
    explicit Decoder(std::shared_ptr<const LayoutBook> book);

    std::optional<DexKind> classify(const std::string& program_id) const;

    // Decodes one watched-program invocation. Never throws for malformed input:
    // decode failures are reported through DecodeResult::error.
    DecodeResult decode(const RawUpdate& update, DexKind dex) const;

    std::optional<PoolAccountView> decode_pool_account(DexKind dex,
                                                      const std::vector<uint8_t>& data) const;

    const LayoutBook& book() const { return *book_; }

private:
    using DecodeFn = DecodeResult (*)(const LayoutBook&, const RawUpdate&);

    std::shared_ptr<const LayoutBook> book_;
    std::array<DecodeFn, kDexKindCount> table_;
};
