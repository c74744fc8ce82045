#include "decoder.hpp"
#include "byte_reader.hpp"
#include <spdlog/spdlog.h>

namespace {

const TokenBalance* balance_of(const RawUpdate& update, size_t index) {
    if (index >= update.accounts.size()) {
        return nullptr;
    }
    const auto& account = update.accounts[index];
    if (account.post) return &*account.post;
    if (account.pre) return &*account.pre;
    return nullptr;
}

const std::string& account_at(const RawUpdate& update, size_t index) {
    if (index >= update.accounts.size()) {
        throw DecodeError("instruction has " + std::to_string(update.accounts.size()) +
                          " accounts, needs index " + std::to_string(index));
    }
    return update.accounts[index].pubkey;
}

std::optional<std::string> read_key(const FieldSource& field, const ByteReader& body,
                                    const RawUpdate& update) {
    switch (field.from) {
        case FieldSource::From::None:
            return std::nullopt;
        case FieldSource::From::Payload:
            return body.pubkey(field.offset);
        case FieldSource::From::Account:
            return account_at(update, field.index);
        case FieldSource::From::LastAccount:
            if (update.accounts.empty()) {
                throw DecodeError("instruction has no accounts");
            }
            return update.accounts.back().pubkey;
        case FieldSource::From::AccountMint: {
            auto balance = balance_of(update, field.index);
            if (!balance) return std::nullopt;
            return balance->mint;
        }
        case FieldSource::From::Fixed:
            return field.fixed;
        default:
            break;
    }
    throw DecodeError("field source does not yield a public key");
}

std::optional<uint8_t> read_decimals(const FieldSource& field, const ByteReader& body,
                                     const RawUpdate& update) {
    switch (field.from) {
        case FieldSource::From::None:
            return std::nullopt;
        case FieldSource::From::Payload:
            return body.u8(field.offset);
        case FieldSource::From::AccountDecimals: {
            auto balance = balance_of(update, field.index);
            if (!balance) return std::nullopt;
            return balance->decimals;
        }
        case FieldSource::From::Fixed: {
            int value = std::stoi(field.fixed);
            if (value < 0 || value > 255) {
                throw DecodeError("decimals out of range: " + field.fixed);
            }
            return static_cast<uint8_t>(value);
        }
        default:
            break;
    }
    throw DecodeError("field source does not yield decimals");
}

std::optional<uint64_t> read_amount(const FieldSource& field, const ByteReader& body,
                                    const RawUpdate& update) {
    switch (field.from) {
        case FieldSource::From::None:
            return std::nullopt;
        case FieldSource::From::Payload:
            if (body.size() < field.offset + 8) return std::nullopt;
            return body.u64(field.offset);
        case FieldSource::From::AccountAmount: {
            if (field.index >= update.accounts.size()) return std::nullopt;
            const auto& account = update.accounts[field.index];
            if (account.post) return account.post->amount;
            return std::nullopt;
        }
        default:
            break;
    }
    throw DecodeError("field source does not yield an amount");
}

// Offset just past `count` Borsh strings (u32 length prefix + bytes)
size_t skip_strings(const ByteReader& body, size_t count) {
    size_t offset = 0;
    for (size_t i = 0; i < count; ++i) {
        uint32_t len = body.u32(offset);
        offset += 4;
        body.bytes(offset, len);
        offset += len;
    }
    return offset;
}

bool layout_applies(const SwapLayout& layout, const RawUpdate& update,
                    const std::vector<uint8_t>& payload) {
    if (layout.account_count && *layout.account_count != update.accounts.size()) {
        return false;
    }
    return ByteReader(payload).starts_with(layout.discriminator);
}

SwapEvent decode_swap(const SwapLayout& layout, const RawUpdate& update,
                      const std::vector<uint8_t>& payload) {
    size_t disc = layout.discriminator.size();
    ByteReader body(payload.data() + disc, payload.size() - disc);

    if (body.size() < layout.min_body_size) {
        throw DecodeError(layout.name + " payload is " + std::to_string(body.size()) +
                          " bytes, expected at least " + std::to_string(layout.min_body_size));
    }
    if (update.accounts.size() < layout.min_accounts) {
        throw DecodeError(layout.name + " has " + std::to_string(update.accounts.size()) +
                          " accounts, expected at least " + std::to_string(layout.min_accounts));
    }

    SwapEvent ev;
    ev.dex = layout.dex;
    ev.slot = update.slot;
    ev.txid = update.txid;
    ev.idx = update.idx;
    ev.tx_index = update.tx_index;
    ev.block_ts = update.block_ts;

    auto pool = read_key(layout.pool, body, update);
    if (!pool) {
        throw DecodeError(layout.name + " has no pool address");
    }
    ev.pool_address = *pool;
    ev.trader = read_key(layout.trader, body, update).value_or("");
    ev.mint = read_key(layout.mint, body, update);

    const auto& rule = layout.direction;
    switch (rule.mode) {
        case DirectionRule::Mode::Fixed:
            ev.in_is_base = rule.in_is_base;
            break;
        case DirectionRule::Mode::BoolField:
            ev.in_is_base = body.boolean(rule.offset) ? rule.in_is_base : !rule.in_is_base;
            break;
        case DirectionRule::Mode::U64Field:
            ev.in_is_base = body.u64(rule.offset) == rule.value;
            break;
        case DirectionRule::Mode::SourceMint: {
            if (auto source = balance_of(update, rule.source_index)) {
                ev.in_mint = source->mint;
            } else if (rule.dest_index) {
                if (auto dest = balance_of(update, *rule.dest_index)) {
                    ev.out_mint = dest->mint;
                }
            }
            if (!ev.in_mint && !ev.out_mint) {
                throw DecodeError(layout.name + ": no token balance identifies the swap direction");
            }
            break;
        }
    }

    uint64_t first = body.u64(layout.amount_first);
    uint64_t second = body.u64(layout.amount_second);
    if (layout.amount_mode == AmountMode::SideAB) {
        ev.raw_in_amount = ev.in_is_base ? first : second;
        ev.raw_out_amount = ev.in_is_base ? second : first;
    } else {
        ev.raw_in_amount = first;
        ev.raw_out_amount = second;
    }

    if (layout.fee_deduct) {
        uint64_t fee = body.u64(*layout.fee_deduct);
        if (fee > ev.raw_in_amount) {
            throw DecodeError(layout.name + ": fee exceeds input amount");
        }
        ev.raw_in_amount -= fee;
    }

    ev.hint.dex = layout.dex;
    ev.hint.mint_a = read_key(layout.hint_mint_a, body, update);
    ev.hint.mint_b = read_key(layout.hint_mint_b, body, update);
    ev.hint.decimals_a = read_decimals(layout.hint_decimals_a, body, update);
    ev.hint.decimals_b = read_decimals(layout.hint_decimals_b, body, update);
    ev.reserve_a = read_amount(layout.reserve_a, body, update);
    ev.reserve_b = read_amount(layout.reserve_b, body, update);

    return ev;
}

CurveComplete decode_completion(const CurveCompleteLayout& layout, const RawUpdate& update,
                                const std::vector<uint8_t>& payload) {
    size_t disc = layout.discriminator.size();
    ByteReader body(payload.data() + disc, payload.size() - disc);

    if (body.size() < layout.min_body_size) {
        throw DecodeError(layout.name + " payload is " + std::to_string(body.size()) +
                          " bytes, expected at least " + std::to_string(layout.min_body_size));
    }

    auto user = read_key(layout.user, body, update);
    auto mint = read_key(layout.mint, body, update);
    auto curve = read_key(layout.bonding_curve, body, update);
    if (!user || !mint || !curve) {
        throw DecodeError(layout.name + " is missing user, mint or bonding curve");
    }

    CurveComplete complete;
    complete.blk_ts = update.block_ts;
    complete.slot = update.slot;
    complete.txid = update.txid;
    complete.idx = update.idx;
    complete.user = *user;
    complete.mint = *mint;
    complete.bonding_curve = *curve;
    return complete;
}

std::optional<PoolMetadata> decode_creation(const PoolCreateLayout& layout, const RawUpdate& update,
                                            const std::vector<uint8_t>& payload) {
    size_t disc = layout.discriminator.size();
    ByteReader full(payload.data() + disc, payload.size() - disc);
    size_t start = skip_strings(full, layout.skip_strings);
    ByteReader body(payload.data() + disc + start, payload.size() - disc - start);

    if (body.size() < layout.min_body_size) {
        throw DecodeError(layout.name + " payload is " + std::to_string(body.size()) +
                          " bytes, expected at least " + std::to_string(layout.min_body_size));
    }

    auto pool = read_key(layout.pool, body, update);
    auto mint_a = read_key(layout.mint_a, body, update);
    auto mint_b = read_key(layout.mint_b, body, update);
    auto decimals_a = read_decimals(layout.decimals_a, body, update);
    auto decimals_b = read_decimals(layout.decimals_b, body, update);

    if (!pool || !mint_a || !mint_b || !decimals_a || !decimals_b) {
        spdlog::debug("{} in {} lacks complete pool metadata", layout.name, update.txid);
        return std::nullopt;
    }

    PoolMetadata meta;
    meta.address = *pool;
    meta.dex = layout.dex;
    meta.mint_a = *mint_a;
    meta.mint_b = *mint_b;
    meta.decimals_a = *decimals_a;
    meta.decimals_b = *decimals_b;
    return meta;
}

DecodeResult decode_with_layouts(const LayoutBook& book, const RawUpdate& update, DexKind dex) {
    DecodeResult result;

    for (const auto& payload : update.payloads) {
        if (!result.swap) {
            for (const auto& layout : book.swaps(dex)) {
                if (layout_applies(layout, update, payload)) {
                    result.swap = decode_swap(layout, update, payload);
                    result.layout = layout.name;
                    break;
                }
            }
            if (result.swap) continue;
        }

        if (!result.pool_created) {
            bool matched = false;
            for (const auto& layout : book.pool_creations(dex)) {
                if (ByteReader(payload).starts_with(layout.discriminator)) {
                    result.pool_created = decode_creation(layout, update, payload);
                    if (result.layout.empty()) result.layout = layout.name;
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }

        if (!result.completed) {
            for (const auto& layout : book.curve_completions(dex)) {
                if (ByteReader(payload).starts_with(layout.discriminator)) {
                    result.completed = decode_completion(layout, update, payload);
                    if (result.layout.empty()) result.layout = layout.name;
                    break;
                }
            }
        }
    }

    return result;
}

DecodeResult decode_pumpfun(const LayoutBook& book, const RawUpdate& update) {
    auto result = decode_with_layouts(book, update, DexKind::PumpFun);
    // The event's mint must be the mint account the instruction was given
    if (result.swap && result.swap->mint && update.accounts.size() > 2 &&
        update.accounts[2].pubkey != *result.swap->mint) {
        throw DecodeError("pumpfun trade mint " + *result.swap->mint +
                          " differs from instruction mint " + update.accounts[2].pubkey);
    }
    return result;
}

DecodeResult decode_pumpamm(const LayoutBook& book, const RawUpdate& update) {
    return decode_with_layouts(book, update, DexKind::PumpAmm);
}

DecodeResult decode_raydium(const LayoutBook& book, const RawUpdate& update) {
    return decode_with_layouts(book, update, DexKind::RaydiumAmm);
}

DecodeResult decode_dlmm(const LayoutBook& book, const RawUpdate& update) {
    return decode_with_layouts(book, update, DexKind::MeteoraDlmm);
}

DecodeResult decode_damm(const LayoutBook& book, const RawUpdate& update) {
    return decode_with_layouts(book, update, DexKind::MeteoraDamm);
}

} // namespace

Decoder::Decoder(std::shared_ptr<const LayoutBook> book)
    : book_(std::move(book)),
      table_{decode_pumpfun, decode_pumpamm, decode_raydium, decode_dlmm, decode_damm} {
}

std::optional<DexKind> Decoder::classify(const std::string& program_id) const {
    return book_->classify(program_id);
}

DecodeResult Decoder::decode(const RawUpdate& update, DexKind dex) const {
    try {
        return table_[static_cast<size_t>(dex)](*book_, update);
    } catch (const DecodeError& e) {
        DecodeResult result;
        result.error = e.what();
        return result;
    } catch (const std::logic_error& e) {
        DecodeResult result;
        result.error = std::string("invalid layout constant: ") + e.what();
        return result;
    }
}

std::optional<PoolAccountView> Decoder::decode_pool_account(DexKind dex,
                                                           const std::vector<uint8_t>& data) const {
    ByteReader reader(data);

    for (const auto& layout : book_->pool_accounts(dex)) {
        if (data.size() < layout.min_size || !reader.starts_with(layout.discriminator)) {
            continue;
        }

        try {
            PoolAccountView view;
            view.mint_a = reader.pubkey(layout.mint_a_offset);
            view.mint_b = reader.pubkey(layout.mint_b_offset);
            if (layout.decimals_a_offset) {
                view.decimals_a = static_cast<uint8_t>(reader.u64(*layout.decimals_a_offset));
            }
            if (layout.decimals_b_offset) {
                view.decimals_b = static_cast<uint8_t>(reader.u64(*layout.decimals_b_offset));
            }
            return view;
        } catch (const DecodeError& e) {
            spdlog::debug("Pool account layout {} rejected: {}", layout.name, e.what());
        }
    }

    return std::nullopt;
}
