#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"
#include "../src/types.hpp"

TEST_CASE("Base58 addresses", "[util]") {
    std::vector<uint8_t> raw;
    REQUIRE(util::base58_decode(WSOL_MINT, raw));
    REQUIRE(raw.size() == 32);
    REQUIRE(raw[0] == 0x06);
    REQUIRE(util::base58_encode(raw) == WSOL_MINT);

    REQUIRE(util::base58_encode({0, 0, 1}) == "112");
    REQUIRE(util::base58_encode(std::vector<uint8_t>(32, 0)) == std::string(32, '1'));

    SECTION("Invalid characters are rejected") {
        std::vector<uint8_t> out;
        REQUIRE_FALSE(util::base58_decode("0OIl", out));
    }

    SECTION("Address validation") {
        REQUIRE(util::is_valid_solana_address(WSOL_MINT));
        REQUIRE(util::is_valid_solana_address("675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8"));
        REQUIRE_FALSE(util::is_valid_solana_address("So1111"));
        REQUIRE_FALSE(util::is_valid_solana_address(""));
    }
}

TEST_CASE("Base64 payloads", "[util]") {
    std::vector<uint8_t> out;
    REQUIRE(util::base64_decode("aGVsbG8=", out));
    REQUIRE(std::string(out.begin(), out.end()) == "hello");

    REQUIRE(util::base64_decode("AQID", out));
    REQUIRE(out == std::vector<uint8_t>{1, 2, 3});

    REQUIRE_FALSE(util::base64_decode("a$b=", out));
    REQUIRE_FALSE(util::base64_decode("AQI", out));

    SECTION("Padding does not leak into the output") {
        REQUIRE(util::base64_decode("AQ==", out));
        REQUIRE(out == std::vector<uint8_t>{1});
        REQUIRE(util::base64_encode({1}) == "AQ==");
    }

    SECTION("Line breaks inside the payload are skipped") {
        REQUIRE(util::base64_decode("aGVs\nbG8=", out));
        REQUIRE(std::string(out.begin(), out.end()) == "hello");
    }
}

TEST_CASE("Retry backoff stays within bounds", "[util]") {
    for (int attempt = 0; attempt < 20; ++attempt) {
        int delay = util::backoff_ms(attempt, 200, 10000);
        REQUIRE(delay >= 200);
        REQUIRE(delay <= 10000);
    }
    REQUIRE(util::backoff_ms(30, 200, 10000) == 10000);
}

TEST_CASE("DSN redaction", "[util]") {
    REQUIRE(util::redact_dsn("postgresql://dex:s3cret@db:5432/ledger") ==
            "postgresql://dex:***@db:5432/ledger");
    REQUIRE(util::redact_dsn("host=db user=dex password=s3cret dbname=ledger") ==
            "host=db user=dex password=*** dbname=ledger");
    REQUIRE(util::redact_dsn("postgresql://db/ledger") == "postgresql://db/ledger");
}

TEST_CASE("Split drops empty items", "[util]") {
    auto parts = util::split(" a, b,,c ", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Short addresses", "[util]") {
    REQUIRE(util::short_addr(WSOL_MINT) == "So11..1112");
    REQUIRE(util::short_addr("abc") == "abc");
}
