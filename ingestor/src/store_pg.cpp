#include "store_pg.hpp"
#include <spdlog/spdlog.h>
#include <map>

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

std::vector<std::string> PostgresStore::schema_statements() {
    return {
        R"(
            CREATE TABLE IF NOT EXISTS pools (
                addr TEXT PRIMARY KEY,
                dex TEXT NOT NULL,
                mint_a TEXT NOT NULL,
                mint_b TEXT NOT NULL,
                decimals_a SMALLINT NOT NULL CHECK (decimals_a BETWEEN 0 AND 255),
                decimals_b SMALLINT NOT NULL CHECK (decimals_b BETWEEN 0 AND 255),
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )",
        R"(
            CREATE TABLE IF NOT EXISTS trades (
                blk_ts TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                slot NUMERIC(20,0) NOT NULL CHECK (slot >= 0),
                txid TEXT NOT NULL,
                idx NUMERIC(20,0) NOT NULL CHECK (idx >= 0),
                mint TEXT NOT NULL,
                decimals SMALLINT NOT NULL CHECK (decimals BETWEEN 0 AND 255),
                trader TEXT NOT NULL,
                dex TEXT NOT NULL,
                pool TEXT NOT NULL REFERENCES pools(addr),
                is_buy BOOLEAN NOT NULL,
                sol_amt NUMERIC(20,0) NOT NULL CHECK (sol_amt >= 0),
                token_amt NUMERIC(20,0) NOT NULL CHECK (token_amt >= 0),
                price_sol DOUBLE PRECISION NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (txid, idx)
            )
        )",
        "CREATE INDEX IF NOT EXISTS idx_trades_mint_slot ON trades (mint, slot)",
        "CREATE INDEX IF NOT EXISTS idx_trades_pool_slot ON trades (pool, slot)",
        "CREATE INDEX IF NOT EXISTS idx_trades_trader ON trades (trader)",
    };
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        for (const auto& statement : schema_statements()) {
            txn.exec(statement);
        }
        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

WriteResult PostgresStore::insert_trades(const std::vector<Trade>& trades) {
    WriteResult result;
    result.attempted = trades.size();
    if (trades.empty()) {
        return result;
    }

    auto conn = make_connection();
    pqxx::work txn(conn);

    std::string sql =
        "INSERT INTO trades (blk_ts, slot, txid, idx, mint, decimals, trader, dex, pool, "
        "is_buy, sol_amt, token_amt, price_sol) VALUES ";

    for (size_t i = 0; i < trades.size(); ++i) {
        const auto& t = trades[i];
        if (i > 0) sql += ", ";
        sql += "(to_timestamp(" + txn.quote(t.blk_ts) + "), " +
               txn.quote(std::to_string(t.slot)) + "::numeric, " +
               txn.quote(t.txid) + ", " +
               txn.quote(std::to_string(t.idx)) + "::numeric, " +
               txn.quote(t.mint) + ", " +
               txn.quote(static_cast<int>(t.decimals)) + ", " +
               txn.quote(t.trader) + ", " +
               txn.quote(to_string(t.dex)) + ", " +
               txn.quote(t.pool) + ", " +
               txn.quote(t.is_buy) + ", " +
               txn.quote(std::to_string(t.sol_amt)) + "::numeric, " +
               txn.quote(std::to_string(t.token_amt)) + "::numeric, " +
               txn.quote(t.price_sol) + ")";
    }
    sql += " ON CONFLICT (txid, idx) DO NOTHING RETURNING txid, idx::text";

    auto rows = txn.exec(sql);
    txn.commit();

    std::map<std::pair<std::string, uint64_t>, size_t> positions;
    for (size_t i = 0; i < trades.size(); ++i) {
        positions.emplace(std::make_pair(trades[i].txid, trades[i].idx), i);
    }
    for (const auto& row : rows) {
        auto key = std::make_pair(row[0].as<std::string>(), std::stoull(row[1].as<std::string>()));
        auto it = positions.find(key);
        if (it != positions.end()) {
            result.inserted.push_back(it->second);
        }
    }

    return result;
}

bool PostgresStore::insert_pool(const PoolMetadata& pool) {
    auto conn = make_connection();
    pqxx::work txn(conn);

    auto result = txn.exec_params(
        "INSERT INTO pools (addr, dex, mint_a, mint_b, decimals_a, decimals_b) "
        "VALUES ($1, $2, $3, $4, $5, $6) "
        "ON CONFLICT (addr) DO NOTHING",
        pool.address, to_string(pool.dex), pool.mint_a, pool.mint_b,
        static_cast<int>(pool.decimals_a), static_cast<int>(pool.decimals_b)
    );

    txn.commit();
    return result.affected_rows() > 0;
}

std::vector<PoolMetadata> PostgresStore::load_pools() {
    std::vector<PoolMetadata> pools;

    auto conn = make_connection();
    pqxx::work txn(conn);
    auto rows = txn.exec("SELECT addr, dex, mint_a, mint_b, decimals_a, decimals_b FROM pools");
    txn.commit();

    for (const auto& row : rows) {
        auto dex = dex_from_string(row[1].as<std::string>());
        if (!dex) {
            spdlog::warn("Pool {} has unknown dex {}", row[0].as<std::string>(), row[1].as<std::string>());
            continue;
        }
        PoolMetadata pool;
        pool.address = row[0].as<std::string>();
        pool.dex = *dex;
        pool.mint_a = row[2].as<std::string>();
        pool.mint_b = row[3].as<std::string>();
        pool.decimals_a = static_cast<uint8_t>(row[4].as<int>());
        pool.decimals_b = static_cast<uint8_t>(row[5].as<int>());
        pools.push_back(std::move(pool));
    }

    return pools;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Postgres ping failed: {}", e.what());
        return false;
    }
}
