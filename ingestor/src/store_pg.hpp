#pragma once

#include "trade_store.hpp"
#include <pqxx/pqxx>
#include <string>
#include <vector>

class PostgresStore : public TradeStore {
public:
    explicit PostgresStore(const std::string& dsn);

    // DDL for the pools and trades tables, in execution order
    static std::vector<std::string> schema_statements();
    void init_schema();

    WriteResult insert_trades(const std::vector<Trade>& trades) override;
    bool insert_pool(const PoolMetadata& pool) override;
    std::vector<PoolMetadata> load_pools() override;
    bool ping() override;

private:
    std::string dsn_;
    pqxx::connection make_connection();
};
