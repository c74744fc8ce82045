#include "config.hpp"
#include "layouts.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

std::vector<std::string> Config::get_env_list(const char* name) {
    std::vector<std::string> items;
    for (auto& item : util::split(get_env(name), ',')) {
        auto begin = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            items.push_back(item.substr(begin, end - begin + 1));
        }
    }
    return items;
}

Config Config::from_env() {
    Config cfg;

    cfg.ws_url = get_env("WS_URL", "wss://api.mainnet-beta.solana.com");
    cfg.rpc_urls = get_env_list("RPC_URLS");
    if (cfg.rpc_urls.empty()) {
        cfg.rpc_urls.push_back("https://api.mainnet-beta.solana.com");
    }
    cfg.watch_programs = get_env_list("WATCH_PROGRAMS");
    if (cfg.watch_programs.empty() && !std::getenv("WATCH_PROGRAMS")) {
        cfg.watch_programs = LayoutBook::defaults().program_ids();
    }
    cfg.commitment = get_env("COMMITMENT", "confirmed");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_dex_events = get_env("STREAM_DEX_EVENTS", "dex.events");

    cfg.worker_lanes = get_env_int("WORKER_LANES", 4);
    cfg.queue_capacity = get_env_int("QUEUE_CAPACITY", 4096);
    cfg.batch_size = get_env_int("BATCH_SIZE", 200);
    cfg.flush_interval_ms = get_env_int("FLUSH_INTERVAL_MS", 500);
    cfg.dedup_window = get_env_int("DEDUP_WINDOW", 200000);
    cfg.seal_lag_slots = get_env_int("SEAL_LAG_SLOTS", 2);

    cfg.write_max_attempts = get_env_int("WRITE_MAX_ATTEMPTS", 5);
    cfg.retry_backoff_ms_min = get_env_int("RETRY_BACKOFF_MS_MIN", 200);
    cfg.retry_backoff_ms_max = get_env_int("RETRY_BACKOFF_MS_MAX", 10000);
    cfg.stream_max_connect_attempts = get_env_int("STREAM_MAX_CONNECT_ATTEMPTS", 10);
    cfg.backfill_max_slots = get_env_int("BACKFILL_MAX_SLOTS", 150);
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.metadata_timeout_ms = get_env_int("METADATA_TIMEOUT_MS", 5000);

    cfg.dex_layouts_path = get_env("DEX_LAYOUTS_PATH");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "dex-ingestor");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required");
    }
    if (watch_programs.empty()) {
        throw std::runtime_error("WATCH_PROGRAMS must name at least one program");
    }
    for (const auto& program : watch_programs) {
        if (!util::is_valid_solana_address(program)) {
            throw std::runtime_error("WATCH_PROGRAMS entry is not a valid address: " + program);
        }
    }
    if (worker_lanes <= 0) {
        throw std::runtime_error("WORKER_LANES must be positive");
    }
    if (queue_capacity <= 0 || batch_size <= 0 || flush_interval_ms <= 0) {
        throw std::runtime_error("QUEUE_CAPACITY, BATCH_SIZE and FLUSH_INTERVAL_MS must be positive");
    }
    if (dedup_window <= 0 || seal_lag_slots < 0) {
        throw std::runtime_error("DEDUP_WINDOW must be positive and SEAL_LAG_SLOTS non-negative");
    }
    if (write_max_attempts <= 0 || stream_max_connect_attempts <= 0) {
        throw std::runtime_error("Attempt limits must be positive");
    }
    if (retry_backoff_ms_min < 0 || retry_backoff_ms_min > retry_backoff_ms_max) {
        throw std::runtime_error("RETRY_BACKOFF_MS_MIN must not exceed RETRY_BACKOFF_MS_MAX");
    }
    if (backfill_max_slots < 0 || request_timeout_ms <= 0 || metadata_timeout_ms <= 0) {
        throw std::runtime_error("Timeouts must be positive and BACKFILL_MAX_SLOTS non-negative");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Watching {} programs via {}", watch_programs.size(), ws_url);
    spdlog::info("  RPC endpoints: {}", rpc_urls.size());
    spdlog::info("  Lanes: {}, batch: {}, flush: {}ms", worker_lanes, batch_size, flush_interval_ms);
    spdlog::info("  Postgres: {}", util::redact_dsn(pg_dsn));
}
