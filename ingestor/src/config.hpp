#pragma once

#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Upstream
    std::string ws_url;
    std::vector<std::string> rpc_urls;
    std::vector<std::string> watch_programs;
    std::string commitment;

    // Postgres
    std::string pg_dsn;

    // Redis
    std::string redis_url;
    std::string stream_dex_events;

    // Pipeline
    int worker_lanes;
    int queue_capacity;
    int batch_size;
    int flush_interval_ms;
    int dedup_window;
    int seal_lag_slots;

    // Retries and timeouts
    int write_max_attempts;
    int retry_backoff_ms_min;
    int retry_backoff_ms_max;
    int stream_max_connect_attempts;
    int backfill_max_slots;
    int request_timeout_ms;
    int metadata_timeout_ms;

    // Decoder
    std::string dex_layouts_path;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static std::vector<std::string> get_env_list(const char* name);
};
