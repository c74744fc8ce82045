#include "health.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<PostgresStore> pg,
                         std::shared_ptr<StreamSubscriber> stream,
                         std::shared_ptr<Metrics> metrics)
    : redis_(redis), pg_(pg), stream_(stream), metrics_(metrics) {}

void HealthCheck::set_fatal(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fatal_) {
        fatal_ = reason;
    }
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    bool pg_ok = pg_->ping();
    bool stream_ok = stream_->is_connected();

    std::optional<std::string> fatal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fatal = fatal_;
    }

    nlohmann::json status = {
        {"ok", redis_ok && pg_ok && stream_ok && !fatal},
        {"redis", redis_ok},
        {"postgres", pg_ok},
        {"stream", stream_ok ? "up" : "down"},
        {"last_slot", metrics_->last_slot.load()},
        {"fatal", fatal ? nlohmann::json(*fatal) : nlohmann::json(nullptr)}
    };

    return status;
}

nlohmann::json HealthCheck::get_metrics() const {
    return metrics_->to_json();
}

bool HealthCheck::is_healthy() {
    return get_status()["ok"].get<bool>();
}
