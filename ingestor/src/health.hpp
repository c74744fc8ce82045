#pragma once

#include "metrics.hpp"
#include "redis_bus.hpp"
#include "store_pg.hpp"
#include "stream_subscriber.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<PostgresStore> pg,
                std::shared_ptr<StreamSubscriber> stream,
                std::shared_ptr<Metrics> metrics);

    nlohmann::json get_status();
    nlohmann::json get_metrics() const;
    bool is_healthy();

    void set_fatal(const std::string& reason);

private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<PostgresStore> pg_;
    std::shared_ptr<StreamSubscriber> stream_;
    std::shared_ptr<Metrics> metrics_;

    std::mutex mutex_;
    std::optional<std::string> fatal_;
};
