#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, const std::string& stream) : stream_(stream) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", util::redact_dsn(redis_url));
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

bool RedisBus::publish_event(const nlohmann::json& event) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = event.dump();

        redis_->xadd(stream_, "*", fields.begin(), fields.end(), MAX_EVENT_LEN, true);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to publish {} event: {}", event.value("kind", "unknown"), e.what());
        return false;
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
