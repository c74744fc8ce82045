#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Approximate cap on the event stream length
constexpr long long MAX_EVENT_LEN = 50000;

class EventPublisher {
public:
    virtual ~EventPublisher() = default;
    // False when the event could not be published
    virtual bool publish_event(const nlohmann::json& event) = 0;
};

class RedisBus : public EventPublisher {
public:
    RedisBus(const std::string& redis_url, const std::string& stream);

    bool publish_event(const nlohmann::json& event) override;
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string stream_;
};
