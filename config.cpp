#include "config.hpp"

#include <ostream>

namespace wsplus {

Config Config::production(std::string url) {
    Config c;
    c.url = std::move(url);
    return c;
}

Config Config::aggressive(std::string url) {
    Config c;
    c.url = std::move(url);
    c.connection_timeout = Ms{15'000};
    c.max_reconnection_attempts = 20;
    c.initial_reconnection_delay = Ms{500};
    c.max_reconnection_delay = Ms{120'000};
    c.backoff_multiplier = 1.5;
    c.max_queue_size = 2000;
    c.heartbeat_interval = Ms{15'000};
    return c;
}

Config Config::testing(std::string url) {
    Config c;
    c.url = std::move(url);
    c.connection_timeout = Ms{5'000};
    c.enable_reconnection = false;
    c.max_reconnection_attempts = 0;
    c.initial_reconnection_delay = Ms{0};
    c.max_reconnection_delay = Ms{0};
    c.backoff_multiplier = 1.0;
    c.enable_message_queue = false;
    c.max_queue_size = 0;
    c.heartbeat_interval = Ms{0};
    c.enable_heartbeat = false;
    return c;
}

std::unique_ptr<ReconnectPolicy> Config::make_policy() const {
    if( !enable_reconnection )
        return make_reconnect_policy(PolicyType::None);

    PolicyParams p;
    p.initial_delay = initial_reconnection_delay;
    p.max_delay = max_reconnection_delay;
    p.multiplier = backoff_multiplier;
    p.randomization_factor = randomization_factor;
    // linear steps by the initial delay
    p.increment = initial_reconnection_delay;
    return make_reconnect_policy(reconnection_policy, p);
}

bool operator==(const Config& a, const Config& b) {
    return a.url == b.url &&
           a.connection_timeout == b.connection_timeout &&
           a.enable_reconnection == b.enable_reconnection &&
           a.max_reconnection_attempts == b.max_reconnection_attempts &&
           a.initial_reconnection_delay == b.initial_reconnection_delay &&
           a.max_reconnection_delay == b.max_reconnection_delay &&
           a.backoff_multiplier == b.backoff_multiplier &&
           a.randomization_factor == b.randomization_factor &&
           a.reconnection_policy == b.reconnection_policy &&
           a.enable_message_queue == b.enable_message_queue &&
           a.max_queue_size == b.max_queue_size &&
           a.drain_batch_size == b.drain_batch_size &&
           a.heartbeat_interval == b.heartbeat_interval &&
           a.enable_heartbeat == b.enable_heartbeat &&
           a.headers == b.headers &&
           a.protocols == b.protocols;
}

std::ostream& operator<<(std::ostream& os, const Config& c) {
    return os << "Config(url: " << c.url
              << ", enableReconnection: " << std::boolalpha << c.enable_reconnection
              << ", maxReconnectionAttempts: " << c.max_reconnection_attempts << ")";
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"url", c.url},
        {"connectionTimeout", c.connection_timeout.count()},
        {"enableReconnection", c.enable_reconnection},
        {"maxReconnectionAttempts", c.max_reconnection_attempts},
        {"initialReconnectionDelay", c.initial_reconnection_delay.count()},
        {"maxReconnectionDelay", c.max_reconnection_delay.count()},
        {"backoffMultiplier", c.backoff_multiplier},
        {"randomizationFactor", c.randomization_factor},
        {"reconnectionPolicy", to_string(c.reconnection_policy)},
        {"enableMessageQueue", c.enable_message_queue},
        {"maxQueueSize", c.max_queue_size},
        {"drainBatchSize", c.drain_batch_size},
        {"heartbeatInterval", c.heartbeat_interval.count()},
        {"enableHeartbeat", c.enable_heartbeat},
        {"headers", c.headers},
        {"protocols", c.protocols}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    const Config d;

    c.url = j.at("url").get<std::string>();
    c.connection_timeout = Ms{j.value("connectionTimeout", d.connection_timeout.count())};
    c.enable_reconnection = j.value("enableReconnection", d.enable_reconnection);
    c.max_reconnection_attempts = j.value("maxReconnectionAttempts", d.max_reconnection_attempts);
    c.initial_reconnection_delay = Ms{j.value("initialReconnectionDelay", d.initial_reconnection_delay.count())};
    c.max_reconnection_delay = Ms{j.value("maxReconnectionDelay", d.max_reconnection_delay.count())};
    c.backoff_multiplier = j.value("backoffMultiplier", d.backoff_multiplier);
    c.randomization_factor = j.value("randomizationFactor", d.randomization_factor);

    const std::string policy = j.value("reconnectionPolicy", std::string{to_string(d.reconnection_policy)});
    auto type = policy_type_from_string(policy);
    if( !type )
        throw nlohmann::json::other_error::create(501, "unknown reconnection policy: " + policy, &j);
    c.reconnection_policy = *type;

    c.enable_message_queue = j.value("enableMessageQueue", d.enable_message_queue);
    c.max_queue_size = j.value("maxQueueSize", d.max_queue_size);
    c.drain_batch_size = j.value("drainBatchSize", d.drain_batch_size);
    c.heartbeat_interval = Ms{j.value("heartbeatInterval", d.heartbeat_interval.count())};
    c.enable_heartbeat = j.value("enableHeartbeat", d.enable_heartbeat);
    c.headers = j.value("headers", std::map<std::string, std::string>{});
    c.protocols = j.value("protocols", std::vector<std::string>{});
}

} // namespace wsplus
