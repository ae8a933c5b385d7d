#ifndef WSPLUS_CONFIG_HPP
#define WSPLUS_CONFIG_HPP

#include <chrono>
#include <iosfwd>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "reconnect.hpp"

namespace wsplus {

/*
 * Config
 *
 * Plain value describing one logical stream. The manager keeps its own copy;
 * to change settings build a new Config and a new manager.
 *
 * Presets:
 *   - production(url) : the field defaults below.
 *   - aggressive(url) : shorter timeouts/delays, more attempts, bigger queue.
 *   - testing(url)    : reconnection, queue and heartbeat switched off.
 */
struct Config {
    std::string url;
    Ms connection_timeout{30'000};

    bool enable_reconnection = true;
    int max_reconnection_attempts = 10;
    Ms initial_reconnection_delay{1'000};
    Ms max_reconnection_delay{300'000};
    double backoff_multiplier = 2.0;
    double randomization_factor = 0.1;
    PolicyType reconnection_policy = PolicyType::Exponential;

    bool enable_message_queue = true;
    int max_queue_size = 1000;
    // messages sent per drain pass before yielding to the io_context
    int drain_batch_size = 50;

    Ms heartbeat_interval{30'000};
    bool enable_heartbeat = true;

    std::map<std::string, std::string> headers;
    std::vector<std::string> protocols;

    static Config production(std::string url);
    static Config aggressive(std::string url);
    static Config testing(std::string url);

    // NoReconnectPolicy when reconnection is disabled.
    std::unique_ptr<ReconnectPolicy> make_policy() const;

    friend bool operator==(const Config& a, const Config& b);
    friend bool operator!=(const Config& a, const Config& b) { return !(a == b); }
};

std::ostream& operator<<(std::ostream& os, const Config& c);

// camelCase keys, durations in milliseconds. Decoding requires "url" and
// throws nlohmann::json::exception when it is missing or a field has the
// wrong type.
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace wsplus

#endif // WSPLUS_CONFIG_HPP
