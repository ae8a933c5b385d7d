#ifndef WSPLUS_MESSAGE_HPP
#define WSPLUS_MESSAGE_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wsplus {

using json = nlohmann::json;
using Bytes = std::vector<std::uint8_t>;
using Clock = std::chrono::system_clock;

enum class Control { Ping, Pong };

// Text, Binary, Structured, Control
using Payload = std::variant<std::string, Bytes, json, Control>;

enum class MessageKind { Text, Binary, Json, Ping, Pong };

const char* to_string(MessageKind kind);
std::optional<MessageKind> message_kind_from_string(const std::string& s);

constexpr int kDefaultMaxRetries = 3;

struct MessageOptions {
    std::optional<std::string> id;
    std::optional<Clock::time_point> created_at;
    bool requires_ack = false;
    int retry_count = 0;
    int max_retries = kDefaultMaxRetries;
};

/*
 * Message
 *
 * Immutable outbound/inbound unit. The kind is derived from the payload so the
 * two can never disagree.
 *
 * Retry bookkeeping:
 *   - retry_count never exceeds max_retries; the constructor clamps.
 *   - with_retry() returns a copy with retry_count + 1 (saturating at
 *     max_retries); the original is left untouched.
 */
class Message {
public:
    using Options = MessageOptions;

    explicit Message(Payload payload);
    Message(Payload payload, Options opts);

    static Message text(std::string text, Options opts = {});
    static Message binary(Bytes bytes, Options opts = {});
    static Message json(nlohmann::json doc, Options opts = {});
    static Message ping(Options opts = {});
    static Message pong(Options opts = {});

    const std::string& id() const { return id_; }
    const Payload& payload() const { return payload_; }
    MessageKind kind() const;
    Clock::time_point created_at() const { return created_at_; }
    bool requires_ack() const { return requires_ack_; }
    int retry_count() const { return retry_count_; }
    int max_retries() const { return max_retries_; }

    bool can_retry() const { return retry_count_ < max_retries_; }
    bool is_control() const { return std::holds_alternative<Control>(payload_); }

    Message with_retry() const;

    friend bool operator==(const Message& a, const Message& b);
    friend bool operator!=(const Message& a, const Message& b) { return !(a == b); }

private:
    std::string id_;
    Payload payload_;
    Clock::time_point created_at_;
    bool requires_ack_;
    int retry_count_;
    int max_retries_;
};

std::string generate_message_id();

// ISO-8601 UTC with microsecond precision, e.g. 2026-10-19T08:30:00.123456Z
std::string format_timestamp(Clock::time_point tp);
std::optional<Clock::time_point> parse_timestamp(const std::string& s);

void to_json(nlohmann::json& j, const Message& m);
// Throws nlohmann::json::exception on malformed documents.
Message message_from_json(const nlohmann::json& j);

} // namespace wsplus

namespace nlohmann {
template <>
struct adl_serializer<wsplus::Message> {
    static wsplus::Message from_json(const json& j) { return wsplus::message_from_json(j); }
    static void to_json(json& j, const wsplus::Message& m) { wsplus::to_json(j, m); }
};
} // namespace nlohmann

#endif // WSPLUS_MESSAGE_HPP
