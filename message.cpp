#include "message.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <random>

namespace wsplus {

namespace {

Clock::time_point truncate_to_micros(Clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

MessageKind kind_of(const Payload& p) {
    return std::visit([](const auto& v) -> MessageKind {
        using T = std::decay_t<decltype(v)>;
        if constexpr ( std::is_same_v<T, std::string> )
        {
            return MessageKind::Text;
        }
        else if constexpr ( std::is_same_v<T, Bytes> )
        {
            return MessageKind::Binary;
        }
        else if constexpr ( std::is_same_v<T, nlohmann::json> )
        {
            return MessageKind::Json;
        }
        else if constexpr ( std::is_same_v<T, Control> )
        {
            return v == Control::Ping ? MessageKind::Ping : MessageKind::Pong;
        }
        else
        {
            static_assert(!sizeof(T), "Unhandled payload type");
        }
    }, p);
}

} // namespace

const char* to_string(MessageKind kind) {
    switch( kind ) {
        case MessageKind::Text:   return "text";
        case MessageKind::Binary: return "binary";
        case MessageKind::Json:   return "json";
        case MessageKind::Ping:   return "ping";
        case MessageKind::Pong:   return "pong";
    }
    return "text";
}

std::optional<MessageKind> message_kind_from_string(const std::string& s) {
    if( s == "text" )   return MessageKind::Text;
    if( s == "binary" ) return MessageKind::Binary;
    if( s == "json" )   return MessageKind::Json;
    if( s == "ping" )   return MessageKind::Ping;
    if( s == "pong" )   return MessageKind::Pong;
    return std::nullopt;
}

Message::Message(Payload payload)
    : Message(std::move(payload), Options{}) {}

Message::Message(Payload payload, Options opts)
    : id_(opts.id ? std::move(*opts.id) : generate_message_id()),
      payload_(std::move(payload)),
      created_at_(truncate_to_micros(opts.created_at.value_or(Clock::now()))),
      requires_ack_(opts.requires_ack),
      retry_count_(0),
      max_retries_(std::max(0, opts.max_retries))
{
    retry_count_ = std::clamp(opts.retry_count, 0, max_retries_);
    // control frames are never acknowledged
    if( is_control() ) requires_ack_ = false;
}

Message Message::text(std::string text, Options opts) {
    return Message(Payload{std::in_place_type<std::string>, std::move(text)}, std::move(opts));
}

Message Message::binary(Bytes bytes, Options opts) {
    return Message(Payload{std::in_place_type<Bytes>, std::move(bytes)}, std::move(opts));
}

Message Message::json(nlohmann::json doc, Options opts) {
    return Message(Payload{std::in_place_type<nlohmann::json>, std::move(doc)}, std::move(opts));
}

Message Message::ping(Options opts) {
    return Message(Payload{Control::Ping}, std::move(opts));
}

Message Message::pong(Options opts) {
    return Message(Payload{Control::Pong}, std::move(opts));
}

MessageKind Message::kind() const {
    return kind_of(payload_);
}

Message Message::with_retry() const {
    Message copy = *this;
    copy.retry_count_ = std::min(retry_count_ + 1, max_retries_);
    return copy;
}

bool operator==(const Message& a, const Message& b) {
    return a.id_ == b.id_ &&
           a.payload_ == b.payload_ &&
           a.created_at_ == b.created_at_ &&
           a.requires_ack_ == b.requires_ack_ &&
           a.retry_count_ == b.retry_count_ &&
           a.max_retries_ == b.max_retries_;
}

std::string generate_message_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static thread_local std::uniform_int_distribution<int> dist(0, 15);

    std::string id = "msg_";
    for (int i = 0; i < 16; ++i)
        id += "0123456789abcdef"[dist(rng)];

    return id;
}

std::string format_timestamp(Clock::time_point tp) {
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    std::int64_t secs = us / 1'000'000;
    std::int64_t frac = us % 1'000'000;
    if( frac < 0 ) { frac += 1'000'000; secs -= 1; }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(frac));
    return buf;
}

std::optional<Clock::time_point> parse_timestamp(const std::string& s) {
    std::tm tm{};
    int consumed = 0;
    if( std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6 )
    {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    // fractional seconds: up to microseconds, extra digits ignored
    std::int64_t micros = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if( pos < s.size() && s[pos] == '.' )
    {
        ++pos;
        int digits = 0;
        while( pos < s.size() && s[pos] >= '0' && s[pos] <= '9' )
        {
            if( digits < 6 )
            {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for( ; digits < 6; ++digits ) micros *= 10;
    }
    if( pos < s.size() && s[pos] != 'Z' )
        return std::nullopt;

    const std::time_t secs = timegm(&tm);
    return Clock::time_point{std::chrono::seconds(secs) + std::chrono::microseconds(micros)};
}

void to_json(nlohmann::json& j, const Message& m) {
    nlohmann::json data = std::visit([](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr ( std::is_same_v<T, Control> )
        {
            return v == Control::Ping ? "ping" : "pong";
        }
        else
        {
            return nlohmann::json(v);
        }
    }, m.payload());

    j = nlohmann::json{
        {"id", m.id()},
        {"type", to_string(m.kind())},
        {"data", std::move(data)},
        {"timestamp", format_timestamp(m.created_at())},
        {"requiresAck", m.requires_ack()},
        {"retryCount", m.retry_count()},
        {"maxRetries", m.max_retries()}
    };
}

Message message_from_json(const nlohmann::json& j) {
    const std::string type = j.value("type", std::string{"text"});
    auto kind = message_kind_from_string(type);
    if( !kind )
        throw nlohmann::json::other_error::create(501, "unknown message type: " + type, &j);

    Message::Options opts;
    if( j.contains("id") ) opts.id = j.at("id").get<std::string>();
    if( j.contains("timestamp") )
    {
        auto ts = parse_timestamp(j.at("timestamp").get<std::string>());
        if( !ts )
            throw nlohmann::json::other_error::create(501, "malformed timestamp", &j);
        opts.created_at = *ts;
    }
    opts.requires_ack = j.value("requiresAck", false);
    opts.retry_count = j.value("retryCount", 0);
    opts.max_retries = j.value("maxRetries", kDefaultMaxRetries);

    const nlohmann::json data = j.contains("data") ? j.at("data") : nlohmann::json{};
    switch( *kind ) {
        case MessageKind::Text:
            return Message::text(data.is_null() ? std::string{} : data.get<std::string>(), std::move(opts));
        case MessageKind::Binary:
            return Message::binary(data.is_null() ? Bytes{} : data.get<Bytes>(), std::move(opts));
        case MessageKind::Json:
            return Message::json(data, std::move(opts));
        case MessageKind::Ping:
            return Message::ping(std::move(opts));
        case MessageKind::Pong:
            return Message::pong(std::move(opts));
    }
    throw nlohmann::json::other_error::create(501, "unknown message type: " + type, &j);
}

} // namespace wsplus
