#include "connection.hpp"

#include <cctype>
#include <cstdio>
#include <iostream>

namespace wsplus {

namespace {

Frame encode(const Message& m) {
    return std::visit([](const auto& v) -> Frame {
        using T = std::decay_t<decltype(v)>;
        if constexpr ( std::is_same_v<T, std::string> )
        {
            return Frame{Frame::Type::Text, v};
        }
        else if constexpr ( std::is_same_v<T, Bytes> )
        {
            return Frame{Frame::Type::Binary, std::string(v.begin(), v.end())};
        }
        else if constexpr ( std::is_same_v<T, nlohmann::json> )
        {
            return Frame{Frame::Type::Text, v.dump()};
        }
        else
        {
            return Frame{Frame::Type::Text, v == Control::Ping ? "ping" : "pong"};
        }
    }, m.payload());
}

Message decode(Frame frame) {
    if( frame.type == Frame::Type::Binary )
        return Message::binary(Bytes(frame.data.begin(), frame.data.end()));

    if( frame.data == "ping" ) return Message::ping();
    if( frame.data == "pong" ) return Message::pong();

    const auto first = frame.data.find_first_not_of(" \t\r\n");
    if( first != std::string::npos && (frame.data[first] == '{' || frame.data[first] == '[') )
    {
        auto doc = nlohmann::json::parse(frame.data, nullptr, false);
        if( !doc.is_discarded() )
            return Message::json(std::move(doc));
    }
    return Message::text(std::move(frame.data));
}

long long ms_since(Clock::time_point then) {
    return std::chrono::duration_cast<Ms>(Clock::now() - then).count();
}

} // namespace

const char* to_string(ConnectionEvent::Type type) {
    switch( type ) {
        case ConnectionEvent::Type::Connected:        return "connected";
        case ConnectionEvent::Type::Disconnected:     return "disconnected";
        case ConnectionEvent::Type::ConnectionFailed: return "connection_failed";
        case ConnectionEvent::Type::MessageSent:      return "message_sent";
        case ConnectionEvent::Type::MessageReceived:  return "message_received";
        case ConnectionEvent::Type::Error:            return "error";
    }
    return "error";
}

std::shared_ptr<Connection> Connection::create(boost::asio::io_context& io,
                                               Config config,
                                               TransportFactory factory) {
    return std::make_shared<Connection>(PrivateTag{}, io, std::move(config), std::move(factory));
}

Connection::Connection(PrivateTag, boost::asio::io_context& io, Config config, TransportFactory factory)
    : io_(io),
      config_(std::move(config)),
      factory_(std::move(factory)),
      connect_timer_(io),
      heartbeat_timer_(io) {}

Connection::~Connection() {
    if( transport_ ) transport_->close();
}

void Connection::connect(Completion done) {
    if( disposed_ ) {
        if( done ) done(make_error(ErrorCode::Disposed, "connection disposed"));
        return;
    }
    if( state_ == ConnectionState::Connecting ) {
        if( done ) pending_.push_back(std::move(done));
        return;
    }
    if( state_ == ConnectionState::Connected ) {
        if( done ) done({});
        return;
    }
    if( done ) pending_.push_back(std::move(done));

    const auto epoch = ++epoch_;
    connection_start_time_ = Clock::now();
    set_state(ConnectionState::Connecting);
    std::cout << "Connection: connecting to " << config_.url << "\n";

    std::weak_ptr<Connection> wk = weak_from_this();

    if( config_.connection_timeout.count() > 0 ) {
        connect_timer_.expires_after(config_.connection_timeout);
        connect_timer_.async_wait([wk, epoch](const boost::system::error_code& ec) {
            if( ec ) return;
            auto self = wk.lock();
            if( !self || self->disposed_ || self->epoch_ != epoch ) return;
            if( self->state_ == ConnectionState::Connecting )
                self->fail(timed_out("connect").value());
        });
    }

    transport_ = factory_ ? factory_(io_) : nullptr;
    if( !transport_ ) {
        fail(connection_failed("no transport available").value());
        return;
    }

    OpenOptions options;
    options.protocols = config_.protocols;
    if( !config_.headers.empty() ) {
        if( transport_->supports_headers() )
            options.headers = config_.headers;
        else
            std::cerr << "Connection: transport does not support custom headers, connecting without them\n";
    }

    TransportHandlers handlers;
    handlers.on_open = [wk, epoch] {
        if( auto self = wk.lock() ) self->handle_open(epoch);
    };
    handlers.on_frame = [wk, epoch](Frame frame) {
        if( auto self = wk.lock() ) self->handle_frame(epoch, std::move(frame));
    };
    handlers.on_error = [wk, epoch](const std::string& reason) {
        if( auto self = wk.lock() ) self->handle_error(epoch, reason);
    };
    handlers.on_close = [wk, epoch] {
        if( auto self = wk.lock() ) self->handle_close(epoch);
    };

    // the session may fail synchronously inside open() and release transport_
    auto transport = transport_;
    auto opened = transport->open(config_.url, options, std::move(handlers));
    if( !opened && epoch_ == epoch )
        fail(connection_failed(opened.error()).value());
}

void Connection::disconnect() {
    if( state_ == ConnectionState::Closed || state_ == ConnectionState::Failed ) return;

    set_state(ConnectionState::Closing);
    cancel_timers();
    if( auto t = release_transport() ) t->close();
    set_state(ConnectionState::Closed);
    emit(ConnectionEvent::Type::Disconnected);
    complete_pending(connection_failed("disconnected"));
    std::cout << "Connection: disconnected from " << config_.url << "\n";
}

Result<void> Connection::send(const Message& message) {
    if( disposed_ )
        return make_error(ErrorCode::Disposed, "connection disposed");
    if( !can_send(state_) || !transport_ )
        return make_error(ErrorCode::NotConnected, std::string("Not connected (state: ") + to_string(state_) + ")");

    auto sent = transport_->send(encode(message));
    if( !sent ) {
        ++errors_count_;
        std::cerr << "Connection: send of " << message.id() << " failed: " << sent.error() << "\n";
        return message_send_failed(sent.error());
    }

    const auto now = Clock::now();
    ++messages_sent_;
    last_message_time_ = now;
    if( message.kind() == MessageKind::Ping ) {
        ++ping_sent_;
        last_ping_time_ = now;
    }
    emit(ConnectionEvent::Type::MessageSent, message.id(), message);
    return {};
}

Result<void> Connection::send_text(std::string text) { return send(Message::text(std::move(text))); }
Result<void> Connection::send_binary(Bytes bytes) { return send(Message::binary(std::move(bytes))); }
Result<void> Connection::send_json(nlohmann::json doc) { return send(Message::json(std::move(doc))); }
Result<void> Connection::send_ping() { return send(Message::ping()); }
Result<void> Connection::send_pong() { return send(Message::pong()); }

nlohmann::json Connection::statistics() const {
    nlohmann::json s{
        {"state", to_string(state_)},
        {"messages_sent", messages_sent_},
        {"messages_received", messages_received_},
        {"errors_count", errors_count_},
        {"ping_sent", ping_sent_},
        {"pong_received", pong_received_}
    };

    if( connection_start_time_ ) {
        s["connection_start_time"] = format_timestamp(*connection_start_time_);
        s["connection_duration_ms"] = ms_since(*connection_start_time_);
    }
    if( last_message_time_ ) {
        s["last_message_time"] = format_timestamp(*last_message_time_);
        s["time_since_last_message_ms"] = ms_since(*last_message_time_);
    }
    if( last_ping_time_ ) {
        s["last_ping_time"] = format_timestamp(*last_ping_time_);
        s["time_since_last_ping_ms"] = ms_since(*last_ping_time_);
    }
    if( last_pong_time_ ) {
        s["last_pong_time"] = format_timestamp(*last_pong_time_);
        s["time_since_last_pong_ms"] = ms_since(*last_pong_time_);
    }
    if( heartbeat_latency_ )
        s["heartbeat_latency_ms"] = heartbeat_latency_->count();

    if( ping_sent_ > 0 && pong_received_ > 0 ) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f%%",
                      static_cast<double>(pong_received_) / static_cast<double>(ping_sent_) * 100.0);
        s["heartbeat_health"] = buf;
    }
    return s;
}

void Connection::dispose() {
    if( disposed_ ) return;

    disconnect();
    disposed_ = true;
    cancel_timers();
    pending_.clear();

    state_channel_.close();
    message_channel_.close();
    event_channel_.close();
}

void Connection::set_state(ConnectionState s) {
    if( state_ == s ) return;
    state_ = s;
    state_channel_.publish(s);
}

void Connection::emit(ConnectionEvent::Type type, std::string detail, std::optional<Message> message) {
    event_channel_.publish(ConnectionEvent{type, std::move(detail), std::move(message), Clock::now()});
}

void Connection::handle_open(std::uint64_t epoch) {
    if( disposed_ || epoch != epoch_ || state_ != ConnectionState::Connecting ) return;

    connect_timer_.cancel();
    start_heartbeat();
    set_state(ConnectionState::Connected);
    std::cout << "Connection: connected to " << config_.url << "\n";
    emit(ConnectionEvent::Type::Connected);
    complete_pending({});
}

void Connection::handle_frame(std::uint64_t epoch, Frame frame) {
    if( disposed_ || epoch != epoch_ || state_ != ConnectionState::Connected ) return;

    const auto now = Clock::now();
    ++messages_received_;
    last_message_time_ = now;

    Message message = decode(std::move(frame));

    if( message.kind() == MessageKind::Pong ) {
        ++pong_received_;
        last_pong_time_ = now;
        if( last_ping_time_ )
            heartbeat_latency_ = std::chrono::duration_cast<Ms>(now - *last_ping_time_);
        return;
    }

    if( message.kind() == MessageKind::Ping ) {
        auto answered = send_pong();
        if( !answered )
            std::cerr << "Connection: could not answer ping: " << answered.error().message << "\n";
    }

    message_channel_.publish(message);
    emit(ConnectionEvent::Type::MessageReceived, message.id(), message);
}

void Connection::handle_error(std::uint64_t epoch, const std::string& reason) {
    if( disposed_ || epoch != epoch_ ) return;
    if( state_ != ConnectionState::Connecting && state_ != ConnectionState::Connected ) return;

    ++errors_count_;
    std::cerr << "Connection: transport error: " << reason << "\n";
    emit(ConnectionEvent::Type::Error, reason);
    // an Error subscriber may have torn the session down already
    if( epoch == epoch_ ) fail(connection_failed(reason).value());
}

void Connection::handle_close(std::uint64_t epoch) {
    if( disposed_ || epoch != epoch_ ) return;

    if( state_ == ConnectionState::Connecting ) {
        fail(connection_failed("connection closed during handshake").value());
        return;
    }
    if( state_ != ConnectionState::Connected ) return;

    cancel_timers();
    release_transport();
    set_state(ConnectionState::Closed);
    std::cout << "Connection: closed by peer " << config_.url << "\n";
    emit(ConnectionEvent::Type::Disconnected);
}

void Connection::fail(const Error& error) {
    cancel_timers();
    if( auto t = release_transport() ) t->close();
    set_state(ConnectionState::Failed);
    std::cerr << "Connection: " << error.message << "\n";
    emit(ConnectionEvent::Type::ConnectionFailed, error.message);
    complete_pending(tl::unexpected<Error>(error));
}

void Connection::complete_pending(const Result<void>& result) {
    auto waiting = std::move(pending_);
    pending_.clear();
    for( auto& done : waiting ) done(result);
}

std::shared_ptr<Transport> Connection::release_transport() {
    // callbacks of the released session no longer match the epoch
    ++epoch_;
    return std::move(transport_);
}

void Connection::cancel_timers() {
    connect_timer_.cancel();
    heartbeat_timer_.cancel();
}

void Connection::start_heartbeat() {
    if( !config_.enable_heartbeat || config_.heartbeat_interval.count() <= 0 ) return;
    schedule_heartbeat();
}

void Connection::schedule_heartbeat() {
    std::weak_ptr<Connection> wk = weak_from_this();
    const auto epoch = epoch_;
    heartbeat_timer_.expires_after(config_.heartbeat_interval);
    heartbeat_timer_.async_wait([wk, epoch](const boost::system::error_code& ec) {
        if( ec ) return;
        auto self = wk.lock();
        if( !self || self->disposed_ || self->epoch_ != epoch ) return;
        self->heartbeat_tick();
    });
}

void Connection::heartbeat_tick() {
    if( state_ != ConnectionState::Connected ) return;

    if( last_ping_time_ && last_pong_time_ ) {
        const auto limit = config_.heartbeat_interval * 2;
        const auto now = Clock::now();
        if( now - *last_ping_time_ > limit && now - *last_pong_time_ > limit ) {
            ++errors_count_;
            std::cerr << "Connection: heartbeat timeout - no pong received\n";
            emit(ConnectionEvent::Type::Error, "heartbeat timeout - no pong received");
        }
    }

    auto pinged = send_ping();
    if( !pinged )
        std::cerr << "Connection: heartbeat ping failed: " << pinged.error().message << "\n";

    // a subscriber may have disconnected us while handling the events above
    if( state_ == ConnectionState::Connected ) schedule_heartbeat();
}

} // namespace wsplus
