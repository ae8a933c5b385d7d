#include "stream_manager.hpp"

#include <algorithm>
#include <boost/asio.hpp>
#include <iostream>
#include <vector>

#include "metrics_logger.hpp"
#include "ws_transport.hpp"

namespace wsplus {

const char* to_string(ManagerState s) {
    switch( s ) {
        case ManagerState::Idle:         return "Idle";
        case ManagerState::Connecting:   return "Connecting";
        case ManagerState::Connected:    return "Connected";
        case ManagerState::Reconnecting: return "Reconnecting";
        case ManagerState::Disconnected: return "Disconnected";
    }
    return "Idle";
}

const char* to_string(ManagerEvent::Type type) {
    switch( type ) {
        case ManagerEvent::Type::Connecting:         return "connecting";
        case ManagerEvent::Type::Connected:          return "connected";
        case ManagerEvent::Type::Disconnected:       return "disconnected";
        case ManagerEvent::Type::ConnectionFailed:   return "connection_failed";
        case ManagerEvent::Type::Reconnecting:       return "reconnecting";
        case ManagerEvent::Type::ReconnectionFailed: return "reconnection_failed";
        case ManagerEvent::Type::MessageSent:        return "message_sent";
        case ManagerEvent::Type::MessageQueued:      return "message_queued";
        case ManagerEvent::Type::MessageReceived:    return "message_received";
        case ManagerEvent::Type::Error:              return "error";
    }
    return "error";
}

namespace {

ManagerEvent::Type forwarded_type(ConnectionEvent::Type t) {
    switch( t ) {
        case ConnectionEvent::Type::Connected:        return ManagerEvent::Type::Connected;
        case ConnectionEvent::Type::Disconnected:     return ManagerEvent::Type::Disconnected;
        case ConnectionEvent::Type::ConnectionFailed: return ManagerEvent::Type::ConnectionFailed;
        case ConnectionEvent::Type::MessageSent:      return ManagerEvent::Type::MessageSent;
        case ConnectionEvent::Type::MessageReceived:  return ManagerEvent::Type::MessageReceived;
        case ConnectionEvent::Type::Error:            return ManagerEvent::Type::Error;
    }
    return ManagerEvent::Type::Error;
}

} // namespace

//Impl is handed to timer/channel callbacks as weak_ptr, hence enable_shared_from_this.
struct StreamManager::Impl : std::enable_shared_from_this<StreamManager::Impl> {
    boost::asio::io_context& io;
    Config config;
    TransportFactory factory;
    std::unique_ptr<ReconnectPolicy> policy;
    MessageQueue queue;

    std::shared_ptr<Connection> conn;
    std::vector<boost::signals2::scoped_connection> conn_subs;

    boost::asio::steady_timer reconnect_timer;
    bool reconnect_timer_pending = false;
    bool reconnecting = false;
    int attempt = 0;
    bool user_disconnect = false;
    bool drain_scheduled = false;
    bool disposed = false;
    std::uint64_t messages_dropped = 0;

    signals::Channel<ManagerStateSnapshot> state_channel;
    signals::Channel<ManagerEvent> event_channel;
    signals::Channel<ConnectionState> conn_state_channel;
    signals::Channel<Message> message_channel;

    MetricsLogger metrics_logger;

    Impl(boost::asio::io_context& ioc, Config c, TransportFactory f, std::unique_ptr<ReconnectPolicy> p)
        : io(ioc),
          config(std::move(c)),
          factory(f ? std::move(f) : WsTransport::factory()),
          policy(p ? std::move(p) : config.make_policy()),
          queue(static_cast<std::size_t>(std::max(0, config.max_queue_size))),
          reconnect_timer(ioc) {}

    ManagerState derive_state() const {
        if( reconnecting ) return ManagerState::Reconnecting;
        if( !conn ) return user_disconnect ? ManagerState::Disconnected : ManagerState::Idle;

        switch( conn->state() ) {
            case ConnectionState::Initial:
                return ManagerState::Idle;
            case ConnectionState::Connecting:
                return ManagerState::Connecting;
            case ConnectionState::Connected:
                return ManagerState::Connected;
            case ConnectionState::Reconnecting:
                return ManagerState::Reconnecting;
            case ConnectionState::Closing:
            case ConnectionState::Closed:
            case ConnectionState::Failed:
            case ConnectionState::Suspended:
                return ManagerState::Disconnected;
        }
        return ManagerState::Disconnected;
    }

    ManagerStateSnapshot snapshot() const {
        ManagerStateSnapshot s;
        s.state = derive_state();
        s.connection_state = conn ? conn->state() : ConnectionState::Initial;
        s.reconnecting = reconnecting;
        s.attempt = attempt;
        s.queue_size = queue.size();
        return s;
    }

    void publish_state() {
        state_channel.publish(snapshot());
    }

    void emit(ManagerEvent::Type type, std::string detail = {}, std::optional<Message> message = std::nullopt) {
        ManagerEvent e;
        e.type = type;
        e.detail = std::move(detail);
        e.message = std::move(message);
        e.attempt = attempt;
        event_channel.publish(e);
    }

    // ---------------------------------------------------------------------
    // open_connection()
    //
    // Replace the current Connection with a fresh one built from config, wire
    // its channels into ours and start it. Completion drains the queue on
    // success; failures are picked up by on_connection_state().
    void open_connection(Completion done) {
        teardown_connection();
        emit(ManagerEvent::Type::Connecting, config.url);

        conn = Connection::create(io, config, factory);
        std::weak_ptr<Impl> wk = weak_from_this();

        conn_subs.emplace_back(conn->state_changes().subscribe([wk](const ConnectionState& s) {
            if( auto self = wk.lock() ) self->on_connection_state(s);
        }));
        conn_subs.emplace_back(conn->messages().subscribe([wk](const Message& m) {
            if( auto self = wk.lock() ) self->message_channel.publish(m);
        }));
        conn_subs.emplace_back(conn->events().subscribe([wk](const ConnectionEvent& e) {
            if( auto self = wk.lock() ) {
                ManagerEvent fwd;
                fwd.type = forwarded_type(e.type);
                fwd.origin = ManagerEvent::Origin::Connection;
                fwd.detail = e.detail;
                fwd.message = e.message;
                fwd.attempt = self->attempt;
                fwd.timestamp = e.timestamp;
                self->event_channel.publish(fwd);
            }
        }));

        auto c = conn;
        std::weak_ptr<Connection> attempt_conn = c;
        c->connect([wk, attempt_conn, done = std::move(done)](Result<void> r) {
            auto self = wk.lock();
            if( self && r && self->conn == attempt_conn.lock() ) self->drain_queue();
            if( done ) done(std::move(r));
        });
    }

    void teardown_connection() {
        conn_subs.clear();
        if( conn ) {
            conn->dispose();
            conn.reset();
        }
    }

    void on_connection_state(ConnectionState s) {
        conn_state_channel.publish(s);

        if( s == ConnectionState::Connected ) {
            if( reconnecting || attempt > 0 )
                std::cout << "StreamManager: reconnected after " << attempt << " attempt(s)\n";
            reconnecting = false;
            attempt = 0;
            policy->reset();
        }
        else if( is_terminal_failure(s) && !user_disconnect && !disposed ) {
            schedule_reconnect();
        }
        publish_state();
    }

    // ---------------------------------------------------------------------
    // schedule_reconnect()
    //
    // One step of the reconnection campaign. Entered each time the current
    // connection ends up Failed/Closed; the attempt counter spans the whole
    // campaign and is only reset by reaching Connected or by the user.
    void schedule_reconnect() {
        if( !config.enable_reconnection || reconnect_timer_pending ) return;

        ++attempt;
        if( !policy->should_retry(attempt, config.max_reconnection_attempts) ) {
            reconnecting = false;
            std::cerr << "StreamManager: giving up after " << (attempt - 1) << " reconnection attempt(s)\n";
            emit(ManagerEvent::Type::ReconnectionFailed, reconnection_failed("max reconnection attempts reached").value().message);
            return;
        }

        reconnecting = true;
        const Ms delay = policy->delay(attempt);
        std::cout << "StreamManager: reconnect attempt " << attempt << " in " << delay.count() << " ms\n";
        emit(ManagerEvent::Type::Reconnecting, "reconnecting in " + std::to_string(delay.count()) + " ms");

        std::weak_ptr<Impl> wk = weak_from_this();
        reconnect_timer_pending = true;
        reconnect_timer.expires_after(delay);
        reconnect_timer.async_wait([wk](const boost::system::error_code& ec) {
            if( ec ) return;
            auto self = wk.lock();
            if( !self || self->disposed ) return;
            self->reconnect_timer_pending = false;
            if( self->user_disconnect ) return;
            self->open_connection({});
        });
    }

    void cancel_reconnect() {
        reconnect_timer.cancel();
        reconnect_timer_pending = false;
    }

    void drain_queue() {
        if( drain_scheduled ) return;
        drain_pass();
    }

    // Posted so that send() never delivers from inside itself.
    void schedule_drain() {
        if( drain_scheduled ) return;
        drain_scheduled = true;
        std::weak_ptr<Impl> wk = weak_from_this();
        boost::asio::post(io, [wk] {
            auto self = wk.lock();
            if( !self ) return;
            self->drain_scheduled = false;
            self->drain_pass();
        });
    }

    void drop(const Message& m, const std::string& reason) {
        ++messages_dropped;
        std::cerr << "StreamManager: dropping message " << m.id() << ": " << reason << "\n";
        emit(ManagerEvent::Type::Error,
             "Message " + m.id() + " dropped after " + std::to_string(m.retry_count()) +
             " retries: " + reason, m);
    }

    // ---------------------------------------------------------------------
    // drain_pass()
    //
    // Sends at most drain_batch_size queued messages, then yields to the
    // io_context before the next pass. A failed send ends the pass: the
    // message goes back with retry_count + 1, or is dropped once it is out of
    // retries.
    void drain_pass() {
        if( disposed || !conn || !conn->connected() ) return;

        // subscribers may replace conn while we are sending through it
        auto c = conn;
        int budget = std::max(1, config.drain_batch_size);
        while( budget-- > 0 && !queue.empty() && conn == c && c->connected() ) {
            auto next = queue.dequeue();
            if( !next ) break;
            const Message m = std::move(*next);

            auto r = c->send(m);
            if( r ) {
                emit(ManagerEvent::Type::MessageSent, m.id(), m);
                continue;
            }

            if( !m.can_retry() )
                drop(m, r.error().message);
            else if( !queue.enqueue(m.with_retry()) )
                drop(m, "queue rejected the retry");
            break;
        }
        publish_state();

        if( !queue.empty() && conn && conn->connected() )
            schedule_drain();
    }

    Result<void> enqueue(const Message& m) {
        if( queue.full() ) {
            emit(ManagerEvent::Type::Error, "Message queue is full, rejected " + m.id(), m);
            return make_error(ErrorCode::QueueFull,
                              "Message queue is full (max " + std::to_string(queue.max_size()) + ")");
        }
        if( queue.contains(m.id()) ) {
            emit(ManagerEvent::Type::Error, "Duplicate message " + m.id() + " rejected", m);
            return make_error(ErrorCode::DuplicateMessage, "Message " + m.id() + " is already queued");
        }

        queue.enqueue(m);
        emit(ManagerEvent::Type::MessageQueued, m.id(), m);
        publish_state();
        return {};
    }

    Result<void> send(Message m) {
        if( disposed ) return make_error(ErrorCode::Disposed, "stream manager disposed");

        auto c = conn;
        if( !c || !c->connected() ) {
            if( !config.enable_message_queue )
                return make_error(ErrorCode::NotConnected, "Not connected and message queue disabled");
            return enqueue(m);
        }

        // queued messages go first; new traffic joins them
        if( config.enable_message_queue && !queue.empty() ) {
            auto r = enqueue(m);
            if( r ) schedule_drain();
            return r;
        }

        auto r = c->send(m);
        if( r ) {
            emit(ManagerEvent::Type::MessageSent, m.id(), m);
            return {};
        }
        if( !m.can_retry() ) {
            drop(m, r.error().message);
            return r;
        }
        emit(ManagerEvent::Type::Error, "Failed to deliver message " + m.id() + ": " + r.error().message, m);
        if( !config.enable_message_queue ) return r;

        auto queued = enqueue(m.with_retry());
        if( queued ) schedule_drain();
        return queued;
    }

    nlohmann::json statistics() const {
        const auto s = snapshot();
        return nlohmann::json{
            {"state", to_string(s.state)},
            {"connection_state", to_string(s.connection_state)},
            {"is_connected", s.state == ManagerState::Connected},
            {"is_reconnecting", s.reconnecting},
            {"reconnection_attempt", s.attempt},
            {"messages_dropped", messages_dropped},
            {"queue", queue.statistics()},
            {"connection", conn ? conn->statistics() : nlohmann::json(nullptr)},
            {"config", config}
        };
    }

    void dispose() {
        if( disposed ) return;
        disposed = true;

        cancel_reconnect();
        teardown_connection();
        reconnecting = false;

        state_channel.close();
        event_channel.close();
        conn_state_channel.close();
        message_channel.close();
    }
};

StreamManager::StreamManager(boost::asio::io_context& io, Config config,
                             TransportFactory transport_factory,
                             std::unique_ptr<ReconnectPolicy> policy)
    : impl_(std::make_shared<Impl>(io, std::move(config), std::move(transport_factory), std::move(policy))) {}

StreamManager::~StreamManager() {
    if( impl_ ) impl_->dispose();
}

void StreamManager::connect(Completion done) {
    auto& s = *impl_;
    if( s.disposed ) {
        if( done ) done(make_error(ErrorCode::Disposed, "stream manager disposed"));
        return;
    }
    if( s.conn && (s.conn->state() == ConnectionState::Connecting || s.conn->state() == ConnectionState::Connected) ) {
        auto c = s.conn;
        c->connect(std::move(done));
        return;
    }

    s.user_disconnect = false;
    s.cancel_reconnect();
    s.reconnecting = false;
    s.attempt = 0;
    s.policy->reset();
    s.open_connection(std::move(done));
}

void StreamManager::disconnect() {
    auto& s = *impl_;
    if( s.disposed ) return;

    s.user_disconnect = true;
    s.cancel_reconnect();
    s.policy->reset();
    s.attempt = 0;
    s.reconnecting = false;

    if( auto c = s.conn ) c->disconnect();
    s.teardown_connection();

    std::cout << "StreamManager: disconnected\n";
    s.emit(ManagerEvent::Type::Disconnected);
    s.publish_state();
}

Result<void> StreamManager::send(Message message) { return impl_->send(std::move(message)); }
Result<void> StreamManager::send_text(std::string text) { return send(Message::text(std::move(text))); }
Result<void> StreamManager::send_binary(Bytes bytes) { return send(Message::binary(std::move(bytes))); }
Result<void> StreamManager::send_json(nlohmann::json doc) { return send(Message::json(std::move(doc))); }
Result<void> StreamManager::send_ping() { return send(Message::ping()); }
Result<void> StreamManager::send_pong() { return send(Message::pong()); }

ManagerState StreamManager::state() const { return impl_->derive_state(); }
ManagerStateSnapshot StreamManager::snapshot() const { return impl_->snapshot(); }
bool StreamManager::connected() const { return impl_->conn && impl_->conn->connected(); }
bool StreamManager::reconnecting() const { return impl_->reconnecting; }
int StreamManager::reconnection_attempt() const { return impl_->attempt; }

const Config& StreamManager::config() const { return impl_->config; }
const MessageQueue& StreamManager::queue() const { return impl_->queue; }
std::shared_ptr<Connection> StreamManager::connection() const { return impl_->conn; }

signals::Channel<ManagerStateSnapshot>& StreamManager::state_changes() { return impl_->state_channel; }
signals::Channel<ManagerEvent>& StreamManager::events() { return impl_->event_channel; }
signals::Channel<ConnectionState>& StreamManager::connection_states() { return impl_->conn_state_channel; }
signals::Channel<Message>& StreamManager::messages() { return impl_->message_channel; }

nlohmann::json StreamManager::statistics() const { return impl_->statistics(); }

void StreamManager::log_statistics(std::ostream& os) const {
    impl_->metrics_logger.log_statistics(impl_->statistics(), os);
}

void StreamManager::dispose() { impl_->dispose(); }
bool StreamManager::disposed() const { return impl_->disposed; }

} // namespace wsplus
