#ifndef WSPLUS_CONNECTION_HPP
#define WSPLUS_CONNECTION_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "connection_state.hpp"
#include "error.hpp"
#include "message.hpp"
#include "signals.hpp"
#include "transport.hpp"

namespace wsplus {

struct ConnectionEvent {
    enum class Type { Connected, Disconnected, ConnectionFailed, MessageSent, MessageReceived, Error };

    Type type;
    std::string detail;
    std::optional<Message> message;
    Clock::time_point timestamp = Clock::now();
};

const char* to_string(ConnectionEvent::Type type);

/*
 * Connection
 *
 * Purpose:
 *   Owns one transport session and the state machine around it:
 *     Initial -> Connecting -> Connected -> Closing -> Closed
 *                      \            \
 *                       +-> Failed   +-> Failed (transport error)
 *   A Closed or Failed connection only leaves that state through an explicit
 *   connect().
 *
 * Inputs:
 *   - connect(done)     : open the transport; done completes once with the outcome.
 *   - disconnect()      : orderly close; no-op when already Closed or Failed.
 *   - send(message)     : synchronous hand-off to the transport.
 *   - dispose()         : disconnect, stop timers, close all channels. Idempotent.
 *
 * Outputs:
 *   - state_changes()   : every transition, in order.
 *   - messages()        : inbound messages (pongs are consumed by the heartbeat).
 *   - events()          : lifecycle / traffic / error notifications.
 *
 * Lifetime notes:
 *   - Must be created via create(); transport and timer callbacks capture a
 *     weak_ptr and are dropped once the connection is gone, disposed, or has
 *     moved on to a newer transport session (epoch check).
 */
class Connection : public std::enable_shared_from_this<Connection> {
    struct PrivateTag {};

public:
    using Completion = std::function<void(Result<void>)>;

    static std::shared_ptr<Connection> create(boost::asio::io_context& io,
                                              Config config,
                                              TransportFactory factory);

    Connection(PrivateTag, boost::asio::io_context& io, Config config, TransportFactory factory);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void connect(Completion done = {});
    void disconnect();

    Result<void> send(const Message& message);
    Result<void> send_text(std::string text);
    Result<void> send_binary(Bytes bytes);
    Result<void> send_json(nlohmann::json doc);
    Result<void> send_ping();
    Result<void> send_pong();

    ConnectionState state() const { return state_; }
    bool connected() const { return state_ == ConnectionState::Connected; }
    const Config& config() const { return config_; }

    signals::Channel<ConnectionState>& state_changes() { return state_channel_; }
    signals::Channel<Message>& messages() { return message_channel_; }
    signals::Channel<ConnectionEvent>& events() { return event_channel_; }

    nlohmann::json statistics() const;

    void dispose();
    bool disposed() const { return disposed_; }

private:
    void set_state(ConnectionState s);
    void emit(ConnectionEvent::Type type, std::string detail = {}, std::optional<Message> message = std::nullopt);

    void handle_open(std::uint64_t epoch);
    void handle_frame(std::uint64_t epoch, Frame frame);
    void handle_error(std::uint64_t epoch, const std::string& reason);
    void handle_close(std::uint64_t epoch);

    void fail(const Error& error);
    void complete_pending(const Result<void>& result);
    std::shared_ptr<Transport> release_transport();
    void cancel_timers();

    void start_heartbeat();
    void schedule_heartbeat();
    void heartbeat_tick();

    boost::asio::io_context& io_;
    Config config_;
    TransportFactory factory_;
    std::shared_ptr<Transport> transport_;

    boost::asio::steady_timer connect_timer_;
    boost::asio::steady_timer heartbeat_timer_;

    ConnectionState state_ = ConnectionState::Initial;
    std::uint64_t epoch_ = 0;
    bool disposed_ = false;
    std::vector<Completion> pending_;

    signals::Channel<ConnectionState> state_channel_;
    signals::Channel<Message> message_channel_;
    signals::Channel<ConnectionEvent> event_channel_;

    std::uint64_t messages_sent_ = 0;
    std::uint64_t messages_received_ = 0;
    std::uint64_t errors_count_ = 0;
    std::uint64_t ping_sent_ = 0;
    std::uint64_t pong_received_ = 0;
    std::optional<Clock::time_point> connection_start_time_;
    std::optional<Clock::time_point> last_message_time_;
    std::optional<Clock::time_point> last_ping_time_;
    std::optional<Clock::time_point> last_pong_time_;
    std::optional<Ms> heartbeat_latency_;
};

} // namespace wsplus

#endif // WSPLUS_CONNECTION_HPP
