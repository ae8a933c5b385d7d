#ifndef WSPLUS_STREAM_MANAGER_HPP
#define WSPLUS_STREAM_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "message.hpp"
#include "message_queue.hpp"
#include "reconnect.hpp"
#include "signals.hpp"
#include "transport.hpp"

namespace boost::asio { class io_context; }

namespace wsplus {

enum class ManagerState : std::uint8_t { Idle, Connecting, Connected, Reconnecting, Disconnected };

const char* to_string(ManagerState s);

struct ManagerStateSnapshot {
    ManagerState state = ManagerState::Idle;
    ConnectionState connection_state = ConnectionState::Initial;
    bool reconnecting = false;
    int attempt = 0;
    std::size_t queue_size = 0;
};

struct ManagerEvent {
    enum class Type {
        Connecting,
        Connected,
        Disconnected,
        ConnectionFailed,
        Reconnecting,
        ReconnectionFailed,
        MessageSent,
        MessageQueued,
        MessageReceived,
        Error
    };
    // Connection: forwarded from the owned Connection's event channel.
    // A delivered message shows up twice, MessageSent from the Connection and
    // MessageSent from the Manager; filter on origin to count it once.
    enum class Origin { Manager, Connection };

    Type type;
    Origin origin = Origin::Manager;
    std::string detail;
    std::optional<Message> message;
    int attempt = 0;
    Clock::time_point timestamp = Clock::now();
};

const char* to_string(ManagerEvent::Type type);

class StreamManager {
    public:
    using Completion = Connection::Completion;

    // ---------------------------------------------------------------------
    // Lifecycle: StreamManager(io, config, transport_factory, policy)
    //
    // Purpose:
    //   Owns one logical stream: the current Connection, the outbound queue and
    //   the reconnection policy. Nothing happens until connect() is called and
    //   the io_context is pumped.
    //
    // Defaults:
    //   - transport_factory : WsTransport when empty.
    //   - policy            : built from config (NoReconnectPolicy when
    //                         reconnection is disabled) when null.
    StreamManager(boost::asio::io_context& io,
                  Config config,
                  TransportFactory transport_factory = {},
                  std::unique_ptr<ReconnectPolicy> policy = nullptr);

    // Disposes.
    ~StreamManager();

    StreamManager(const StreamManager&) = delete;
    StreamManager& operator=(const StreamManager&) = delete;

    // ---------------------------------------------------------------------
    // connect(done)
    //
    //   - No-op while a connection is Connecting/Connected (done joins the
    //     pending attempt, or completes at once when already connected).
    //   - Otherwise replaces the connection with a fresh one and opens it.
    //     On success the queue is drained; on failure the reconnection
    //     campaign takes over when enabled.
    //   - A user connect() starts a new campaign (attempt counter reset).
    void connect(Completion done = {});

    // ---------------------------------------------------------------------
    // disconnect()
    //
    //   Cancels any pending reconnection, resets the policy and attempt
    //   counter, tears the connection down. Queued messages are kept.
    void disconnect();

    // ---------------------------------------------------------------------
    // send(message)
    //
    //   Connected  : delivered now; on failure falls through to the queue.
    //   Otherwise  : queued when the queue is enabled.
    // Returns:
    //   - ok when delivered or queued.
    //   - QueueFull / DuplicateMessage when the queue rejects it.
    //   - NotConnected / MessageSendFailed when queuing is disabled.
    Result<void> send(Message message);
    Result<void> send_text(std::string text);
    Result<void> send_binary(Bytes bytes);
    Result<void> send_json(nlohmann::json doc);
    Result<void> send_ping();
    Result<void> send_pong();

    ManagerState state() const;
    ManagerStateSnapshot snapshot() const;
    bool connected() const;
    bool reconnecting() const;
    int reconnection_attempt() const;

    const Config& config() const;
    const MessageQueue& queue() const;
    std::shared_ptr<Connection> connection() const;

    signals::Channel<ManagerStateSnapshot>& state_changes();
    signals::Channel<ManagerEvent>& events();
    // Raw feeds from whichever Connection is current; they survive reconnects.
    signals::Channel<ConnectionState>& connection_states();
    signals::Channel<Message>& messages();

    nlohmann::json statistics() const;
    void log_statistics(std::ostream& os) const;

    void dispose();
    bool disposed() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace wsplus

#endif // WSPLUS_STREAM_MANAGER_HPP
