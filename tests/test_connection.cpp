#include <gtest/gtest.h>
#include <chrono>

#include "connection.hpp"
#include "test_harness.hpp"

using namespace wsplus;
using namespace std::chrono_literals;

namespace {

struct ConnectionFixture : ::testing::Test {
    boost::asio::io_context io;
    FakeTransportHub hub;
    Config cfg = Config::production("ws://fake.local/stream");
    std::shared_ptr<Connection> conn;

    std::vector<ConnectionState> states;
    std::vector<ConnectionEvent> events;
    std::vector<Message> inbound;

    void make() {
        conn = Connection::create(io, cfg, hub.factory());
        conn->state_changes().subscribe([this](const ConnectionState& s){ states.push_back(s); });
        conn->events().subscribe([this](const ConnectionEvent& e){ events.push_back(e); });
        conn->messages().subscribe([this](const Message& m){ inbound.push_back(m); });
    }

    void connect_ok() {
        make();
        std::optional<Result<void>> outcome;
        conn->connect([&](Result<void> r){ outcome = r; });
        run_until(io, [&]{ return outcome.has_value(); }, 2s);
        ASSERT_TRUE(outcome.has_value());
        ASSERT_TRUE(outcome->has_value());
        ASSERT_EQ(conn->state(), ConnectionState::Connected);
    }

    int count(ConnectionEvent::Type t) const {
        int n = 0;
        for( const auto& e : events ) n += e.type == t;
        return n;
    }

    void SetUp() override {
        cfg.enable_heartbeat = false;
    }
};

} // namespace

TEST_F(ConnectionFixture, ConnectReachesConnected) {
    connect_ok();

    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connecting, ConnectionState::Connected}));
    EXPECT_EQ(count(ConnectionEvent::Type::Connected), 1);
    ASSERT_EQ(hub.created.size(), 1u);
    EXPECT_EQ(hub.last()->url(), "ws://fake.local/stream");
}

TEST_F(ConnectionFixture, ConnectIsIdempotentWhileConnectingOrConnected) {
    hub.behaviour.auto_open = false;
    make();

    int completions = 0;
    conn->connect([&](Result<void> r){ EXPECT_TRUE(r.has_value()); ++completions; });
    conn->connect([&](Result<void> r){ EXPECT_TRUE(r.has_value()); ++completions; });
    EXPECT_EQ(hub.created.size(), 1u);
    EXPECT_EQ(completions, 0);

    hub.last()->complete_open();
    EXPECT_EQ(completions, 2);

    conn->connect([&](Result<void> r){ EXPECT_TRUE(r.has_value()); ++completions; });
    EXPECT_EQ(completions, 3);
    EXPECT_EQ(hub.created.size(), 1u);
}

TEST_F(ConnectionFixture, HeadersAndProtocolsAreForwarded) {
    cfg.headers = {{"Authorization", "Bearer t"}};
    cfg.protocols = {"v2.stream"};
    connect_ok();

    EXPECT_EQ(hub.last()->options().headers.at("Authorization"), "Bearer t");
    EXPECT_EQ(hub.last()->options().protocols, (std::vector<std::string>{"v2.stream"}));
}

TEST_F(ConnectionFixture, HeadersDroppedWhenTransportCannotSendThem) {
    hub.behaviour.headers_supported = false;
    cfg.headers = {{"Authorization", "Bearer t"}};
    connect_ok();

    EXPECT_TRUE(hub.last()->options().headers.empty());
}

TEST_F(ConnectionFixture, ImmediateOpenFailureFails) {
    hub.behaviour.fail_open_sync = true;
    make();

    std::optional<Result<void>> outcome;
    conn->connect([&](Result<void> r){ outcome = r; });

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(outcome->error().message, "Connection failed: connection refused");
    EXPECT_EQ(conn->state(), ConnectionState::Failed);
    EXPECT_EQ(count(ConnectionEvent::Type::ConnectionFailed), 1);
    EXPECT_EQ(states.back(), ConnectionState::Failed);
}

TEST_F(ConnectionFixture, AsyncOpenErrorRaisesErrorThenFails) {
    hub.behaviour.fail_open_async = true;
    make();

    std::optional<Result<void>> outcome;
    conn->connect([&](Result<void> r){ outcome = r; });
    run_until(io, [&]{ return outcome.has_value(); }, 2s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::ConnectionFailed);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, ConnectionEvent::Type::Error);
    EXPECT_EQ(events[1].type, ConnectionEvent::Type::ConnectionFailed);
    EXPECT_EQ(conn->statistics().at("errors_count"), 1);
}

TEST_F(ConnectionFixture, ConnectTimesOut) {
    hub.behaviour.auto_open = false;
    cfg.connection_timeout = 30ms;
    make();

    std::optional<Result<void>> outcome;
    conn->connect([&](Result<void> r){ outcome = r; });
    run_until(io, [&]{ return outcome.has_value(); }, 2s);

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::Timeout);
    EXPECT_EQ(outcome->error().message, "connect timed out");
    EXPECT_EQ(conn->state(), ConnectionState::Failed);
    EXPECT_EQ(hub.last()->close_calls(), 1);

    // a late open from the abandoned session is ignored
    hub.last()->complete_open();
    EXPECT_EQ(conn->state(), ConnectionState::Failed);
}

TEST_F(ConnectionFixture, SendRequiresConnection) {
    make();
    auto r = conn->send_text("early");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotConnected);
}

TEST_F(ConnectionFixture, SendEncodesEachKind) {
    connect_ok();

    ASSERT_TRUE(conn->send_text("hello").has_value());
    ASSERT_TRUE(conn->send_binary({0x00, 0xff}).has_value());
    ASSERT_TRUE(conn->send_json({{"b", 2}, {"a", 1}}).has_value());
    ASSERT_TRUE(conn->send_ping().has_value());
    ASSERT_TRUE(conn->send_pong().has_value());

    const auto& sent = hub.last()->sent();
    ASSERT_EQ(sent.size(), 5u);
    EXPECT_EQ(sent[0].type, Frame::Type::Text);
    EXPECT_EQ(sent[0].data, "hello");
    EXPECT_EQ(sent[1].type, Frame::Type::Binary);
    EXPECT_EQ(sent[1].data, std::string("\x00\xff", 2));
    EXPECT_EQ(sent[2].data, "{\"a\":1,\"b\":2}");
    EXPECT_EQ(sent[3].data, "ping");
    EXPECT_EQ(sent[4].data, "pong");

    auto stats = conn->statistics();
    EXPECT_EQ(stats.at("messages_sent"), 5);
    EXPECT_EQ(stats.at("ping_sent"), 1);
    EXPECT_TRUE(stats.contains("last_ping_time"));
    EXPECT_EQ(count(ConnectionEvent::Type::MessageSent), 5);
}

TEST_F(ConnectionFixture, TransportSendFailureIsReported) {
    connect_ok();
    hub.behaviour.fail_sends = true;

    auto r = conn->send_text("lost");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::MessageSendFailed);
    EXPECT_EQ(r.error().message, "Failed to send message: broken pipe");
    EXPECT_EQ(conn->statistics().at("errors_count"), 1);
    EXPECT_EQ(count(ConnectionEvent::Type::MessageSent), 0);
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
}

TEST_F(ConnectionFixture, InboundFramesAreClassified) {
    connect_ok();
    auto t = hub.last();

    t->inject_text("hello");
    t->inject_text("  {\"a\":1}");
    t->inject_text("[1,2]");
    t->inject_text("{not json");
    t->inject_binary(std::string("\x01\x02", 2));

    ASSERT_EQ(inbound.size(), 5u);
    EXPECT_EQ(inbound[0].kind(), MessageKind::Text);
    EXPECT_EQ(inbound[1].kind(), MessageKind::Json);
    EXPECT_EQ(std::get<nlohmann::json>(inbound[1].payload()).at("a"), 1);
    EXPECT_EQ(inbound[2].kind(), MessageKind::Json);
    EXPECT_EQ(inbound[3].kind(), MessageKind::Text);
    EXPECT_EQ(std::get<std::string>(inbound[3].payload()), "{not json");
    EXPECT_EQ(inbound[4].kind(), MessageKind::Binary);
    EXPECT_EQ(std::get<Bytes>(inbound[4].payload()), (Bytes{1, 2}));

    EXPECT_EQ(count(ConnectionEvent::Type::MessageReceived), 5);
    EXPECT_EQ(conn->statistics().at("messages_received"), 5);
}

TEST_F(ConnectionFixture, PingIsAnsweredAndSurfaced) {
    connect_ok();
    hub.last()->inject_text("ping");

    ASSERT_EQ(inbound.size(), 1u);
    EXPECT_EQ(inbound[0].kind(), MessageKind::Ping);
    EXPECT_EQ(hub.last()->sent_texts(), (std::vector<std::string>{"pong"}));
}

TEST_F(ConnectionFixture, PongIsRecordedNotSurfaced) {
    connect_ok();
    ASSERT_TRUE(conn->send_ping().has_value());
    hub.last()->inject_text("pong");

    EXPECT_TRUE(inbound.empty());
    auto stats = conn->statistics();
    EXPECT_EQ(stats.at("pong_received"), 1);
    EXPECT_TRUE(stats.contains("heartbeat_latency_ms"));
    EXPECT_EQ(stats.at("heartbeat_health"), "100.00%");
}

TEST_F(ConnectionFixture, PeerCloseMovesToClosed) {
    connect_ok();
    hub.last()->inject_close();

    EXPECT_EQ(conn->state(), ConnectionState::Closed);
    EXPECT_EQ(count(ConnectionEvent::Type::Disconnected), 1);

    pump(io, 50ms);
    EXPECT_EQ(conn->state(), ConnectionState::Closed) << "no automatic way back to Connecting";
    EXPECT_EQ(hub.created.size(), 1u);
}

TEST_F(ConnectionFixture, TransportErrorWhileConnectedFails) {
    connect_ok();
    hub.last()->inject_error("reset by peer");

    EXPECT_EQ(conn->state(), ConnectionState::Failed);
    EXPECT_EQ(count(ConnectionEvent::Type::Error), 1);
    EXPECT_EQ(count(ConnectionEvent::Type::ConnectionFailed), 1);
    EXPECT_EQ(events.back().detail, "Connection failed: reset by peer");
}

TEST_F(ConnectionFixture, DisconnectClosesAndIsIdempotent) {
    connect_ok();
    states.clear();

    conn->disconnect();
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Closing, ConnectionState::Closed}));
    EXPECT_EQ(count(ConnectionEvent::Type::Disconnected), 1);
    EXPECT_EQ(hub.last()->close_calls(), 1);

    conn->disconnect();
    EXPECT_EQ(count(ConnectionEvent::Type::Disconnected), 1);
    EXPECT_EQ(hub.last()->close_calls(), 1);

    // explicit connect() is the way back
    std::optional<Result<void>> outcome;
    conn->connect([&](Result<void> r){ outcome = r; });
    run_until(io, [&]{ return outcome.has_value(); }, 2s);
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
    EXPECT_EQ(hub.created.size(), 2u);
}

TEST_F(ConnectionFixture, HeartbeatSendsPings) {
    cfg.enable_heartbeat = true;
    cfg.heartbeat_interval = 20ms;
    connect_ok();

    run_until(io, [&]{ return conn->statistics().at("ping_sent").get<int>() >= 2; }, 2s);
    EXPECT_GE(conn->statistics().at("ping_sent").get<int>(), 2);
    EXPECT_EQ(hub.last()->sent_texts().front(), "ping");
}

TEST_F(ConnectionFixture, HeartbeatTimeoutRaisesErrorButKeepsConnection) {
    cfg.enable_heartbeat = true;
    cfg.heartbeat_interval = 20ms;
    connect_ok();

    run_until(io, [&]{ return conn->statistics().at("ping_sent").get<int>() >= 1; }, 2s);
    hub.last()->inject_text("pong");

    // pings stop leaving, so both the last ping and the last pong age out
    hub.behaviour.fail_sends = true;
    auto timed_out = [&]{
        for( const auto& e : events )
            if( e.type == ConnectionEvent::Type::Error && e.detail == "heartbeat timeout - no pong received" ) return true;
        return false;
    };
    run_until(io, timed_out, 3s);

    EXPECT_TRUE(timed_out());
    EXPECT_EQ(conn->state(), ConnectionState::Connected);
}

TEST_F(ConnectionFixture, StatisticsSnapshot) {
    connect_ok();
    auto s = conn->statistics();

    EXPECT_EQ(s.at("state"), "Connected");
    EXPECT_EQ(s.at("messages_sent"), 0);
    EXPECT_TRUE(s.contains("connection_start_time"));
    EXPECT_TRUE(s.contains("connection_duration_ms"));
    EXPECT_FALSE(s.contains("heartbeat_health"));
    EXPECT_FALSE(s.contains("last_pong_time"));
}

TEST_F(ConnectionFixture, DisposeClosesChannelsAndDropsLateCallbacks) {
    connect_ok();
    auto t = hub.last();

    conn->dispose();
    conn->dispose();
    EXPECT_TRUE(conn->disposed());
    EXPECT_EQ(conn->state(), ConnectionState::Closed);
    EXPECT_TRUE(conn->messages().closed());
    EXPECT_TRUE(conn->events().closed());
    EXPECT_TRUE(conn->state_changes().closed());

    t->inject_text("after dispose");
    EXPECT_TRUE(inbound.empty());

    auto r = conn->send_text("x");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Disposed);

    std::optional<Result<void>> outcome;
    conn->connect([&](Result<void> res){ outcome = res; });
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->error().code, ErrorCode::Disposed);
}
