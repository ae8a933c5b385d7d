#ifndef WSPLUS_WS_TRANSPORT_HPP
#define WSPLUS_WS_TRANSPORT_HPP

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <deque>
#include <memory>
#include <string>

#include "transport.hpp"

namespace wsplus {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = boost::asio::ip::tcp;

struct WsEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// ws://host[:port][/path]; wss:// and other schemes are rejected.
tl::expected<WsEndpoint, std::string> parse_ws_url(const std::string& url);

/*
 * WsTransport
 *
 * Purpose:
 *   Transport backed by Boost.Beast WebSocket over plain TCP. Runs
 *   resolve -> connect -> handshake, then a continuous read loop, a serialized
 *   write queue and an orderly close handshake.
 *
 * Outputs:
 *   - on_open   : once, after the handshake completes.
 *   - on_frame  : for each frame read; Text when the frame was a text frame.
 *   - on_error  : once, for resolve/connect/handshake/read/write failures.
 *   - on_close  : once, after an orderly close (ours or the peer's).
 *   Only one of on_error / on_close is ever delivered for a session.
 *
 * Concurrency / ordering notes:
 *   - Writes are serialized on strand_ so frames leave in send() order and
 *     only one async_write is outstanding.
 *   - Read/connect/close handlers run on the io_context and keep the transport
 *     alive through shared_from_this().
 */
class WsTransport : public Transport, public std::enable_shared_from_this<WsTransport> {
public:
    explicit WsTransport(boost::asio::io_context& io);

    static TransportFactory factory();

    tl::expected<void, std::string> open(const std::string& url,
                                         const OpenOptions& options,
                                         TransportHandlers handlers) override;
    tl::expected<void, std::string> send(Frame frame) override;
    void close() override;

    std::size_t write_queue_depth() const { return write_queue_.size(); }

private:
    enum class State { Idle, Connecting, Open, Closing, Closed };

    void do_read();
    void do_write();
    void fail(const std::string& where, const beast::error_code& ec);
    void finish_close();

    tcp::resolver resolver_;
    websocket::stream<tcp::socket> ws_;
    boost::asio::strand<websocket::stream<tcp::socket>::executor_type> strand_;
    beast::flat_buffer buffer_;
    TransportHandlers handlers_;
    WsEndpoint endpoint_;
    std::deque<std::shared_ptr<Frame>> write_queue_;
    bool write_in_progress_ = false;
    bool finished_ = false;
    State state_ = State::Idle;
};

} // namespace wsplus

#endif // WSPLUS_WS_TRANSPORT_HPP
