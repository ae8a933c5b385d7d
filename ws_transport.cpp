#include "ws_transport.hpp"

#include <boost/beast/http.hpp>
#include <iostream>

namespace wsplus {

tl::expected<WsEndpoint, std::string> parse_ws_url(const std::string& url) {
    const std::string scheme_sep = "://";
    const auto scheme_end = url.find(scheme_sep);
    if( scheme_end == std::string::npos )
        return tl::unexpected<std::string>("invalid url: " + url);

    const std::string scheme = url.substr(0, scheme_end);
    if( scheme == "wss" )
        return tl::unexpected<std::string>("wss:// is not supported by WsTransport");
    if( scheme != "ws" )
        return tl::unexpected<std::string>("unsupported scheme: " + scheme);

    const std::string rest = url.substr(scheme_end + scheme_sep.size());
    const auto path_start = rest.find('/');
    const std::string authority = rest.substr(0, path_start);

    WsEndpoint ep;
    ep.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    const auto colon = authority.rfind(':');
    if( colon == std::string::npos ) {
        ep.host = authority;
        ep.port = "80";
    } else {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    }

    if( ep.host.empty() )
        return tl::unexpected<std::string>("missing host in url: " + url);
    if( ep.port.empty() || ep.port.find_first_not_of("0123456789") != std::string::npos )
        return tl::unexpected<std::string>("invalid port in url: " + url);

    return ep;
}

WsTransport::WsTransport(boost::asio::io_context& io)
    : resolver_(io),
      ws_(io),
      strand_(ws_.get_executor()) {}

TransportFactory WsTransport::factory() {
    return [](boost::asio::io_context& io) -> std::shared_ptr<Transport> {
        return std::make_shared<WsTransport>(io);
    };
}

tl::expected<void, std::string> WsTransport::open(const std::string& url,
                                                  const OpenOptions& options,
                                                  TransportHandlers handlers) {
    if( state_ != State::Idle )
        return tl::unexpected<std::string>("transport already opened");

    auto ep = parse_ws_url(url);
    if( !ep ) return tl::unexpected<std::string>(ep.error());

    endpoint_ = std::move(*ep);
    handlers_ = std::move(handlers);
    state_ = State::Connecting;

    const auto headers = options.headers;
    std::string protocols;
    for( const auto& p : options.protocols ) {
        if( !protocols.empty() ) protocols += ", ";
        protocols += p;
    }

    ws_.set_option(websocket::stream_base::decorator(
        [headers, protocols](websocket::request_type& req) {
            for( const auto& [name, value] : headers )
                req.set(name, value);
            if( !protocols.empty() )
                req.set(beast::http::field::sec_websocket_protocol, protocols);
        }));

    auto self = shared_from_this();
    resolver_.async_resolve(endpoint_.host, endpoint_.port, [this, self](beast::error_code ec, tcp::resolver::results_type results) {
        if( ec ) return fail("resolve", ec);

        boost::asio::async_connect(ws_.next_layer(), results, [this, self](beast::error_code ec, const tcp::endpoint&) {
            if( ec ) return fail("connect", ec);

            const std::string host = endpoint_.host + ":" + endpoint_.port;
            ws_.async_handshake(host, endpoint_.target, [this, self](beast::error_code ec) {
                if( ec ) return fail("handshake", ec);
                if( state_ != State::Connecting ) return finish_close();

                state_ = State::Open;
                std::cout << "WsTransport: handshake complete with " << endpoint_.host << ":" << endpoint_.port << endpoint_.target << "\n";

                if( auto cb = handlers_.on_open ) cb();
                do_read();
            });
        });
    });

    return {};
}

void WsTransport::do_read() {
    auto self = shared_from_this();
    ws_.async_read(buffer_, [this, self](beast::error_code ec, std::size_t) {
        if( ec ) {
            if( ec == websocket::error::closed || state_ == State::Closing )
                return finish_close();
            return fail("read", ec);
        }

        Frame frame;
        frame.type = ws_.got_text() ? Frame::Type::Text : Frame::Type::Binary;
        frame.data = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        if( auto cb = handlers_.on_frame ) cb(std::move(frame));
        if( state_ == State::Open ) do_read();
    });
}

tl::expected<void, std::string> WsTransport::send(Frame frame) {
    if( state_ != State::Open )
        return tl::unexpected<std::string>("websocket is not open");

    auto buf = std::make_shared<Frame>(std::move(frame));
    auto self = shared_from_this();
    boost::asio::post(boost::asio::bind_executor(strand_, [this, self, buf]() {
        write_queue_.push_back(buf);
        if( !write_in_progress_ ) do_write();
    }));
    return {};
}

void WsTransport::do_write() {
    if( write_queue_.empty() || state_ != State::Open ) {
        write_in_progress_ = false;
        return;
    }
    write_in_progress_ = true;

    const auto& frame = *write_queue_.front();
    ws_.text(frame.type == Frame::Type::Text);

    auto self = shared_from_this();
    ws_.async_write(boost::asio::buffer(frame.data), boost::asio::bind_executor(strand_, [this, self](beast::error_code ec, std::size_t) {
        write_queue_.pop_front();
        if( ec ) {
            write_in_progress_ = false;
            return fail("write", ec);
        }
        do_write();
    }));
}

void WsTransport::close() {
    switch( state_ ) {
        case State::Open: {
            state_ = State::Closing;
            auto self = shared_from_this();
            ws_.async_close(websocket::close_code::normal, [this, self](beast::error_code ec) {
                if( ec && ec != websocket::error::closed )
                    std::cerr << "WsTransport: close error: " << ec.message() << "\n";
                finish_close();
            });
            break;
        }
        case State::Connecting: {
            // pending resolve/connect/handshake completes with operation_aborted
            state_ = State::Closing;
            resolver_.cancel();
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).close(ignored);
            break;
        }
        case State::Idle:
            state_ = State::Closed;
            finished_ = true;
            break;
        case State::Closing:
        case State::Closed:
            break;
    }
}

void WsTransport::fail(const std::string& where, const beast::error_code& ec) {
    if( state_ == State::Closing ) return finish_close();
    if( finished_ ) return;

    finished_ = true;
    state_ = State::Closed;
    write_queue_.clear();
    std::cerr << "WsTransport: " << where << " error: " << ec.message() << "\n";

    beast::error_code ignored;
    beast::get_lowest_layer(ws_).close(ignored);

    if( auto cb = handlers_.on_error ) cb(where + ": " + ec.message());
}

void WsTransport::finish_close() {
    if( finished_ ) return;

    finished_ = true;
    state_ = State::Closed;
    write_queue_.clear();
    std::cout << "WsTransport: closed\n";

    if( auto cb = handlers_.on_close ) cb();
}

} // namespace wsplus
