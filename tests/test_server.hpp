#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace beast  = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/*
 * EchoServer
 *
 * Loopback WebSocket server for transport tests. Listens on an ephemeral
 * port, records the upgrade request of every client, and echoes each frame
 * back with the same text/binary type.
 */
class EchoServer {
    struct Session : std::enable_shared_from_this<Session> {
        websocket::stream<tcp::socket> ws;
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        EchoServer& owner;

        Session(tcp::socket s, EchoServer& o) : ws(std::move(s)), owner(o) {}

        void start() {
            auto self = shared_from_this();
            http::async_read(ws.next_layer(), buffer, req, [this, self](beast::error_code ec, std::size_t) {
                if( ec ) {
                    std::cerr << "EchoServer: upgrade read error: " << ec.message() << "\n";
                    return;
                }
                std::map<std::string, std::string> headers;
                for( const auto& field : req )
                    headers[std::string(field.name_string())] = std::string(field.value());
                owner.requests_.push_back(headers);

                const std::string protocol(req[http::field::sec_websocket_protocol]);
                const auto comma = protocol.find(',');
                const std::string chosen = protocol.substr(0, comma);
                ws.set_option(websocket::stream_base::decorator([chosen](websocket::response_type& res) {
                    if( !chosen.empty() ) res.set(http::field::sec_websocket_protocol, chosen);
                }));
                ws.async_accept(req, [this, self](beast::error_code ec) {
                    if( ec ) {
                        std::cerr << "EchoServer: accept error: " << ec.message() << "\n";
                        return;
                    }
                    buffer.consume(buffer.size());
                    do_read();
                });
            });
        }

        void do_read() {
            auto self = shared_from_this();
            ws.async_read(buffer, [this, self](beast::error_code ec, std::size_t) {
                if( ec ) return;
                const bool text = ws.got_text();
                auto payload = std::make_shared<std::string>(beast::buffers_to_string(buffer.data()));
                buffer.consume(buffer.size());
                owner.received_.push_back(*payload);

                ws.text(text);
                ws.async_write(asio::buffer(*payload), [this, self, payload](beast::error_code ec, std::size_t) {
                    if( ec ) return;
                    do_read();
                });
            });
        }

        void close() {
            auto self = shared_from_this();
            ws.async_close(websocket::close_code::normal, [self](beast::error_code) {});
        }
    };

    public:
        explicit EchoServer(asio::io_context& ioc)
            : acc_(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

        unsigned short port() const { return acc_.local_endpoint().port(); }
        std::string url(const std::string& path = "/") const {
            return "ws://127.0.0.1:" + std::to_string(port()) + path;
        }

        void start() {
            acc_.async_accept([this](beast::error_code ec, tcp::socket s) {
                if( ec ) return;
                auto session = std::make_shared<Session>(std::move(s), *this);
                sessions_.push_back(session);
                session->start();
                start();
            });
        }

        void stop() {
            beast::error_code ignored;
            acc_.close(ignored);
        }

        // orderly close from the server side on every live session
        void close_clients() {
            for( auto& s : sessions_ ) s->close();
        }

        const std::vector<std::map<std::string, std::string>>& requests() const { return requests_; }
        const std::vector<std::string>& received() const { return received_; }

    private:
        tcp::acceptor acc_;
        std::vector<std::shared_ptr<Session>> sessions_;
        std::vector<std::map<std::string, std::string>> requests_;
        std::vector<std::string> received_;
};
