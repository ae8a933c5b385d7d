#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "transport.hpp"

// Pump the io_context until pred() holds or the timeout expires.
inline void run_until(boost::asio::io_context& ioc, std::function<bool ()> pred, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while( std::chrono::steady_clock::now() < deadline ) {
        if( pred() ) return;
        ioc.run_for(std::chrono::milliseconds(10));
        ioc.restart();
    }
}

// Run whatever is ready (or due within `for_`) and return.
inline void pump(boost::asio::io_context& ioc, std::chrono::milliseconds for_ = std::chrono::milliseconds(20))
{
    ioc.run_for(for_);
    ioc.restart();
}

/*
 * FakeTransport
 *
 * In-memory Transport for driving Connection / StreamManager without sockets.
 *   - Behaviour is shared with the hub so a test can flip it mid-run
 *     (e.g. start failing sends after the connection is up).
 *   - open() completes asynchronously (posted) like the real transport.
 *   - Outbound frames are recorded; inbound traffic is injected by the test.
 */
class FakeTransport : public wsplus::Transport, public std::enable_shared_from_this<FakeTransport> {
public:
    struct Behaviour {
        bool auto_open = true;
        bool fail_open_sync = false;
        bool fail_open_async = false;
        bool fail_sends = false;
        bool headers_supported = true;
        std::string open_error = "connection refused";
        // runs inside send() before a failure is returned
        std::function<void(const wsplus::Frame&)> on_failed_send;
    };

    FakeTransport(boost::asio::io_context& io, const Behaviour& behaviour)
        : io_(io), behaviour_(behaviour) {}

    tl::expected<void, std::string> open(const std::string& url,
                                         const wsplus::OpenOptions& options,
                                         wsplus::TransportHandlers handlers) override {
        url_ = url;
        options_ = options;
        ++open_calls_;
        if( behaviour_.fail_open_sync )
            return tl::unexpected<std::string>(behaviour_.open_error);

        handlers_ = std::move(handlers);
        std::weak_ptr<FakeTransport> wk = weak_from_this();
        if( behaviour_.fail_open_async ) {
            boost::asio::post(io_, [wk] {
                if( auto self = wk.lock() ) self->inject_error(self->behaviour_.open_error);
            });
        } else if( behaviour_.auto_open ) {
            boost::asio::post(io_, [wk] {
                if( auto self = wk.lock() ) self->complete_open();
            });
        }
        return {};
    }

    tl::expected<void, std::string> send(wsplus::Frame frame) override {
        if( behaviour_.fail_sends ) {
            if( behaviour_.on_failed_send ) behaviour_.on_failed_send(frame);
            return tl::unexpected<std::string>("broken pipe");
        }
        if( !open_ || closed_ )
            return tl::unexpected<std::string>("not open");
        sent_.push_back(std::move(frame));
        return {};
    }

    void close() override {
        closed_ = true;
        open_ = false;
        ++close_calls_;
    }

    bool supports_headers() const override { return behaviour_.headers_supported; }

    void complete_open() {
        if( open_ || closed_ ) return;
        open_ = true;
        if( auto cb = handlers_.on_open ) cb();
    }

    void inject_text(const std::string& text) {
        if( auto cb = handlers_.on_frame ) cb(wsplus::Frame{wsplus::Frame::Type::Text, text});
    }

    void inject_binary(const std::string& bytes) {
        if( auto cb = handlers_.on_frame ) cb(wsplus::Frame{wsplus::Frame::Type::Binary, bytes});
    }

    void inject_error(const std::string& reason) {
        if( auto cb = handlers_.on_error ) cb(reason);
    }

    void inject_close() {
        open_ = false;
        if( auto cb = handlers_.on_close ) cb();
    }

    const std::vector<wsplus::Frame>& sent() const { return sent_; }
    std::vector<std::string> sent_texts() const {
        std::vector<std::string> out;
        for( const auto& f : sent_ ) out.push_back(f.data);
        return out;
    }
    const std::string& url() const { return url_; }
    const wsplus::OpenOptions& options() const { return options_; }
    int open_calls() const { return open_calls_; }
    int close_calls() const { return close_calls_; }
    bool is_open() const { return open_; }

private:
    boost::asio::io_context& io_;
    const Behaviour& behaviour_;
    wsplus::TransportHandlers handlers_;
    std::string url_;
    wsplus::OpenOptions options_;
    std::vector<wsplus::Frame> sent_;
    int open_calls_ = 0;
    int close_calls_ = 0;
    bool open_ = false;
    bool closed_ = false;
};

// Hands out FakeTransports and keeps them for inspection. Must outlive
// whatever uses its factory.
struct FakeTransportHub {
    FakeTransport::Behaviour behaviour;
    std::vector<std::shared_ptr<FakeTransport>> created;

    wsplus::TransportFactory factory() {
        return [this](boost::asio::io_context& io) -> std::shared_ptr<wsplus::Transport> {
            auto t = std::make_shared<FakeTransport>(io, behaviour);
            created.push_back(t);
            return t;
        };
    }

    std::shared_ptr<FakeTransport> last() const {
        return created.empty() ? nullptr : created.back();
    }

    int opens() const {
        int n = 0;
        for( const auto& t : created ) n += t->open_calls();
        return n;
    }

    std::vector<std::string> sent_texts() const {
        std::vector<std::string> out;
        for( const auto& t : created )
            for( const auto& s : t->sent_texts() ) out.push_back(s);
        return out;
    }
};
