#ifndef WSPLUS_TRANSPORT_HPP
#define WSPLUS_TRANSPORT_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <vector>

namespace boost::asio { class io_context; }

namespace wsplus {

struct Frame {
    enum class Type { Text, Binary };
    Type type = Type::Text;
    std::string data;
};

struct OpenOptions {
    std::map<std::string, std::string> headers;
    std::vector<std::string> protocols;
};

// Installed once per open(); every callback runs on the transport's io_context.
struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(Frame)> on_frame;
    std::function<void(const std::string&)> on_error;
    std::function<void()> on_close;
};

/*
 * Transport
 *
 * Framed byte delivery to one remote endpoint.
 *
 *   - open(url, options, handlers) : immediate error, or the request is accepted
 *                                    and exactly one of on_open / on_error follows.
 *   - send(frame)                  : error when the session cannot take the frame.
 *   - close()                      : orderly shutdown; on_close fires once done.
 *   - supports_headers()           : false when custom request headers would be
 *                                    ignored by the implementation.
 */
struct Transport {
    virtual tl::expected<void, std::string> open(const std::string& url,
                                                 const OpenOptions& options,
                                                 TransportHandlers handlers) = 0;
    virtual tl::expected<void, std::string> send(Frame frame) = 0;
    virtual void close() = 0;
    virtual bool supports_headers() const { return true; }
    virtual ~Transport() = default;
};

using TransportFactory = std::function<std::shared_ptr<Transport>(boost::asio::io_context&)>;

} // namespace wsplus

#endif // WSPLUS_TRANSPORT_HPP
