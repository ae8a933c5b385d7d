#ifndef WSPLUS_SIGNALS_HPP
#define WSPLUS_SIGNALS_HPP

#include <boost/signals2.hpp>
#include <deque>
#include <functional>

namespace wsplus::signals {

/*
 * Channel<T>
 *
 * Broadcast channel: every subscriber sees every value published after it
 * subscribed, exactly once, in publish order.
 *
 * Re-entrancy:
 *   - A subscriber may publish on the same channel while being notified. The
 *     nested value is parked and delivered once the current value has reached
 *     every subscriber, so no subscriber ever observes values out of order.
 *
 * Exceptions:
 *   - An exception from a subscriber propagates out of publish(); values still
 *     parked behind it are discarded and the channel stays usable.
 *
 * Close:
 *   - close() drops all subscribers; later publish() calls are ignored.
 *   - Idempotent.
 */
template <typename T>
class Channel {
public:
    using Slot = std::function<void(const T&)>;
    using Subscription = boost::signals2::connection;

    Subscription subscribe(Slot slot) {
        if( closed_ ) return {};
        return signal_.connect(std::move(slot));
    }

    void publish(const T& value) {
        if( closed_ ) return;
        pending_.push_back(value);
        if( emitting_ ) return;

        emitting_ = true;
        try {
            while( !pending_.empty() && !closed_ ) {
                T next = std::move(pending_.front());
                pending_.pop_front();
                signal_(next);
            }
        } catch( ... ) {
            // a throwing subscriber must not wedge the channel
            pending_.clear();
            emitting_ = false;
            throw;
        }
        pending_.clear();
        emitting_ = false;
    }

    void close() {
        if( closed_ ) return;
        closed_ = true;
        signal_.disconnect_all_slots();
    }

    bool closed() const { return closed_; }

    std::size_t subscriber_count() const { return signal_.num_slots(); }

private:
    boost::signals2::signal<void(const T&)> signal_;
    std::deque<T> pending_;
    bool emitting_ = false;
    bool closed_ = false;
};

} // namespace wsplus::signals

#endif // WSPLUS_SIGNALS_HPP
