#ifndef WSPLUS_MESSAGE_QUEUE_HPP
#define WSPLUS_MESSAGE_QUEUE_HPP

#include <cstddef>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "message.hpp"

namespace wsplus {

/*
 * MessageQueue
 *
 * Purpose:
 *   Bounded store of outbound messages waiting for a live connection.
 *
 * Ordering (enable_priority):
 *   control -> requires_ack -> lower retry_count -> earlier created_at.
 *   Equal keys keep insertion order (stable sort after every insertion).
 *   Without priority the queue is plain FIFO.
 *
 * Deduplication (enable_deduplication):
 *   An id can be present at most once; the id set is kept in step with the
 *   stored messages on every enqueue/dequeue/remove/clear.
 */
class MessageQueue {
public:
    explicit MessageQueue(std::size_t max_size = 1000,
                          bool enable_priority = true,
                          bool enable_deduplication = true);

    // false when full or (with deduplication) the id is already queued
    bool enqueue(Message message);
    std::optional<Message> dequeue();
    std::optional<Message> peek() const;

    bool remove(const std::string& id);
    void clear();
    bool contains(const std::string& id) const;

    // Bumps retry_count of the queued message if it can still be retried.
    bool update_retry_count(const std::string& id);

    std::size_t size() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }
    bool full() const { return queue_.size() >= max_size_; }
    std::size_t max_size() const { return max_size_; }
    bool priority_enabled() const { return enable_priority_; }
    bool deduplication_enabled() const { return enable_deduplication_; }

    const std::vector<Message>& messages() const { return queue_; }
    std::size_t retryable_count() const;
    std::size_t ack_required_count() const;

    nlohmann::json statistics() const;

private:
    void sort_by_priority();

    std::size_t max_size_;
    bool enable_priority_;
    bool enable_deduplication_;
    std::vector<Message> queue_;
    std::unordered_set<std::string> ids_;
};

std::ostream& operator<<(std::ostream& os, const MessageQueue& q);

void to_json(nlohmann::json& j, const MessageQueue& q);
// Rebuilds the queue by enqueueing each stored message in order.
MessageQueue message_queue_from_json(const nlohmann::json& j);

} // namespace wsplus

#endif // WSPLUS_MESSAGE_QUEUE_HPP
