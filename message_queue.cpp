#include "message_queue.hpp"

#include <algorithm>
#include <cmath>
#include <ostream>

namespace wsplus {

namespace {

// true when a must be sent before b
bool higher_priority(const Message& a, const Message& b) {
    if( a.is_control() != b.is_control() ) return a.is_control();
    if( a.requires_ack() != b.requires_ack() ) return a.requires_ack();
    if( a.retry_count() != b.retry_count() ) return a.retry_count() < b.retry_count();
    return a.created_at() < b.created_at();
}

} // namespace

MessageQueue::MessageQueue(std::size_t max_size, bool enable_priority, bool enable_deduplication)
    : max_size_(max_size),
      enable_priority_(enable_priority),
      enable_deduplication_(enable_deduplication) {}

bool MessageQueue::enqueue(Message message) {
    if( full() ) return false;
    if( enable_deduplication_ && ids_.count(message.id()) ) return false;

    if( enable_deduplication_ ) ids_.insert(message.id());
    queue_.push_back(std::move(message));

    if( enable_priority_ ) sort_by_priority();
    return true;
}

std::optional<Message> MessageQueue::dequeue() {
    if( queue_.empty() ) return std::nullopt;

    Message head = std::move(queue_.front());
    queue_.erase(queue_.begin());
    ids_.erase(head.id());
    return head;
}

std::optional<Message> MessageQueue::peek() const {
    if( queue_.empty() ) return std::nullopt;
    return queue_.front();
}

bool MessageQueue::remove(const std::string& id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const Message& m){ return m.id() == id; });
    if( it == queue_.end() ) return false;

    queue_.erase(it);
    ids_.erase(id);
    return true;
}

void MessageQueue::clear() {
    queue_.clear();
    ids_.clear();
}

bool MessageQueue::contains(const std::string& id) const {
    if( enable_deduplication_ ) return ids_.count(id) > 0;
    return std::any_of(queue_.begin(), queue_.end(),
                       [&](const Message& m){ return m.id() == id; });
}

bool MessageQueue::update_retry_count(const std::string& id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [&](const Message& m){ return m.id() == id; });
    if( it == queue_.end() || !it->can_retry() ) return false;

    *it = it->with_retry();
    if( enable_priority_ ) sort_by_priority();
    return true;
}

std::size_t MessageQueue::retryable_count() const {
    return static_cast<std::size_t>(std::count_if(queue_.begin(), queue_.end(),
                                                  [](const Message& m){ return m.can_retry(); }));
}

std::size_t MessageQueue::ack_required_count() const {
    return static_cast<std::size_t>(std::count_if(queue_.begin(), queue_.end(),
                                                  [](const Message& m){ return m.requires_ack(); }));
}

nlohmann::json MessageQueue::statistics() const {
    nlohmann::json by_kind = nlohmann::json::object();
    for( const auto& m : queue_ ) {
        const char* kind = to_string(m.kind());
        by_kind[kind] = by_kind.value(kind, 0) + 1;
    }

    double utilization = 0.0;
    if( max_size_ > 0 )
        utilization = std::round(static_cast<double>(queue_.size()) * 10000.0 / static_cast<double>(max_size_)) / 100.0;

    return nlohmann::json{
        {"size", queue_.size()},
        {"max_size", max_size_},
        {"utilization_percent", utilization},
        {"is_empty", empty()},
        {"is_full", full()},
        {"retryable_count", retryable_count()},
        {"ack_required_count", ack_required_count()},
        {"by_kind", std::move(by_kind)},
        {"enable_priority", enable_priority_},
        {"enable_deduplication", enable_deduplication_}
    };
}

void MessageQueue::sort_by_priority() {
    std::stable_sort(queue_.begin(), queue_.end(), higher_priority);
}

std::ostream& operator<<(std::ostream& os, const MessageQueue& q) {
    return os << "MessageQueue(size: " << q.size()
              << ", maxSize: " << q.max_size()
              << ", enablePriority: " << std::boolalpha << q.priority_enabled() << ")";
}

void to_json(nlohmann::json& j, const MessageQueue& q) {
    j = nlohmann::json{
        {"maxSize", q.max_size()},
        {"enablePriority", q.priority_enabled()},
        {"enableDeduplication", q.deduplication_enabled()},
        {"size", q.size()},
        {"messages", q.messages()}
    };
}

MessageQueue message_queue_from_json(const nlohmann::json& j) {
    MessageQueue q(j.value("maxSize", std::size_t{1000}),
                   j.value("enablePriority", true),
                   j.value("enableDeduplication", true));

    if( j.contains("messages") ) {
        for( const auto& m : j.at("messages") ) {
            if( !q.enqueue(message_from_json(m)) )
                throw nlohmann::json::other_error::create(501, "queue rejected message: over capacity or duplicate id", &m);
        }
    }
    return q;
}

} // namespace wsplus
