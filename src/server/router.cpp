/*
 * BcmpChat - message router implementation
 */

#include "router.hpp"

#include "utils.hpp"

#include <utility>

namespace bcmpchat {

Router::Router(Registry& registry, std::size_t capacity)
    : registry_(registry), capacity_(capacity) {}

void Router::push(Message msg, std::optional<std::string> recipient) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return queue_.size() < capacity_; });
        queue_.push_back(RouteEntry{std::move(msg), std::move(recipient)});
    }
    cv_.notify_one();
}

void Router::run() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        RouteEntry entry = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();

        deliver(entry);
    }
}

void Router::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

std::size_t Router::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Router::deliver(const RouteEntry& entry) {
    if (entry.recipient) {
        // TODO: deliver to a single session once the protocol has a message that sets a recipient.
        log_warn("Dropping " + std::string(to_string(entry.message.kind())) +
                 " addressed to " + *entry.recipient + ": directed delivery is not supported");
        return;
    }

    for (const auto& outbox : registry_.outboxes()) {
        if (!outbox->post(entry.message)) {
            log_debug("Broadcast not queued for " + outbox->nick());
        }
    }
}

} // namespace bcmpchat
