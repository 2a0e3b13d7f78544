/*
 * BcmpChat - message router
 */

#pragma once

#include "message.hpp"
#include "registry.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace bcmpchat {

struct RouteEntry {
    Message message;
    // Empty means broadcast to every registered session, the author included.
    std::optional<std::string> recipient;
};

constexpr std::size_t kRouterCapacity = 32;

// Bounded FIFO drained by a single consumer thread running run(). Each
// broadcast is posted to the outboxes registered when it is dequeued; the
// consumer never blocks on a socket. An outbox that refuses a message is
// logged and skipped.
class Router {
public:
    explicit Router(Registry& registry, std::size_t capacity = kRouterCapacity);

    // Blocks while the queue is full.
    void push(Message msg, std::optional<std::string> recipient = std::nullopt);

    // Returns once stop() was called and the queue is empty.
    void run();
    void stop();

    std::size_t pending() const;

private:
    void deliver(const RouteEntry& entry);

    Registry& registry_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable not_full_;
    std::deque<RouteEntry> queue_;
    bool stopping_ = false;
};

} // namespace bcmpchat
