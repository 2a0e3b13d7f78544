/*
 * BcmpChat - per-connection outbound queue
 *
 * Every active connection owns an Outbox: a bounded FIFO of messages drained
 * by a dedicated writer thread into the session's write half. The router only
 * posts into outboxes, so a peer that stops reading holds up nobody but
 * itself. When its queue overflows the peer is shut down, which ends its
 * read loop and takes it out of the registry.
 */

#pragma once

#include "message.hpp"
#include "session.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bcmpchat {

constexpr std::size_t kOutboxCapacity = 256;

class Outbox {
public:
    Outbox(std::string nick,
           std::shared_ptr<SessionWriter> writer,
           std::size_t capacity = kOutboxCapacity);
    ~Outbox();

    Outbox(const Outbox&) = delete;
    Outbox& operator=(const Outbox&) = delete;

    // Never blocks. Returns false when the message was not queued because the
    // outbox is full, closed or its transport has failed; a full outbox shuts
    // its transport down.
    bool post(const Message& msg);

    // Shuts the transport down in both directions. The writer thread stops
    // once its current send fails.
    void shutdown();

    // Shuts down, discards anything still queued and joins the writer thread.
    // Idempotent.
    void close();

    // False once the outbox overflowed, failed a send or was shut down.
    bool open() const;

    std::size_t queued() const;
    const std::string& nick() const { return nick_; }

private:
    void run();

    const std::string nick_;
    const std::shared_ptr<SessionWriter> writer_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> queue_;
    bool open_ = true;
    bool closed_ = false;
    std::thread thread_;
};

} // namespace bcmpchat
