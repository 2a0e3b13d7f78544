/*
 * BcmpChat - per-connection outbound queue implementation
 */

#include "outbox.hpp"

#include "utils.hpp"

#include <exception>
#include <utility>

namespace bcmpchat {

Outbox::Outbox(std::string nick, std::shared_ptr<SessionWriter> writer, std::size_t capacity)
    : nick_(std::move(nick)), writer_(std::move(writer)), capacity_(capacity) {
    thread_ = std::thread(&Outbox::run, this);
}

Outbox::~Outbox() {
    close();
}

bool Outbox::post(const Message& msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
        if (queue_.size() < capacity_) {
            queue_.push_back(msg);
            cv_.notify_one();
            return true;
        }
        open_ = false;
        queue_.clear();
    }

    log_warn(nick_ + " stopped reading (" + std::to_string(capacity_) +
             " messages queued), dropping the connection");
    writer_->shutdown();
    cv_.notify_all();
    return false;
}

void Outbox::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        queue_.clear();
    }
    writer_->shutdown();
    cv_.notify_all();
}

void Outbox::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
    }
    shutdown();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Outbox::open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::size_t Outbox::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Outbox::run() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !open_ || !queue_.empty(); });
        if (!open_) {
            return;
        }
        Message msg = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        try {
            writer_->send(msg);
        } catch (const std::exception& ex) {
            log_debug("Send to " + nick_ + " failed: " + ex.what());
            lock.lock();
            open_ = false;
            queue_.clear();
            lock.unlock();
            writer_->shutdown();
            return;
        }
    }
}

} // namespace bcmpchat
