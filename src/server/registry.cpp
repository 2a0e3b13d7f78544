/*
 * BcmpChat - nickname registry implementation
 */

#include "registry.hpp"

#include "utils.hpp"

namespace bcmpchat {

const char* rejection_reason(Admission admission) {
    switch (admission) {
        case Admission::Accepted:
            return "";
        case Admission::TooManyUsers:
            return "too many users";
        case Admission::NickTaken:
            return "nick taken";
        case Admission::InvalidNick:
            return "invalid nick";
    }
    return "rejected";
}

Registry::Registry(std::size_t max_users) : max_users_(max_users) {}

Admission Registry::reserve(const std::string& nick) {
    if (nick.empty() || nick.find('\0') != std::string::npos) {
        return Admission::InvalidNick;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() >= max_users_) {
        return Admission::TooManyUsers;
    }
    if (entries_.count(nick) != 0) {
        return Admission::NickTaken;
    }
    entries_.emplace(nick, nullptr);
    return Admission::Accepted;
}

void Registry::activate(const std::string& nick, std::shared_ptr<Outbox> outbox) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[nick] = std::move(outbox);
}

void Registry::remove(const std::string& nick) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(nick);
}

std::vector<std::shared_ptr<Outbox>> Registry::outboxes() const {
    std::vector<std::shared_ptr<Outbox>> active;
    std::lock_guard<std::mutex> lock(mutex_);
    active.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (entry.second) {
            active.push_back(entry.second);
        }
    }
    return active;
}

bool Registry::contains(const std::string& nick) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(nick) != 0;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t Registry::shutdown_all() {
    std::size_t count = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [nick, outbox] : entries_) {
        if (!outbox) {
            continue;
        }
        log_debug("Shutting down " + nick + "'s stream");
        outbox->shutdown();
        ++count;
    }
    return count;
}

} // namespace bcmpchat
