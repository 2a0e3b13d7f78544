/*
 * BcmpChat - nickname registry
 */

#pragma once

#include "outbox.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bcmpchat {

enum class Admission {
    Accepted,
    TooManyUsers,
    NickTaken,
    InvalidNick
};

// Text sent back in ConnectionRejected, empty for Accepted.
const char* rejection_reason(Admission admission);

// Maps nicknames to the outbox of their session. A nickname is first
// reserved while its connection negotiates, then activated with an outbox
// once the session is ready. Reserved names count towards the user limit
// and block duplicates but receive nothing. Every member function takes the
// lock for its whole body and none of them throws while holding it.
class Registry {
public:
    explicit Registry(std::size_t max_users);

    // Checks capacity and uniqueness and reserves the nickname in one step.
    Admission reserve(const std::string& nick);

    void activate(const std::string& nick, std::shared_ptr<Outbox> outbox);

    void remove(const std::string& nick);

    // Active outboxes at the time of the call.
    std::vector<std::shared_ptr<Outbox>> outboxes() const;

    bool contains(const std::string& nick) const;
    std::size_t size() const;
    std::size_t max_users() const { return max_users_; }

    // Shuts down every active transport; returns how many were shut down.
    std::size_t shutdown_all();

private:
    const std::size_t max_users_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Outbox>> entries_;
};

} // namespace bcmpchat
