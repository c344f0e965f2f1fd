// session_registry.hpp
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "connection.hpp"

// username -> live connection, plus the single pending-transfer slot per username.
// Keys are normalized on the way in. Single-threaded like the rest of the core.
class SessionRegistry {
public:
    using SessionMap = std::unordered_map<std::string, std::shared_ptr<Connection>>;

    // Overwrites any existing mapping and drops a stale pending transfer.
    void register_session(const std::string& username, std::shared_ptr<Connection> connection);
    // Safe to call for a username that is not registered.
    void unregister_session(const std::string& username);

    bool is_active(const std::string& username) const;
    std::shared_ptr<Connection> active_session(const std::string& username) const;
    SessionMap snapshot() const { return sessions_; }
    std::size_t active_count() const { return sessions_.size(); }

    // Username currently bound to `connection`, if it is the live session for one.
    std::optional<std::string> username_for(const Connection& connection) const;

    // Fails if there is no session for `username` or a transfer is already pending.
    bool set_pending(const std::string& username, std::shared_ptr<Connection> requester);
    std::shared_ptr<Connection> pending_transfer(const std::string& username) const;
    bool has_pending(const std::string& username) const;
    void clear_pending(const std::string& username);

private:
    SessionMap sessions_;
    SessionMap pending_;
};
