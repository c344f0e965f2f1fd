// session_registry.cpp
#include "session_registry.hpp"
#include "logger.hpp"

void SessionRegistry::register_session(const std::string& username, std::shared_ptr<Connection> connection) {
    const std::string name = normalize_username(username);
    sessions_[name] = std::move(connection);
    pending_.erase(name);

    Logger::instance().info("User logged in", { {"username", name}, {"online_count", static_cast<uint64_t>(sessions_.size())} });
    Logger::instance().player(name, "Logged in successfully");
}

void SessionRegistry::unregister_session(const std::string& username) {
    const std::string name = normalize_username(username);
    bool had_session = sessions_.erase(name) > 0;
    pending_.erase(name);
    if (!had_session) return;

    Logger::instance().info("User disconnected", { {"username", name}, {"online_count", static_cast<uint64_t>(sessions_.size())} });
    Logger::instance().player(name, "Disconnected from server");
}

bool SessionRegistry::is_active(const std::string& username) const {
    return sessions_.count(normalize_username(username)) > 0;
}

std::shared_ptr<Connection> SessionRegistry::active_session(const std::string& username) const {
    auto it = sessions_.find(normalize_username(username));
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<std::string> SessionRegistry::username_for(const Connection& connection) const {
    for (const auto& kv : sessions_) {
        if (kv.second.get() == &connection) return kv.first;
    }
    return std::nullopt;
}

bool SessionRegistry::set_pending(const std::string& username, std::shared_ptr<Connection> requester) {
    const std::string name = normalize_username(username);
    if (!sessions_.count(name) || pending_.count(name)) return false;
    pending_[name] = std::move(requester);
    return true;
}

std::shared_ptr<Connection> SessionRegistry::pending_transfer(const std::string& username) const {
    auto it = pending_.find(normalize_username(username));
    return it == pending_.end() ? nullptr : it->second;
}

bool SessionRegistry::has_pending(const std::string& username) const {
    return pending_.count(normalize_username(username)) > 0;
}

void SessionRegistry::clear_pending(const std::string& username) {
    pending_.erase(normalize_username(username));
}
