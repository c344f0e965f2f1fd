// identity_service.cpp
#include "identity_service.hpp"
#include "logger.hpp"

const char* to_string(LoginResult result) {
    switch (result) {
        case LoginResult::Authenticated: return "authenticated";
        case LoginResult::TransferPending: return "transfer_pending";
        case LoginResult::TransferBusy: return "transfer_busy";
        case LoginResult::InvalidCredentials: return "invalid_credentials";
    }
    return "unknown";
}

IdentityService::IdentityService(boost::asio::io_context& ioc,
                                 std::unique_ptr<PersistenceGateway> gateway,
                                 CombatCollaborator& combat,
                                 IdentityOptions options)
    : gateway_(std::move(gateway)),
      auth_(options.pbkdf2_iterations),
      users_(*gateway_, auth_),
      sessions_(),
      transfers_(ioc, users_, sessions_, combat, options.grace_delay),
      users_snapshot_(std::move(options.users_snapshot)) {
    gateway_->set_test_mode(options.test_mode);
}

IdentityService::~IdentityService() = default;

void IdentityService::start() {
    users_.load(users_snapshot_);
    users_snapshot_.reset();
}

LoginResult IdentityService::login(const std::shared_ptr<Connection>& connection,
                                   const std::string& username,
                                   const std::string& password) {
    if (!users_.authenticate(username, password)) return LoginResult::InvalidCredentials;

    const std::string name = normalize_username(username);
    if (sessions_.is_active(name)) {
        if (transfers_.request_transfer(name, connection)) return LoginResult::TransferPending;
        return LoginResult::TransferBusy;
    }

    bind(connection, name);
    return LoginResult::Authenticated;
}

bool IdentityService::register_player(const std::shared_ptr<Connection>& connection,
                                      const std::string& username,
                                      const std::string& password) {
    if (!users_.create_user(username, password)) return false;
    bind(connection, normalize_username(username));
    return true;
}

void IdentityService::bind(const std::shared_ptr<Connection>& connection, const std::string& name) {
    users_.update_last_login(name);
    const PlayerRecord* record = users_.get_user(name);
    if (record) connection->attach_record(*record);
    connection->set_authenticated(true);
    connection->set_state(ClientState::Authenticated);
    sessions_.register_session(name, connection);
    session_started_[name] = std::chrono::steady_clock::now();
}

void IdentityService::end_session(const std::string& name) {
    auto it = session_started_.find(name);
    if (it != session_started_.end()) {
        auto played = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - it->second);
        users_.add_play_time(name, played.count());
        session_started_.erase(it);
    }
    sessions_.unregister_session(name);
}

void IdentityService::logout(const std::shared_ptr<Connection>& connection) {
    std::optional<std::string> name = sessions_.username_for(*connection);
    if (!name) return;

    if (sessions_.has_pending(*name)) transfers_.cancel_transfer(*name);
    end_session(*name);
    connection->set_authenticated(false);
    connection->detach_record();
    Logger::instance().info("User logged out", { {"username", *name} });
}

void IdentityService::handle_disconnect(const std::shared_ptr<Connection>& connection) {
    const TransferContext& ctx = connection->transfer_context();

    // A requester that gives up before the decision.
    if (ctx.waiting_for_transfer && !ctx.transfer_username.empty()) {
        const std::string name = ctx.transfer_username;
        if (sessions_.pending_transfer(name) == connection) transfers_.cancel_transfer(name);
    }

    std::optional<std::string> name = sessions_.username_for(*connection);
    if (!name) return;   // never bound, or already superseded by a transfer

    if (sessions_.has_pending(*name)) {
        // The bound side dropped mid-handshake; hand the identity to whoever is waiting.
        Logger::instance().info("Bound connection dropped during transfer, promoting requester", { {"username", *name} });
        transfers_.resolve_transfer(*name, true);
        return;
    }
    end_session(*name);
}

void IdentityService::shutdown() {
    for (const auto& kv : session_started_) {
        auto played = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - kv.second);
        PlayerRecord* record = users_.get_user(kv.first);
        if (record) record->total_play_time += played.count();
    }
    session_started_.clear();
    users_.save();
    gateway_->flush();
    Logger::instance().info("Identity service shut down", { {"users", static_cast<uint64_t>(users_.size())} });
}
