// identity_service.hpp
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include "password_authenticator.hpp"
#include "persistence_gateway.hpp"
#include "session_registry.hpp"
#include "transfer_coordinator.hpp"
#include "user_store.hpp"

class CombatCollaborator;

enum class LoginResult {
    Authenticated,       // bound directly, no previous session
    TransferPending,     // identity already bound; the bound connection was asked
    TransferBusy,        // identity already has a transfer waiting for a decision
    InvalidCredentials,
};

const char* to_string(LoginResult result);

struct IdentityOptions {
    int pbkdf2_iterations = PasswordAuthenticator::kDefaultIterations;
    std::chrono::milliseconds grace_delay = TransferCoordinator::kDefaultGraceDelay;
    bool test_mode = false;
    std::optional<nlohmann::json> users_snapshot;
};

// Owns the player store, the session registry and the transfer coordinator
// for one server. Everything here runs on the io_context thread.
class IdentityService {
public:
    IdentityService(boost::asio::io_context& ioc,
                    std::unique_ptr<PersistenceGateway> gateway,
                    CombatCollaborator& combat,
                    IdentityOptions options = IdentityOptions());
    ~IdentityService();

    // Loads players from the snapshot, if any, else from the gateway.
    void start();

    LoginResult login(const std::shared_ptr<Connection>& connection,
                      const std::string& username,
                      const std::string& password);

    // Creates the account and binds the connection to it.
    bool register_player(const std::shared_ptr<Connection>& connection,
                         const std::string& username,
                         const std::string& password);

    void logout(const std::shared_ptr<Connection>& connection);

    // Called by the transport when a socket goes away, whatever state it was in.
    void handle_disconnect(const std::shared_ptr<Connection>& connection);

    // Final save; waits for queued database writes.
    void shutdown();

    UserStore& users() { return users_; }
    SessionRegistry& sessions() { return sessions_; }
    TransferCoordinator& transfers() { return transfers_; }
    PersistenceGateway& gateway() { return *gateway_; }

private:
    void bind(const std::shared_ptr<Connection>& connection, const std::string& username);
    void end_session(const std::string& username);

    std::unique_ptr<PersistenceGateway> gateway_;
    PasswordAuthenticator auth_;
    UserStore users_;
    SessionRegistry sessions_;
    TransferCoordinator transfers_;
    std::optional<nlohmann::json> users_snapshot_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> session_started_;
};
