// transfer_coordinator.hpp
#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include "connection.hpp"

class UserStore;
class SessionRegistry;
class CombatCollaborator;

// Hands an identity from its bound connection to a second login.
//
// Per username:  NONE -> ACTIVE -> TRANSFER_PENDING -> ACTIVE (new or original)
//
// The bound connection cannot be pre-empted, so the request is posted to its
// mailbox and the decision comes back later through resolve_transfer(). Every
// path ends by clearing the pending slot.
class TransferCoordinator {
public:
    static constexpr std::chrono::milliseconds kDefaultGraceDelay{7000};

    TransferCoordinator(boost::asio::io_context& ioc,
                        UserStore& users,
                        SessionRegistry& sessions,
                        CombatCollaborator& combat,
                        std::chrono::milliseconds grace_delay = kDefaultGraceDelay);

    // False, with nothing recorded, when the identity has no live session or
    // already has a transfer pending.
    bool request_transfer(const std::string& username, const std::shared_ptr<Connection>& requester);

    // No-op when there is no matching pending transfer and session.
    void resolve_transfer(const std::string& username, bool approved);

    // Withdraws a pending request, e.g. when the requester disconnects first.
    void cancel_transfer(const std::string& username);

    std::chrono::milliseconds grace_delay() const { return grace_delay_; }
    std::size_t teardowns_scheduled() const { return *teardowns_in_flight_; }

private:
    void approve(const std::string& username,
                 const std::shared_ptr<Connection>& existing,
                 const std::shared_ptr<Connection>& requester);
    void restore_original(const std::shared_ptr<Connection>& existing, const char* notice);
    void send_back_to_login(const std::shared_ptr<Connection>& requester,
                            const std::string& username,
                            TransferSignal::Kind why,
                            const char* notice);
    void schedule_teardown(const std::string& username, std::shared_ptr<Connection> old_connection);

    boost::asio::io_context& ioc_;
    UserStore& users_;
    SessionRegistry& sessions_;
    CombatCollaborator& combat_;
    std::chrono::milliseconds grace_delay_;
    std::shared_ptr<std::size_t> teardowns_in_flight_;
};
