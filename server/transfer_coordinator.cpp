// transfer_coordinator.cpp
#include "transfer_coordinator.hpp"
#include "combat_collaborator.hpp"
#include "logger.hpp"
#include "session_registry.hpp"
#include "user_store.hpp"
#include <boost/asio/steady_timer.hpp>

namespace asio = boost::asio;

TransferCoordinator::TransferCoordinator(asio::io_context& ioc,
                                         UserStore& users,
                                         SessionRegistry& sessions,
                                         CombatCollaborator& combat,
                                         std::chrono::milliseconds grace_delay)
    : ioc_(ioc),
      users_(users),
      sessions_(sessions),
      combat_(combat),
      grace_delay_(grace_delay),
      teardowns_in_flight_(std::make_shared<std::size_t>(0)) {
}

bool TransferCoordinator::request_transfer(const std::string& username, const std::shared_ptr<Connection>& requester) {
    const std::string name = normalize_username(username);
    std::shared_ptr<Connection> existing = sessions_.active_session(name);
    if (!existing) return false;

    if (sessions_.has_pending(name)) {
        // A second requester must not silently replace the first one's slot.
        Logger::instance().warn("Transfer request rejected - another transfer pending", {
            {"username", name}, {"requester", requester->id()} });
        return false;
    }
    if (!sessions_.set_pending(name, requester)) return false;

    TransferContext& incoming = requester->transfer_context();
    incoming.previous_state = requester->state();
    incoming.waiting_for_transfer = true;
    incoming.transfer_username = name;
    requester->set_state(ClientState::WaitingForTransfer);
    requester->post_signal({ TransferSignal::Kind::AwaitingDecision, name, existing, std::nullopt });

    TransferContext& bound = existing->transfer_context();
    bound.transfer_client = requester;
    bound.interrupted_by = requester->id();
    bound.return_to_state = existing->state() == ClientState::TransferRequest
        ? ClientState::Authenticated
        : existing->state();
    existing->post_signal({ TransferSignal::Kind::DecisionRequested, name, requester, std::nullopt });
    // Nothing to print; the write only wakes the I/O loop so it reads the mailbox.
    existing->write("");

    Logger::instance().info("Session transfer requested", {
        {"username", name}, {"existing", existing->id()}, {"requester", requester->id()} });
    Logger::instance().player(name, "Session transfer requested from " + requester->id());
    return true;
}

void TransferCoordinator::resolve_transfer(const std::string& username, bool approved) {
    const std::string name = normalize_username(username);
    std::shared_ptr<Connection> requester = sessions_.pending_transfer(name);
    std::shared_ptr<Connection> existing = sessions_.active_session(name);
    if (!requester || !existing) {
        Logger::instance().debug("Transfer resolution ignored - nothing pending", { {"username", name}, {"approved", approved} });
        return;
    }

    if (approved) {
        approve(name, existing, requester);
    } else {
        send_back_to_login(requester, name, TransferSignal::Kind::Denied,
                           "\r\n\r\nSession transfer was denied by the active user.\r\n");
        restore_original(existing, "\r\n\r\nYou denied the session transfer. Continuing your session.\r\n");
        Logger::instance().info("Session transfer denied", { {"username", name} });
        Logger::instance().player(name, "Denied session transfer to " + requester->id());
    }

    sessions_.clear_pending(name);
}

void TransferCoordinator::cancel_transfer(const std::string& username) {
    const std::string name = normalize_username(username);
    std::shared_ptr<Connection> requester = sessions_.pending_transfer(name);
    std::shared_ptr<Connection> existing = sessions_.active_session(name);

    if (requester) {
        send_back_to_login(requester, name, TransferSignal::Kind::Cancelled,
                           "\r\n\r\nSession transfer was cancelled.\r\n");
    }
    if (existing && existing->transfer_context().interrupted_by) {
        restore_original(existing, "\r\n\r\nTransfer request cancelled.\r\n");
    }
    if (requester || existing) {
        Logger::instance().info("Session transfer cancelled", { {"username", name} });
    }

    sessions_.clear_pending(name);
}

void TransferCoordinator::approve(const std::string& name,
                                  const std::shared_ptr<Connection>& existing,
                                  const std::shared_ptr<Connection>& requester) {
    const PlayerRecord* canonical = users_.get_user(name);
    if (!canonical) {
        // Deleted mid-handshake. Keep the original binding rather than leave nobody bound.
        Logger::instance().error("Transfer approval without a player record", { {"username", name} });
        send_back_to_login(requester, name, TransferSignal::Kind::Cancelled,
                           "\r\n\r\nSession transfer could not be completed.\r\n");
        restore_original(existing, "\r\n\r\nSession transfer could not be completed.\r\n");
        return;
    }

    existing->write("\r\n\r\nYou approved the session transfer. Disconnecting...\r\n");
    existing->transfer_context().transfer_in_progress = true;
    // Terminal from here on: input during the grace delay must not log the old connection in again.
    existing->set_state(ClientState::Closed);
    requester->transfer_context().is_session_transfer = true;

    // Read before anything below can touch the flag.
    const bool in_combat = canonical->in_combat || combat_.is_in_combat(*existing);
    Logger::instance().info("Transferring session", { {"username", name}, {"in_combat", in_combat} });

    requester->attach_record(*canonical);
    requester->set_authenticated(true);
    requester->set_state(ClientState::Authenticated);
    requester->transfer_context().waiting_for_transfer = false;

    sessions_.register_session(name, requester);

    if (in_combat) {
        requester->record()->in_combat = true;
        PlayerPatch patch;
        patch.in_combat = true;
        users_.update_user_stats(name, patch);
        try {
            combat_.handle_session_transfer(*existing, *requester);
        } catch (const std::exception& ex) {
            Logger::instance().error("Error transferring combat state", { {"username", name}, {"what", ex.what()} });
        }
    }

    users_.update_last_login(name);

    requester->write("\r\n\r\nSession transfer approved. Logging in...\r\n");
    requester->post_signal({ TransferSignal::Kind::Approved, name, existing, ClientState::Authenticated });
    existing->post_signal({ TransferSignal::Kind::Superseded, name, requester, std::nullopt });
    existing->write("");

    Logger::instance().player(name, "Session transferred to " + requester->id());
    schedule_teardown(name, existing);
}

void TransferCoordinator::restore_original(const std::shared_ptr<Connection>& existing, const char* notice) {
    TransferContext& ctx = existing->transfer_context();
    ClientState resume = ctx.return_to_state.value_or(ClientState::Authenticated);
    existing->set_state(resume);
    ctx.clear_interrupt();
    existing->post_signal({ TransferSignal::Kind::Restored, "", {}, resume });
    existing->write(notice);
}

void TransferCoordinator::send_back_to_login(const std::shared_ptr<Connection>& requester,
                                             const std::string& username,
                                             TransferSignal::Kind why,
                                             const char* notice) {
    TransferContext& ctx = requester->transfer_context();
    ctx.waiting_for_transfer = false;
    ctx.transfer_username.clear();
    requester->set_state(ClientState::Login);
    requester->write(notice);
    requester->post_signal({ why, username, {}, ClientState::Login });
}

// Deferred so anything that captured the old connection earlier in this turn
// can still use it. Only io_context shutdown cancels the timer.
void TransferCoordinator::schedule_teardown(const std::string& username, std::shared_ptr<Connection> old_connection) {
    auto timer = std::make_shared<asio::steady_timer>(ioc_, grace_delay_);
    auto in_flight = teardowns_in_flight_;
    ++*in_flight;

    timer->async_wait([timer, in_flight, username, old_connection](const boost::system::error_code& ec) {
        --*in_flight;
        if (ec == asio::error::operation_aborted) return;

        Logger::instance().info("Disconnecting old client after transfer", { {"username", username}, {"connection", old_connection->id()} });
        old_connection->set_authenticated(false);
        old_connection->detach_record();
        old_connection->set_state(ClientState::Closed);
        old_connection->end();
    });
}
