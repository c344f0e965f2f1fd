// connection.hpp
#pragma once
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include "player_record.hpp"

enum class ClientState {
    Connecting,
    Login,
    LoginPassword,
    Signup,
    SignupPassword,
    Authenticated,
    TransferRequest,
    WaitingForTransfer,
    Closed,
};

const char* to_string(ClientState state);

class Connection;

// Messages the transfer handshake sends to a connection's own state machine.
// The connection drains them from its mailbox whenever its I/O loop runs.
struct TransferSignal {
    enum class Kind {
        DecisionRequested,   // to the bound connection: another login wants this identity
        AwaitingDecision,    // to the requester: hold until the bound connection answers
        Approved,            // to the requester: the identity is now yours
        Denied,              // to the requester: go back to the login prompt
        Cancelled,           // to the requester: handshake abandoned, back to login
        Restored,            // to the bound connection: request withdrawn, resume `resume_state`
        Superseded,          // to the bound connection: you approved, teardown is scheduled
    };

    Kind kind;
    std::string username;
    std::weak_ptr<Connection> counterpart;
    std::optional<ClientState> resume_state;
};

const char* to_string(TransferSignal::Kind kind);

// Handshake markers kept on each side while a transfer is in flight.
struct TransferContext {
    std::optional<ClientState> previous_state;
    bool waiting_for_transfer = false;
    std::string transfer_username;
    std::weak_ptr<Connection> transfer_client;
    bool is_session_transfer = false;
    bool transfer_in_progress = false;
    std::optional<ClientState> return_to_state;
    std::optional<std::string> interrupted_by;  // id of the requesting connection

    void clear_interrupt() {
        transfer_client.reset();
        interrupted_by.reset();
        return_to_state.reset();
    }
};

// One live client endpoint. Transports derive from it and supply write/end.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    explicit Connection(std::string id);
    virtual ~Connection() = default;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // An empty write carries no text but makes the I/O loop drain the mailbox.
    virtual void write(const std::string& text) = 0;
    // Idempotent.
    virtual void end() = 0;

    const std::string& id() const { return id_; }

    ClientState state() const { return state_; }
    void set_state(ClientState state) { state_ = state; }

    bool authenticated() const { return authenticated_; }
    void set_authenticated(bool value) { authenticated_ = value; }

    // The connection's own copy of its player record, never shared with the store.
    PlayerRecord* record() { return record_ ? &*record_ : nullptr; }
    const PlayerRecord* record() const { return record_ ? &*record_ : nullptr; }
    void attach_record(PlayerRecord record) { record_ = std::move(record); }
    void detach_record() { record_.reset(); }

    TransferContext& transfer_context() { return transfer_; }
    const TransferContext& transfer_context() const { return transfer_; }

    void post_signal(TransferSignal signal);
    std::optional<TransferSignal> take_signal();
    bool has_signals() const { return !mailbox_.empty(); }

private:
    std::string id_;
    ClientState state_;
    bool authenticated_;
    std::optional<PlayerRecord> record_;
    TransferContext transfer_;
    std::deque<TransferSignal> mailbox_;
};
