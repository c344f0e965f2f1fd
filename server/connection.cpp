// connection.cpp
#include "connection.hpp"

const char* to_string(ClientState state) {
    switch (state) {
        case ClientState::Connecting: return "connecting";
        case ClientState::Login: return "login";
        case ClientState::LoginPassword: return "login_password";
        case ClientState::Signup: return "signup";
        case ClientState::SignupPassword: return "signup_password";
        case ClientState::Authenticated: return "authenticated";
        case ClientState::TransferRequest: return "transfer_request";
        case ClientState::WaitingForTransfer: return "waiting_for_transfer";
        case ClientState::Closed: return "closed";
    }
    return "unknown";
}

const char* to_string(TransferSignal::Kind kind) {
    switch (kind) {
        case TransferSignal::Kind::DecisionRequested: return "decision_requested";
        case TransferSignal::Kind::AwaitingDecision: return "awaiting_decision";
        case TransferSignal::Kind::Approved: return "approved";
        case TransferSignal::Kind::Denied: return "denied";
        case TransferSignal::Kind::Cancelled: return "cancelled";
        case TransferSignal::Kind::Restored: return "restored";
        case TransferSignal::Kind::Superseded: return "superseded";
    }
    return "unknown";
}

Connection::Connection(std::string id)
    : id_(std::move(id)),
      state_(ClientState::Connecting),
      authenticated_(false) {
}

void Connection::post_signal(TransferSignal signal) {
    mailbox_.push_back(std::move(signal));
}

std::optional<TransferSignal> Connection::take_signal() {
    if (mailbox_.empty()) return std::nullopt;
    TransferSignal next = std::move(mailbox_.front());
    mailbox_.pop_front();
    return next;
}
