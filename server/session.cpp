// session.cpp
#include "session.hpp"
#include "server.hpp"
#include "identity_service.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <vector>

namespace asio = boost::asio;

static constexpr std::size_t kMaxLineLength = 1024;

static std::string preview_text(const std::string& s, size_t maxlen = 80) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

// Drops the CR of CRLF, telnet negotiation bytes and surrounding blanks.
static std::string clean_line(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c >= 0x20 && c < 0x7f) out.push_back(static_cast<char>(c));
    }
    auto first = out.find_first_not_of(' ');
    if (first == std::string::npos) return "";
    auto last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ClientSession::ClientSession(asio::ip::tcp::socket socket, Server& server, std::string id)
    : Connection(std::move(id)), socket_(std::move(socket)), server_(server), input_buffer_(kMaxLineLength) {
    Logger::instance().debug("Session constructed", { {"connection", this->id()} });
}

std::shared_ptr<ClientSession> ClientSession::self() {
    return std::static_pointer_cast<ClientSession>(shared_from_this());
}

void ClientSession::start() {
    Logger::instance().info("Session start", { {"connection", id()} });
    set_state(ClientState::Login);
    deliver("Welcome to the realm.\r\n");
    prompt();
    do_read_line();
}

void ClientSession::do_read_line() {
    auto self = this->self();
    asio::async_read_until(socket_, input_buffer_, '\n', [this, self](boost::system::error_code ec, std::size_t) {
        if (ec) {
            report_disconnect(ec.message());
            return;
        }
        std::istream in(&input_buffer_);
        std::string raw;
        std::getline(in, raw);
        process_line(clean_line(raw));
        // Keep reading while Closed so a superseded client's hang-up is still reported.
        if (socket_.is_open()) do_read_line();
    });
}

void ClientSession::process_line(const std::string& line) {
    drain_signals();

    switch (state()) {
        case ClientState::Connecting:
        case ClientState::Login:             handle_login(line); break;
        case ClientState::LoginPassword:     handle_login_password(line); break;
        case ClientState::Signup:            handle_signup(line); break;
        case ClientState::SignupPassword:    handle_signup_password(line); break;
        case ClientState::Authenticated:     handle_command(line); break;
        case ClientState::TransferRequest:   handle_transfer_answer(line); break;
        case ClientState::WaitingForTransfer:
            deliver("Still waiting for the other session to respond.\r\n");
            break;
        case ClientState::Closed:
            break;
    }

    drain_signals();
}

void ClientSession::handle_login(const std::string& line) {
    if (line.empty()) { prompt(); return; }
    if (lower(line) == "new") {
        set_state(ClientState::Signup);
        prompt();
        return;
    }
    pending_username_ = normalize_username(line);
    set_state(ClientState::LoginPassword);
    prompt();
}

void ClientSession::handle_login_password(const std::string& line) {
    const std::string username = pending_username_;
    pending_username_.clear();

    LoginResult result = server_.identity().login(self(), username, line);
    Logger::instance().debug("Login attempt", { {"connection", id()}, {"username", username}, {"result", to_string(result)} });

    switch (result) {
        case LoginResult::Authenticated:
            deliver("\r\nWelcome back, " + username + ".\r\n");
            prompt();
            break;
        case LoginResult::TransferPending:
            deliver("\r\nThat character is already playing. Asking the active session to hand it over...\r\n");
            break;
        case LoginResult::TransferBusy:
            set_state(ClientState::Login);
            deliver("\r\nThat character already has a login waiting. Try again later.\r\n");
            prompt();
            break;
        case LoginResult::InvalidCredentials:
            set_state(ClientState::Login);
            deliver("\r\nInvalid username or password.\r\n");
            prompt();
            break;
    }
}

void ClientSession::handle_signup(const std::string& line) {
    if (line.empty()) {
        set_state(ClientState::Login);
        prompt();
        return;
    }
    const std::string name = normalize_username(line);
    if (!is_valid_username(name)) {
        deliver("Names must be 3 to 12 letters.\r\n");
        prompt();
        return;
    }
    if (server_.identity().users().user_exists(name)) {
        deliver("That name is taken.\r\n");
        prompt();
        return;
    }
    pending_username_ = name;
    set_state(ClientState::SignupPassword);
    prompt();
}

void ClientSession::handle_signup_password(const std::string& line) {
    if (line.empty()) { prompt(); return; }
    const std::string username = pending_username_;
    pending_username_.clear();

    if (server_.identity().register_player(self(), username, line)) {
        deliver("\r\nWelcome, " + username + ".\r\n");
    } else {
        set_state(ClientState::Login);
        deliver("\r\nCould not create that character.\r\n");
    }
    prompt();
}

void ClientSession::handle_command(const std::string& line) {
    const std::string cmd = lower(line);
    if (cmd.empty()) {
        prompt();
    } else if (cmd == "quit") {
        server_.identity().logout(self());
        set_state(ClientState::Login);
        deliver("Goodbye.\r\n");
        end();
    } else if (cmd == "who") {
        auto sessions = server_.identity().sessions().snapshot();
        std::vector<std::string> names;
        names.reserve(sessions.size());
        for (auto& kv : sessions) names.push_back(kv.first);
        std::sort(names.begin(), names.end());
        std::string out = "Players online (" + std::to_string(names.size()) + "):\r\n";
        for (auto& n : names) out += "  " + n + "\r\n";
        deliver(out);
        prompt();
    } else {
        Logger::instance().debug("Unknown command", { {"connection", id()}, {"text_preview", preview_text(line)} });
        deliver("Unknown command.\r\n");
        prompt();
    }
}

void ClientSession::handle_transfer_answer(const std::string& line) {
    if (transfer_context().transfer_in_progress) return;
    const std::string answer = lower(line);
    std::optional<std::string> username = server_.identity().sessions().username_for(*this);
    if (!username) {
        set_state(ClientState::Login);
        prompt();
        return;
    }
    if (answer == "y" || answer == "yes") {
        server_.identity().transfers().resolve_transfer(*username, true);
    } else if (answer == "n" || answer == "no") {
        server_.identity().transfers().resolve_transfer(*username, false);
    } else {
        prompt();
    }
}

void ClientSession::drain_signals() {
    while (auto signal = take_signal()) {
        Logger::instance().debug("Transfer signal", { {"connection", id()}, {"kind", to_string(signal->kind)} });
        on_signal(*signal);
    }
}

void ClientSession::on_signal(const TransferSignal& signal) {
    switch (signal.kind) {
        case TransferSignal::Kind::DecisionRequested:
            set_state(ClientState::TransferRequest);
            deliver("\r\n\r\nSomeone is trying to log in as " + signal.username + " from another connection.\r\n"
                    "Allow the session transfer? (y/n): ");
            break;
        case TransferSignal::Kind::Approved:
            deliver("Welcome back, " + signal.username + ".\r\n");
            prompt();
            break;
        case TransferSignal::Kind::Denied:
        case TransferSignal::Kind::Cancelled:
        case TransferSignal::Kind::Restored:
            prompt();
            break;
        case TransferSignal::Kind::Superseded:
            set_state(ClientState::Closed);
            break;
        case TransferSignal::Kind::AwaitingDecision:
            break;
    }
}

void ClientSession::prompt() {
    switch (state()) {
        case ClientState::Connecting:
        case ClientState::Login:          deliver("Username (or 'new'): "); break;
        case ClientState::LoginPassword:  deliver("Password: "); break;
        case ClientState::Signup:         deliver("Choose a name: "); break;
        case ClientState::SignupPassword: deliver("Choose a password: "); break;
        case ClientState::Authenticated:  deliver("> "); break;
        case ClientState::TransferRequest: deliver("(y/n): "); break;
        case ClientState::WaitingForTransfer:
        case ClientState::Closed:
            break;
    }
}

void ClientSession::write(const std::string& text) {
    if (!text.empty()) deliver(text);
    // Signals may be posted right after this write; look at the mailbox once the current handler returns.
    auto self = this->self();
    asio::post(socket_.get_executor(), [self]() { self->drain_signals(); });
}

void ClientSession::end() {
    if (closing_) return;
    closing_ = true;
    if (outgoing_queue_.empty()) close_socket();
}

void ClientSession::deliver(std::string text) {
    if (!socket_.is_open()) return;
    bool writing = !outgoing_queue_.empty();
    outgoing_queue_.push_back(std::move(text));
    if (!writing) do_write();
}

void ClientSession::do_write() {
    auto self = this->self();
    asio::async_write(socket_, asio::buffer(outgoing_queue_.front()), [this, self](boost::system::error_code ec, std::size_t) {
        if (ec) {
            outgoing_queue_.clear();
            report_disconnect(ec.message());
            return;
        }
        outgoing_queue_.pop_front();
        if (!outgoing_queue_.empty()) do_write();
        else if (closing_) close_socket();
    });
}

void ClientSession::close_socket() {
    if (!socket_.is_open()) return;
    boost::system::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}

void ClientSession::report_disconnect(const std::string& why) {
    if (disconnect_reported_) return;
    disconnect_reported_ = true;
    Logger::instance().info("Session read/write error or disconnect", { {"connection", id()}, {"ec", why} });
    server_.on_disconnect(self());
    set_state(ClientState::Closed);
    close_socket();
}
