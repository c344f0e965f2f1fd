// session.hpp
#pragma once
#include <memory>
#include <boost/asio.hpp>
#include <deque>
#include <string>
#include "connection.hpp"

class Server; // forward

// One telnet-style client. Reads CR/LF terminated lines and drives the
// login, signup and transfer prompts through the identity service.
class ClientSession : public Connection {
public:
    ClientSession(boost::asio::ip::tcp::socket socket, Server& server, std::string id);
    void start();

    void write(const std::string& text) override;
    void end() override;

private:
    std::shared_ptr<ClientSession> self();

    void do_read_line();
    void process_line(const std::string& line);
    void handle_login(const std::string& line);
    void handle_login_password(const std::string& line);
    void handle_signup(const std::string& line);
    void handle_signup_password(const std::string& line);
    void handle_command(const std::string& line);
    void handle_transfer_answer(const std::string& line);

    void drain_signals();
    void on_signal(const TransferSignal& signal);
    void prompt();

    void deliver(std::string text);
    void do_write();
    void close_socket();
    void report_disconnect(const std::string& why);

    boost::asio::ip::tcp::socket socket_;
    Server& server_;
    boost::asio::streambuf input_buffer_;
    std::deque<std::string> outgoing_queue_;
    std::string pending_username_;
    bool closing_ = false;
    bool disconnect_reported_ = false;
};
