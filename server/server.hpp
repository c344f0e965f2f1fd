// server.hpp
#pragma once
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>

class ClientSession;
class IdentityService;

class Server {
public:
    Server(boost::asio::io_context& ioc, unsigned short port, IdentityService& identity);
    void run_accept();
    // Stops accepting; open sessions keep running until the io_context stops.
    void stop();
    void on_disconnect(std::shared_ptr<ClientSession> sess);

    IdentityService& identity() { return identity_; }
    unsigned short port() const;

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::io_context& ioc_;
    IdentityService& identity_;
    std::uint64_t next_connection_id_ = 0;
};
