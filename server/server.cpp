// server.cpp
#include "server.hpp"
#include "session.hpp"
#include "identity_service.hpp"
#include "logger.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

Server::Server(asio::io_context& ioc, unsigned short port, IdentityService& identity)
    : acceptor_(ioc, tcp::endpoint(tcp::v4(), port)), ioc_(ioc), identity_(identity) {
    Logger::instance().info("Server constructed", { {"port", port} });
}

unsigned short Server::port() const {
    return acceptor_.local_endpoint().port();
}

void Server::run_accept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) return;
        if (!ec) {
            boost::system::error_code ep_ec;
            auto remote = socket.remote_endpoint(ep_ec);
            std::string id = "conn-" + std::to_string(++next_connection_id_);
            if (!ep_ec) id += "@" + remote.address().to_string() + ":" + std::to_string(remote.port());

            auto s = std::make_shared<ClientSession>(std::move(socket), *this, id);
            Logger::instance().info("New connection accepted", { {"connection", id} });
            s->start();
        } else {
            Logger::instance().error("Accept error", { {"what", ec.message()}, {"value", ec.value()} });
        }
        if (acceptor_.is_open()) run_accept();
    });
}

void Server::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) Logger::instance().warn("Acceptor close failed", { {"what", ec.message()} });
    Logger::instance().info("Server stopped accepting", { {"online_count", static_cast<uint64_t>(identity_.sessions().active_count())} });
}

void Server::on_disconnect(std::shared_ptr<ClientSession> sess) {
    identity_.handle_disconnect(sess);
    Logger::instance().info("Client disconnected", {
        {"connection", sess->id()},
        {"online_count", static_cast<uint64_t>(identity_.sessions().active_count())} });
}
