// main.cpp
#include <boost/asio.hpp>
#include <csignal>
#include <memory>
#include <nlohmann/json.hpp>
#include "combat_collaborator.hpp"
#include "config.hpp"
#include "identity_service.hpp"
#include "json_file_backend.hpp"
#include "logger.hpp"
#include "persistence_gateway.hpp"
#include "server.hpp"
#include "sqlite_backend.hpp"

static std::unique_ptr<PersistenceGateway> make_gateway(const ServerConfig& cfg) {
    std::unique_ptr<FlatFileBackend> file;
    std::unique_ptr<RelationalBackend> relational;

    if (cfg.storage != StorageBackend::Database) {
        file = std::make_unique<JsonFileBackend>(cfg.users_file());
    }
    if (cfg.storage != StorageBackend::File) {
        try {
            relational = std::make_unique<SqliteBackend>(cfg.database_file());
        } catch (const std::exception& ex) {
            // The gateway logs the missing backend on every load/save and, in auto mode, uses the file.
            Logger::instance().error("Database open failed", { {"path", cfg.database_file()}, {"what", ex.what()} });
        }
    }
    return std::make_unique<PersistenceGateway>(cfg.storage, std::move(file), std::move(relational));
}

int main(int argc, char** argv) {
    try {
        ServerConfig cfg = load_config(argc, argv);

        Logger::instance().init(cfg.log_file, cfg.log_level, cfg.log_max_size, cfg.log_rotate_count);
        Logger::instance().info("Logger initialized");

        boost::asio::io_context ioc;

        IdentityOptions options;
        options.pbkdf2_iterations = cfg.pbkdf2_iterations;
        options.grace_delay = cfg.transfer_grace;
        options.test_mode = cfg.test_mode;
        if (cfg.users_json) options.users_snapshot.emplace(nlohmann::json::parse(*cfg.users_json));

        RecordFlagCombat combat;
        IdentityService identity(ioc, make_gateway(cfg), combat, std::move(options));
        identity.start();
        Logger::instance().info("Players loaded", {
            {"count", static_cast<uint64_t>(identity.users().size())},
            {"backend", to_string(cfg.storage)},
            {"test_mode", cfg.test_mode} });

        Server server(ioc, cfg.port, identity);
        server.run_accept();

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            Logger::instance().info("Shutdown signal received", { {"signal", signo} });
            server.stop();
            identity.shutdown();
            ioc.stop();
        });

        // One thread: the store, registry and transfer handshake are not locked.
        Logger::instance().info("Server listening", { {"port", cfg.port} });
        ioc.run();
        Logger::instance().info("Main function end, process about to exit.");

    } catch (const std::exception& ex) {
        Logger::instance().error("Main thread exception caught", {{"what", ex.what()}});
        return 1;
    }

    return 0;
}
