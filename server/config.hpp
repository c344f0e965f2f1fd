// config.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "logger.hpp"
#include "storage_backend.hpp"

struct ServerConfig {
    unsigned short port = 4000;
    StorageBackend storage = StorageBackend::Auto;
    std::string data_dir = "data";
    std::string db_path;                  // empty: <data_dir>/mud.db
    std::optional<std::string> users_json;
    bool test_mode = false;
    std::chrono::milliseconds transfer_grace{7000};
    int pbkdf2_iterations = 10000;

    std::string log_file = "logs/server.log";
    LogLevel log_level = LogLevel::Info;
    std::uint64_t log_max_size = 10ull * 1024 * 1024;
    int log_rotate_count = 5;

    std::string users_file() const;
    std::string database_file() const;
};

// Environment first, then argv: `[port] [--users=<json>] [--test-mode]`.
// Throws std::invalid_argument naming the offending setting.
ServerConfig load_config(int argc, char** argv);
