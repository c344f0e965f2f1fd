// config.cpp
#include "config.hpp"
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

bool parse_flag(const std::string& value) {
    std::string s(value);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

long long parse_number(const char* setting, const std::string& value, long long min, long long max) {
    long long n = 0;
    try {
        size_t used = 0;
        n = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument("trailing characters");
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(setting) + ": not a number: " + value);
    }
    if (n < min || n > max) throw std::invalid_argument(std::string(setting) + ": out of range: " + value);
    return n;
}

} // namespace

std::string ServerConfig::users_file() const {
    return (fs::path(data_dir) / "users.json").string();
}

std::string ServerConfig::database_file() const {
    if (!db_path.empty()) return db_path;
    return (fs::path(data_dir) / "mud.db").string();
}

ServerConfig load_config(int argc, char** argv) {
    ServerConfig cfg;

    if (auto v = env("PORT")) cfg.port = static_cast<unsigned short>(parse_number("PORT", *v, 1, 65535));
    if (auto v = env("STORAGE_BACKEND")) {
        auto backend = parse_storage_backend(*v);
        if (!backend) throw std::invalid_argument("STORAGE_BACKEND: expected file, database or auto, got " + *v);
        cfg.storage = *backend;
    }
    if (auto v = env("DATA_DIR")) cfg.data_dir = *v;
    if (auto v = env("DB_PATH")) cfg.db_path = *v;
    if (auto v = env("USERS_JSON")) cfg.users_json = *v;
    if (auto v = env("TEST_MODE")) cfg.test_mode = parse_flag(*v);
    if (auto v = env("TRANSFER_GRACE_MS")) {
        cfg.transfer_grace = std::chrono::milliseconds(parse_number("TRANSFER_GRACE_MS", *v, 0, 3600 * 1000));
    }
    if (auto v = env("PBKDF2_ITERATIONS")) {
        cfg.pbkdf2_iterations = static_cast<int>(parse_number("PBKDF2_ITERATIONS", *v, 1, 10000000));
    }

    if (auto v = env("LOG_FILE")) cfg.log_file = *v;
    if (auto v = env("LOG_LEVEL")) {
        auto level = parse_log_level(*v);
        if (!level) throw std::invalid_argument("LOG_LEVEL: expected debug, info, warn or error, got " + *v);
        cfg.log_level = *level;
    }
    if (auto v = env("LOG_MAX_SIZE")) {
        cfg.log_max_size = static_cast<std::uint64_t>(parse_number("LOG_MAX_SIZE", *v, 1024, 1ll << 40));
    }
    if (auto v = env("LOG_ROTATE_COUNT")) cfg.log_rotate_count = static_cast<int>(parse_number("LOG_ROTATE_COUNT", *v, 0, 100));

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg.rfind("--users=", 0) == 0) {
            cfg.users_json = arg.substr(8);
        } else if (arg == "--test-mode") {
            cfg.test_mode = true;
        } else if (!arg.empty() && arg[0] != '-') {
            cfg.port = static_cast<unsigned short>(parse_number("port", arg, 1, 65535));
        } else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return cfg;
}
