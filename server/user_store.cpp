// user_store.cpp
#include "user_store.hpp"
#include "logger.hpp"
#include "password_authenticator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

UserStore::UserStore(PersistenceGateway& gateway, const PasswordAuthenticator& auth)
    : gateway_(gateway), auth_(auth) {
}

void UserStore::load(const std::optional<json>& snapshot) {
    if (snapshot) {
        if (load_prevalidated(*snapshot)) return;
        Logger::instance().error("Failed to load users from snapshot, using configured storage");
    }

    LoadResult loaded = gateway_.load();
    if (loaded.records.empty()) {
        users_.clear();
        Logger::instance().info("Starting with no users");
        return;
    }
    if (!load_records(std::move(loaded.records))) {
        Logger::instance().error("Stored users rejected, starting empty");
    }
}

bool UserStore::load_prevalidated(const json& users) {
    if (!users.is_array()) {
        Logger::instance().warn("Bulk load rejected - user data must be an array");
        return false;
    }
    std::vector<PlayerRecord> records;
    records.reserve(users.size());
    try {
        for (const auto& entry : users) {
            if (!entry.is_object()) {
                Logger::instance().warn("Bulk load rejected - non-object entry");
                return false;
            }
            records.push_back(entry.get<PlayerRecord>());
        }
    } catch (const json::exception& ex) {
        Logger::instance().warn("Bulk load rejected - bad field", { {"what", ex.what()} });
        return false;
    }
    return load_records(std::move(records));
}

bool UserStore::load_records(std::vector<PlayerRecord> records) {
    Logger::instance().info("Loading users", { {"count", static_cast<uint64_t>(records.size())} });

    std::map<std::string, PlayerRecord> staged;
    std::size_t migrated = 0;
    for (auto& record : records) {
        record.username = normalize_username(record.username);
        if (!is_valid_username(record.username)) {
            Logger::instance().warn("Bulk load rejected - invalid username", { {"username", record.username} });
            return false;
        }
        if (staged.count(record.username)) {
            Logger::instance().warn("Bulk load rejected - duplicate username", { {"username", record.username} });
            return false;
        }
        record.clamp_mana();
        if (auth_.migrate(record)) ++migrated;
        std::string key = record.username;
        staged.emplace(std::move(key), std::move(record));
    }

    users_.swap(staged);
    if (migrated > 0) {
        Logger::instance().info("Migrated legacy passwords", { {"count", static_cast<uint64_t>(migrated)} });
    }
    save();
    Logger::instance().info("Users loaded", { {"total_users", static_cast<uint64_t>(users_.size())} });
    return true;
}

PlayerRecord* UserStore::get_user(const std::string& username) {
    auto it = users_.find(normalize_username(username));
    return it == users_.end() ? nullptr : &it->second;
}

const PlayerRecord* UserStore::get_user(const std::string& username) const {
    auto it = users_.find(normalize_username(username));
    return it == users_.end() ? nullptr : &it->second;
}

bool UserStore::user_exists(const std::string& username) const {
    return users_.count(normalize_username(username)) > 0;
}

std::vector<PlayerRecord> UserStore::all_users() const {
    std::vector<PlayerRecord> out;
    out.reserve(users_.size());
    for (const auto& kv : users_) out.push_back(kv.second);
    return out;
}

bool UserStore::create_user(const std::string& username, const std::string& password) {
    const std::string name = normalize_username(username);
    if (!is_valid_username(name)) {
        Logger::instance().warn("Register failed - invalid username", { {"username", name} });
        return false;
    }
    if (users_.count(name)) {
        Logger::instance().warn("Register failed - exists", { {"username", name} });
        return false;
    }
    // do NOT log the password
    if (password.empty()) {
        Logger::instance().warn("Register failed - empty password", { {"username", name} });
        return false;
    }

    PlayerRecord record;
    record.username = name;
    HashedPassword hashed = auth_.hash(password);
    record.credential.password_hash = std::move(hashed.hash);
    record.credential.salt = std::move(hashed.salt);
    record.join_date = Clock::now();
    record.last_login = record.join_date;

    users_.emplace(name, std::move(record));
    save();
    Logger::instance().info("User registered", { {"username", name}, {"total_users", static_cast<uint64_t>(users_.size())} });
    return true;
}

bool UserStore::authenticate(const std::string& username, const std::string& password) {
    PlayerRecord* record = get_user(username);
    if (!record) {
        Logger::instance().warn("Login failed - no such user", { {"username", normalize_username(username)} });
        return false;
    }

    bool migrated = false;
    bool ok = auth_.authenticate(*record, password, migrated);
    if (migrated) {
        Logger::instance().info("Migrated legacy password", { {"username", record->username} });
        save();
    }
    Logger::instance().info("Login attempt", { {"username", record->username}, {"ok", ok} });
    return ok;
}

bool UserStore::change_password(const std::string& username, const std::string& new_password) {
    PlayerRecord* record = get_user(username);
    if (!record) return false;

    HashedPassword hashed = auth_.hash(new_password);
    record->credential.password_hash = std::move(hashed.hash);
    record->credential.salt = std::move(hashed.salt);
    record->credential.legacy_password.reset();
    save();
    return true;
}

bool UserStore::update_user_stats(const std::string& username, const PlayerPatch& patch) {
    PlayerRecord* record = get_user(username);
    if (!record) return false;

    patch.apply_to(*record);
    save();
    return true;
}

bool UserStore::update_inventory(const std::string& username, const Inventory& inventory) {
    PlayerRecord* record = get_user(username);
    if (!record) return false;

    record->inventory = inventory;
    save();
    return true;
}

bool UserStore::update_last_login(const std::string& username) {
    PlayerRecord* record = get_user(username);
    if (!record) return false;

    record->last_login = Clock::now();
    save();
    return true;
}

bool UserStore::add_play_time(const std::string& username, int64_t seconds) {
    PlayerRecord* record = get_user(username);
    if (!record) return false;
    if (seconds < 0) seconds = 0;

    record->total_play_time += seconds;
    save();
    return true;
}

bool UserStore::delete_user(const std::string& username) {
    auto it = users_.find(normalize_username(username));
    if (it == users_.end()) return false;

    const std::string name = it->first;
    Logger::instance().info("User deleted", { {"username", name} });
    users_.erase(it);
    gateway_.remove(name);
    save();
    return true;
}

bool UserStore::add_flag(const std::string& username, const std::string& flag) {
    PlayerRecord* record = get_user(username);
    if (!record) {
        Logger::instance().error("Cannot add flag: user not found", { {"username", username} });
        return false;
    }
    if (std::find(record->flags.begin(), record->flags.end(), flag) != record->flags.end()) {
        Logger::instance().info("Flag already set", { {"username", record->username}, {"flag", flag} });
        return false;
    }
    record->flags.push_back(flag);
    save();
    Logger::instance().info("Flag added", { {"username", record->username}, {"flag", flag} });
    return true;
}

bool UserStore::remove_flag(const std::string& username, const std::string& flag) {
    PlayerRecord* record = get_user(username);
    if (!record) {
        Logger::instance().error("Cannot remove flag: user not found", { {"username", username} });
        return false;
    }
    auto new_end = std::remove(record->flags.begin(), record->flags.end(), flag);
    if (new_end == record->flags.end()) {
        Logger::instance().info("Flag not present", { {"username", record->username}, {"flag", flag} });
        return false;
    }
    record->flags.erase(new_end, record->flags.end());
    save();
    Logger::instance().info("Flag removed", { {"username", record->username}, {"flag", flag} });
    return true;
}

bool UserStore::has_flag(const std::string& username, const std::string& flag) const {
    const PlayerRecord* record = get_user(username);
    if (!record) return false;
    return std::find(record->flags.begin(), record->flags.end(), flag) != record->flags.end();
}

std::optional<std::vector<std::string>> UserStore::get_flags(const std::string& username) const {
    const PlayerRecord* record = get_user(username);
    if (!record) return std::nullopt;
    return record->flags;
}

SaveTicket UserStore::save() {
    return gateway_.save(all_users());
}

void UserStore::load_from_path(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in.is_open()) throw std::runtime_error("User data file not found: " + file_path);

    json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded()) throw std::runtime_error("User data file is not valid JSON: " + file_path);
    if (!load_prevalidated(doc)) throw std::runtime_error("User data rejected: " + file_path);

    Logger::instance().info("Loaded users from path", { {"path", file_path}, {"count", static_cast<uint64_t>(users_.size())} });
}

std::size_t UserStore::save_to_path(const std::string& file_path) const {
    fs::path target(file_path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw std::runtime_error("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(target, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot open " + file_path + " for writing");
    json doc = all_users();
    out << doc.dump(2);
    if (!out) throw std::runtime_error("write to " + file_path + " failed");

    Logger::instance().info("Saved users to path", { {"path", file_path}, {"count", static_cast<uint64_t>(users_.size())} });
    return users_.size();
}
