// user_store.hpp
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "player_record.hpp"
#include "persistence_gateway.hpp"

class PasswordAuthenticator;

// Canonical in-memory player collection, keyed by normalized username.
// Not thread-safe: owned by the io_context thread. Every mutation is
// followed by a save through the gateway.
class UserStore {
public:
    UserStore(PersistenceGateway& gateway, const PasswordAuthenticator& auth);

    // Loads through the gateway, or from `snapshot` if given (an array of
    // raw records that skips the backends entirely).
    void load(const std::optional<nlohmann::json>& snapshot = std::nullopt);

    // Replaces the whole collection. Backfills defaults, migrates legacy
    // passwords and saves. A malformed username or a duplicate rejects the
    // batch and leaves the current collection untouched.
    bool load_records(std::vector<PlayerRecord> records);
    bool load_prevalidated(const nlohmann::json& users);

    // Returned pointers stay valid until the record is deleted or the collection reloaded.
    PlayerRecord* get_user(const std::string& username);
    const PlayerRecord* get_user(const std::string& username) const;
    bool user_exists(const std::string& username) const;
    std::vector<PlayerRecord> all_users() const;
    std::size_t size() const { return users_.size(); }

    bool create_user(const std::string& username, const std::string& password);
    bool authenticate(const std::string& username, const std::string& password);
    bool change_password(const std::string& username, const std::string& new_password);

    bool update_user_stats(const std::string& username, const PlayerPatch& patch);
    bool update_inventory(const std::string& username, const Inventory& inventory);
    bool update_last_login(const std::string& username);
    bool add_play_time(const std::string& username, int64_t seconds);
    bool delete_user(const std::string& username);

    bool add_flag(const std::string& username, const std::string& flag);
    bool remove_flag(const std::string& username, const std::string& flag);
    bool has_flag(const std::string& username, const std::string& flag) const;
    std::optional<std::vector<std::string>> get_flags(const std::string& username) const;

    SaveTicket save();

    // Snapshot helpers for fixtures and admin dumps. Both throw std::runtime_error on I/O failure.
    void load_from_path(const std::string& file_path);
    std::size_t save_to_path(const std::string& file_path) const;

private:
    PersistenceGateway& gateway_;
    const PasswordAuthenticator& auth_;
    std::map<std::string, PlayerRecord> users_;
};
