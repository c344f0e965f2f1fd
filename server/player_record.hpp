// player_record.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Currency {
    int64_t gold = 0;
    int64_t silver = 0;
    int64_t copper = 0;
};

struct Inventory {
    std::vector<std::string> items; // item instance ids
    Currency currency;
};

// Either a hash+salt pair or, for accounts created before hashing, the plain
// password awaiting migration on next login.
struct Credential {
    std::string password_hash;
    std::string salt;
    std::optional<std::string> legacy_password;

    bool needs_migration() const { return legacy_password.has_value(); }
};

struct AdminMessage {
    std::string message;
    std::string timestamp;
};

struct PlayerRecord {
    std::string username;
    Credential credential;

    int64_t health = 100;
    int64_t max_health = 100;
    int64_t mana = 100;
    int64_t max_mana = 100;
    int64_t experience = 0;
    int64_t level = 1;

    int64_t strength = 10;
    int64_t dexterity = 10;
    int64_t agility = 10;
    int64_t constitution = 10;
    int64_t wisdom = 10;
    int64_t intelligence = 10;
    int64_t charisma = 10;

    std::map<std::string, std::string> equipment; // slot -> item instance id
    std::vector<std::string> flags;
    Inventory inventory;
    Currency bank;
    std::string current_room_id = "start";

    bool in_combat = false;
    bool is_unconscious = false;
    bool is_resting = false;
    bool is_meditating = false;

    TimePoint join_date;
    TimePoint last_login;
    int64_t total_play_time = 0; // seconds

    std::optional<std::string> email;
    std::optional<std::string> description;
    std::vector<AdminMessage> pending_admin_messages;

    // Keys from the flat file this server does not model; written back untouched.
    nlohmann::json extra = nlohmann::json::object();

    void clamp_mana();
};

// Partial update. Unset members leave the record alone; flags replace wholesale.
struct PlayerPatch {
    std::optional<int64_t> health;
    std::optional<int64_t> max_health;
    std::optional<int64_t> mana;
    std::optional<int64_t> max_mana;
    std::optional<int64_t> experience;
    std::optional<int64_t> level;
    std::optional<int64_t> strength;
    std::optional<int64_t> dexterity;
    std::optional<int64_t> agility;
    std::optional<int64_t> constitution;
    std::optional<int64_t> wisdom;
    std::optional<int64_t> intelligence;
    std::optional<int64_t> charisma;
    std::optional<std::map<std::string, std::string>> equipment;
    std::optional<std::vector<std::string>> flags;
    std::optional<Currency> bank;
    std::optional<std::string> current_room_id;
    std::optional<bool> in_combat;
    std::optional<bool> is_unconscious;
    std::optional<bool> is_resting;
    std::optional<bool> is_meditating;
    std::optional<TimePoint> last_login;
    std::optional<std::string> email;
    std::optional<std::string> description;

    void apply_to(PlayerRecord& record) const;
};

// Lowercases ASCII letters. Does not validate.
std::string normalize_username(const std::string& username);

// 3 to 12 ASCII letters, checked after normalization.
bool is_valid_username(const std::string& username);

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.123Z
std::string format_iso8601(TimePoint tp);
std::optional<TimePoint> parse_iso8601(const std::string& text);

void to_json(nlohmann::json& j, const Currency& c);
void from_json(const nlohmann::json& j, Currency& c);
void to_json(nlohmann::json& j, const AdminMessage& m);
void from_json(const nlohmann::json& j, AdminMessage& m);

// Flat file layout. from_json backfills defaults for anything missing, so it
// accepts partial records; the username is normalized but not validated.
void to_json(nlohmann::json& j, const PlayerRecord& r);
void from_json(const nlohmann::json& j, PlayerRecord& r);
