// player_record.cpp
#include "player_record.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {

// Keys owned by PlayerRecord. Everything else lands in PlayerRecord::extra.
const char* const kKnownKeys[] = {
    "username", "password", "passwordHash", "salt",
    "health", "maxHealth", "mana", "maxMana", "experience", "level",
    "strength", "dexterity", "agility", "constitution", "wisdom", "intelligence", "charisma",
    "equipment", "flags", "inventory", "bank", "currentRoomId",
    "inCombat", "isUnconscious", "isResting", "isMeditating",
    "joinDate", "lastLogin", "totalPlayTime",
    "email", "description", "pendingAdminMessages",
};

bool is_known_key(const std::string& key) {
    return std::find(std::begin(kKnownKeys), std::end(kKnownKeys), key) != std::end(kKnownKeys);
}

// Floats are truncated and saturate at the int64 range; NaN gives `fallback`.
int64_t to_int64(const json& v, int64_t fallback) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        return u > static_cast<uint64_t>(kMax) ? kMax : static_cast<int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<int64_t>();

    double d = v.get<double>();
    if (std::isnan(d)) return fallback;
    // 2^63 is exact as a double; anything at or past it does not fit.
    if (d >= 9223372036854775808.0) return kMax;
    if (d < -9223372036854775808.0) return kMin;
    return static_cast<int64_t>(d);
}

int64_t int_or(const json& j, const char* key, int64_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return to_int64(*it, fallback);
}

bool bool_or(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return fallback;
    return it->get<bool>();
}

// Accepts ISO strings and epoch milliseconds; anything else yields `fallback`.
TimePoint date_or(const json& j, const char* key, TimePoint fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_string()) {
        if (auto tp = parse_iso8601(it->get<std::string>())) return *tp;
        return fallback;
    }
    if (it->is_number()) {
        // Past year 9999 the clock's duration would overflow.
        constexpr int64_t kMaxEpochMs = 253402300799999;
        if (it->is_number_float() && std::isnan(it->get<double>())) return fallback;
        int64_t ms = to_int64(*it, 0);
        if (ms > kMaxEpochMs || ms < -kMaxEpochMs) return fallback;
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }
    return fallback;
}

} // namespace

void PlayerRecord::clamp_mana() {
    if (max_mana < 0) max_mana = 0;
    mana = std::clamp<int64_t>(mana, 0, max_mana);
}

void PlayerPatch::apply_to(PlayerRecord& r) const {
    if (health) r.health = *health;
    if (max_health) r.max_health = *max_health;
    if (max_mana) r.max_mana = *max_mana;
    if (mana) r.mana = *mana;
    if (experience) r.experience = *experience;
    if (level) r.level = *level;
    if (strength) r.strength = *strength;
    if (dexterity) r.dexterity = *dexterity;
    if (agility) r.agility = *agility;
    if (constitution) r.constitution = *constitution;
    if (wisdom) r.wisdom = *wisdom;
    if (intelligence) r.intelligence = *intelligence;
    if (charisma) r.charisma = *charisma;
    if (equipment) r.equipment = *equipment;
    if (flags) r.flags = *flags;
    if (bank) r.bank = *bank;
    if (current_room_id) r.current_room_id = *current_room_id;
    if (in_combat) r.in_combat = *in_combat;
    if (is_unconscious) r.is_unconscious = *is_unconscious;
    if (is_resting) r.is_resting = *is_resting;
    if (is_meditating) r.is_meditating = *is_meditating;
    if (last_login) r.last_login = *last_login;
    if (email) r.email = *email;
    if (description) r.description = *description;
    r.clamp_mana();
}

std::string normalize_username(const std::string& username) {
    std::string out(username);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool is_valid_username(const std::string& username) {
    if (username.size() < 3 || username.size() > 12) return false;
    return std::all_of(username.begin(), username.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    });
}

std::string format_iso8601(TimePoint tp) {
    using namespace std::chrono;
    auto since_epoch = duration_cast<milliseconds>(tp.time_since_epoch());
    auto whole_seconds = floor<seconds>(since_epoch);
    auto ms = since_epoch - whole_seconds;

    std::time_t t = static_cast<std::time_t>(whole_seconds.count());
    std::tm tm;
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    out << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return out.str();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) return std::nullopt;

    int64_t millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            int d = in.get() - '0';
            if (digits < 3) millis = millis * 10 + d;
            ++digits;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }
    // Trailing 'Z' or nothing; offsets other than UTC are not produced by our writers.

#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

void to_json(json& j, const Currency& c) {
    j = json{ {"gold", c.gold}, {"silver", c.silver}, {"copper", c.copper} };
}

void from_json(const json& j, Currency& c) {
    c.gold = int_or(j, "gold", 0);
    c.silver = int_or(j, "silver", 0);
    c.copper = int_or(j, "copper", 0);
}

void to_json(json& j, const AdminMessage& m) {
    j = json{ {"message", m.message}, {"timestamp", m.timestamp} };
}

void from_json(const json& j, AdminMessage& m) {
    m.message = j.value("message", "");
    m.timestamp = j.value("timestamp", "");
}

void to_json(json& j, const PlayerRecord& r) {
    j = r.extra.is_object() ? r.extra : json::object();
    j["username"] = r.username;
    if (!r.credential.password_hash.empty()) {
        j["passwordHash"] = r.credential.password_hash;
        j["salt"] = r.credential.salt;
    }
    if (r.credential.legacy_password) j["password"] = *r.credential.legacy_password;

    j["health"] = r.health;
    j["maxHealth"] = r.max_health;
    j["mana"] = r.mana;
    j["maxMana"] = r.max_mana;
    j["experience"] = r.experience;
    j["level"] = r.level;
    j["strength"] = r.strength;
    j["dexterity"] = r.dexterity;
    j["agility"] = r.agility;
    j["constitution"] = r.constitution;
    j["wisdom"] = r.wisdom;
    j["intelligence"] = r.intelligence;
    j["charisma"] = r.charisma;
    j["equipment"] = r.equipment;
    j["flags"] = r.flags;
    j["inventory"] = json{ {"items", r.inventory.items}, {"currency", r.inventory.currency} };
    j["bank"] = r.bank;
    j["currentRoomId"] = r.current_room_id;
    j["inCombat"] = r.in_combat;
    j["isUnconscious"] = r.is_unconscious;
    j["isResting"] = r.is_resting;
    j["isMeditating"] = r.is_meditating;
    j["joinDate"] = format_iso8601(r.join_date);
    j["lastLogin"] = format_iso8601(r.last_login);
    j["totalPlayTime"] = r.total_play_time;
    if (r.email) j["email"] = *r.email;
    if (r.description) j["description"] = *r.description;
    if (!r.pending_admin_messages.empty()) j["pendingAdminMessages"] = r.pending_admin_messages;
}

void from_json(const json& j, PlayerRecord& r) {
    const auto now = Clock::now();
    r = PlayerRecord{};
    r.username = normalize_username(j.value("username", ""));

    r.credential.password_hash = j.value("passwordHash", "");
    r.credential.salt = j.value("salt", "");
    if (j.contains("password") && j["password"].is_string()) {
        r.credential.legacy_password = j["password"].get<std::string>();
    }

    r.health = int_or(j, "health", r.health);
    r.max_health = int_or(j, "maxHealth", r.max_health);
    r.max_mana = int_or(j, "maxMana", 100);
    r.mana = int_or(j, "mana", r.max_mana);
    r.experience = int_or(j, "experience", r.experience);
    r.level = int_or(j, "level", r.level);
    r.strength = int_or(j, "strength", r.strength);
    r.dexterity = int_or(j, "dexterity", r.dexterity);
    r.agility = int_or(j, "agility", r.agility);
    r.constitution = int_or(j, "constitution", r.constitution);
    r.wisdom = int_or(j, "wisdom", r.wisdom);
    r.intelligence = int_or(j, "intelligence", r.intelligence);
    r.charisma = int_or(j, "charisma", r.charisma);
    r.clamp_mana();

    if (j.contains("equipment") && j["equipment"].is_object()) {
        for (auto& [slot, id] : j["equipment"].items()) {
            if (id.is_string()) r.equipment[slot] = id.get<std::string>();
        }
    }
    if (j.contains("flags") && j["flags"].is_array()) {
        for (auto& f : j["flags"]) {
            if (f.is_string()) r.flags.push_back(f.get<std::string>());
        }
    }
    if (j.contains("inventory") && j["inventory"].is_object()) {
        const auto& inv = j["inventory"];
        if (inv.contains("items") && inv["items"].is_array()) {
            for (auto& item : inv["items"]) {
                if (item.is_string()) r.inventory.items.push_back(item.get<std::string>());
            }
        }
        if (inv.contains("currency") && inv["currency"].is_object()) {
            r.inventory.currency = inv["currency"].get<Currency>();
        }
    }
    if (j.contains("bank") && j["bank"].is_object()) r.bank = j["bank"].get<Currency>();
    r.current_room_id = j.value("currentRoomId", r.current_room_id);

    r.in_combat = bool_or(j, "inCombat", false);
    r.is_unconscious = bool_or(j, "isUnconscious", false);
    r.is_resting = bool_or(j, "isResting", false);
    r.is_meditating = bool_or(j, "isMeditating", false);

    r.join_date = date_or(j, "joinDate", now);
    r.last_login = date_or(j, "lastLogin", r.join_date);
    r.total_play_time = int_or(j, "totalPlayTime", 0);

    if (j.contains("email") && j["email"].is_string()) r.email = j["email"].get<std::string>();
    if (j.contains("description") && j["description"].is_string()) r.description = j["description"].get<std::string>();
    if (j.contains("pendingAdminMessages") && j["pendingAdminMessages"].is_array()) {
        r.pending_admin_messages = j["pendingAdminMessages"].get<std::vector<AdminMessage>>();
    }

    for (auto& [key, value] : j.items()) {
        if (!is_known_key(key)) r.extra[key] = value;
    }
}
