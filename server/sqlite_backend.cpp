// sqlite_backend.cpp
#include "sqlite_backend.hpp"
#include "logger.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace {

const char* kCreateUsers = R"(
    CREATE TABLE IF NOT EXISTS users (
        username TEXT PRIMARY KEY NOT NULL,
        password_hash TEXT NOT NULL DEFAULT '',
        salt TEXT NOT NULL DEFAULT '',
        health INTEGER NOT NULL DEFAULT 100,
        max_health INTEGER NOT NULL DEFAULT 100,
        mana INTEGER NOT NULL DEFAULT 100,
        max_mana INTEGER NOT NULL DEFAULT 100,
        experience INTEGER NOT NULL DEFAULT 0,
        level INTEGER NOT NULL DEFAULT 1,
        strength INTEGER NOT NULL DEFAULT 10,
        dexterity INTEGER NOT NULL DEFAULT 10,
        agility INTEGER NOT NULL DEFAULT 10,
        constitution INTEGER NOT NULL DEFAULT 10,
        wisdom INTEGER NOT NULL DEFAULT 10,
        intelligence INTEGER NOT NULL DEFAULT 10,
        charisma INTEGER NOT NULL DEFAULT 10,
        equipment TEXT,
        join_date TEXT NOT NULL,
        last_login TEXT NOT NULL,
        total_play_time INTEGER NOT NULL DEFAULT 0,
        current_room_id TEXT NOT NULL DEFAULT 'start',
        inventory_items TEXT,
        inventory_gold INTEGER NOT NULL DEFAULT 0,
        inventory_silver INTEGER NOT NULL DEFAULT 0,
        inventory_copper INTEGER NOT NULL DEFAULT 0,
        bank_gold INTEGER NOT NULL DEFAULT 0,
        bank_silver INTEGER NOT NULL DEFAULT 0,
        bank_copper INTEGER NOT NULL DEFAULT 0,
        in_combat INTEGER NOT NULL DEFAULT 0,
        is_unconscious INTEGER NOT NULL DEFAULT 0,
        is_resting INTEGER NOT NULL DEFAULT 0,
        is_meditating INTEGER NOT NULL DEFAULT 0,
        flags TEXT,
        pending_admin_messages TEXT,
        email TEXT,
        description TEXT
    );
)";

// Column order shared by the SELECT and the INSERT below.
const char* kSelectUsers = R"(
    SELECT username, password_hash, salt,
           health, max_health, mana, max_mana, experience, level,
           strength, dexterity, agility, constitution, wisdom, intelligence, charisma,
           equipment, join_date, last_login, total_play_time, current_room_id,
           inventory_items, inventory_gold, inventory_silver, inventory_copper,
           bank_gold, bank_silver, bank_copper,
           in_combat, is_unconscious, is_resting, is_meditating,
           flags, pending_admin_messages, email, description
    FROM users ORDER BY username;
)";

const char* kUpsertUser = R"(
    INSERT OR REPLACE INTO users (
           username, password_hash, salt,
           health, max_health, mana, max_mana, experience, level,
           strength, dexterity, agility, constitution, wisdom, intelligence, charisma,
           equipment, join_date, last_login, total_play_time, current_room_id,
           inventory_items, inventory_gold, inventory_silver, inventory_copper,
           bank_gold, bank_silver, bank_copper,
           in_combat, is_unconscious, is_resting, is_meditating,
           flags, pending_admin_messages, email, description)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16,
            ?17, ?18, ?19, ?20, ?21, ?22, ?23, ?24, ?25, ?26, ?27, ?28,
            ?29, ?30, ?31, ?32, ?33, ?34, ?35, ?36);
)";

const char* kDeleteUser = "DELETE FROM users WHERE username = ?1;";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

bool column_is_null(sqlite3_stmt* stmt, int col) {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

// JSON columns written by older builds may be malformed; fall back rather than fail the load.
json column_json(sqlite3_stmt* stmt, int col, json fallback) {
    if (column_is_null(stmt, col)) return fallback;
    json parsed = json::parse(column_text(stmt, col), nullptr, false);
    return parsed.is_discarded() ? fallback : parsed;
}

} // namespace

SqliteBackend::SqliteBackend(const std::string& db_path)
    : db_path_(db_path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(db_path_.c_str(), &raw);
    db_.reset(raw);
    if (rc != SQLITE_OK) fail("open");

    create_tables();
    upsert_stmt_ = prepare(kUpsertUser);
    delete_stmt_ = prepare(kDeleteUser);
    Logger::instance().info("Opened player database", { {"path", db_path_} });
}

void SqliteBackend::fail(const std::string& what) {
    std::string msg = db_ ? sqlite3_errmsg(db_.get()) : "out of memory";
    throw std::runtime_error("sqlite " + what + " failed for " + db_path_ + ": " + msg);
}

void SqliteBackend::create_tables() {
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), kCreateUsers, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("sqlite create users table failed: " + msg);
    }
}

SqliteBackend::StmtPtr SqliteBackend::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) fail("prepare");
    return StmtPtr(stmt);
}

std::vector<PlayerRecord> SqliteBackend::load_all() {
    StmtPtr stmt = prepare(kSelectUsers);
    std::vector<PlayerRecord> records;

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = stmt.get();
        PlayerRecord r;
        r.username = column_text(s, 0);
        r.credential.password_hash = column_text(s, 1);
        r.credential.salt = column_text(s, 2);
        r.health = sqlite3_column_int64(s, 3);
        r.max_health = sqlite3_column_int64(s, 4);
        r.mana = sqlite3_column_int64(s, 5);
        r.max_mana = sqlite3_column_int64(s, 6);
        r.experience = sqlite3_column_int64(s, 7);
        r.level = sqlite3_column_int64(s, 8);
        r.strength = sqlite3_column_int64(s, 9);
        r.dexterity = sqlite3_column_int64(s, 10);
        r.agility = sqlite3_column_int64(s, 11);
        r.constitution = sqlite3_column_int64(s, 12);
        r.wisdom = sqlite3_column_int64(s, 13);
        r.intelligence = sqlite3_column_int64(s, 14);
        r.charisma = sqlite3_column_int64(s, 15);

        json equipment = column_json(s, 16, json::object());
        if (equipment.is_object()) {
            for (auto& [slot, id] : equipment.items()) {
                if (id.is_string()) r.equipment[slot] = id.get<std::string>();
            }
        }

        auto now = Clock::now();
        r.join_date = parse_iso8601(column_text(s, 17)).value_or(now);
        r.last_login = parse_iso8601(column_text(s, 18)).value_or(r.join_date);
        r.total_play_time = sqlite3_column_int64(s, 19);
        r.current_room_id = column_text(s, 20);

        json items = column_json(s, 21, json::array());
        if (items.is_array()) {
            for (auto& item : items) {
                if (item.is_string()) r.inventory.items.push_back(item.get<std::string>());
            }
        }
        r.inventory.currency = Currency{ sqlite3_column_int64(s, 22), sqlite3_column_int64(s, 23), sqlite3_column_int64(s, 24) };
        r.bank = Currency{ sqlite3_column_int64(s, 25), sqlite3_column_int64(s, 26), sqlite3_column_int64(s, 27) };

        r.in_combat = sqlite3_column_int(s, 28) == 1;
        r.is_unconscious = sqlite3_column_int(s, 29) == 1;
        r.is_resting = sqlite3_column_int(s, 30) == 1;
        r.is_meditating = sqlite3_column_int(s, 31) == 1;

        json flags = column_json(s, 32, json::array());
        if (flags.is_array()) {
            for (auto& f : flags) {
                if (f.is_string()) r.flags.push_back(f.get<std::string>());
            }
        }
        json messages = column_json(s, 33, json::array());
        if (messages.is_array()) {
            for (auto& m : messages) {
                if (m.is_object()) r.pending_admin_messages.push_back(m.get<AdminMessage>());
            }
        }
        if (!column_is_null(s, 34)) r.email = column_text(s, 34);
        if (!column_is_null(s, 35)) r.description = column_text(s, 35);

        r.clamp_mana();
        records.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) fail("select users");

    Logger::instance().info("Loaded users from database", { {"path", db_path_}, {"count", static_cast<uint64_t>(records.size())} });
    return records;
}

void SqliteBackend::upsert_one(const PlayerRecord& r) {
    sqlite3_stmt* s = upsert_stmt_.get();
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);

    auto bind_text = [&](int idx, const std::string& value) {
        if (sqlite3_bind_text(s, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) fail("bind");
    };
    auto bind_int = [&](int idx, int64_t value) {
        if (sqlite3_bind_int64(s, idx, value) != SQLITE_OK) fail("bind");
    };
    auto bind_optional = [&](int idx, const std::optional<std::string>& value) {
        if (value) bind_text(idx, *value);
        else if (sqlite3_bind_null(s, idx) != SQLITE_OK) fail("bind");
    };

    bind_text(1, r.username);
    bind_text(2, r.credential.password_hash);
    bind_text(3, r.credential.salt);
    bind_int(4, r.health);
    bind_int(5, r.max_health);
    bind_int(6, r.mana);
    bind_int(7, r.max_mana);
    bind_int(8, r.experience);
    bind_int(9, r.level);
    bind_int(10, r.strength);
    bind_int(11, r.dexterity);
    bind_int(12, r.agility);
    bind_int(13, r.constitution);
    bind_int(14, r.wisdom);
    bind_int(15, r.intelligence);
    bind_int(16, r.charisma);
    bind_text(17, json(r.equipment).dump());
    bind_text(18, format_iso8601(r.join_date));
    bind_text(19, format_iso8601(r.last_login));
    bind_int(20, r.total_play_time);
    bind_text(21, r.current_room_id);
    bind_text(22, json(r.inventory.items).dump());
    bind_int(23, r.inventory.currency.gold);
    bind_int(24, r.inventory.currency.silver);
    bind_int(25, r.inventory.currency.copper);
    bind_int(26, r.bank.gold);
    bind_int(27, r.bank.silver);
    bind_int(28, r.bank.copper);
    bind_int(29, r.in_combat ? 1 : 0);
    bind_int(30, r.is_unconscious ? 1 : 0);
    bind_int(31, r.is_resting ? 1 : 0);
    bind_int(32, r.is_meditating ? 1 : 0);
    bind_text(33, json(r.flags).dump());
    bind_text(34, json(r.pending_admin_messages).dump());
    bind_optional(35, r.email);
    bind_optional(36, r.description);

    if (sqlite3_step(s) != SQLITE_DONE) fail("upsert " + r.username);
    sqlite3_reset(s);
}

void SqliteBackend::delete_one(const std::string& username) {
    sqlite3_stmt* s = delete_stmt_.get();
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);
    if (sqlite3_bind_text(s, 1, username.c_str(), static_cast<int>(username.size()), SQLITE_TRANSIENT) != SQLITE_OK) fail("bind");
    if (sqlite3_step(s) != SQLITE_DONE) fail("delete " + username);
    sqlite3_reset(s);
}
