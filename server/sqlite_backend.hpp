// sqlite_backend.hpp
#pragma once
#include <memory>
#include <string>
#include <sqlite3.h>
#include "storage_backend.hpp"

// `users` table, one row per player. Opens (and creates) the database on
// construction; throws std::runtime_error if that fails.
class SqliteBackend : public RelationalBackend {
public:
    explicit SqliteBackend(const std::string& db_path);

    std::vector<PlayerRecord> load_all() override;
    void upsert_one(const PlayerRecord& record) override;
    void delete_one(const std::string& username) override;

private:
    struct DbCloser { void operator()(sqlite3* db) const { sqlite3_close(db); } };
    struct StmtFinalizer { void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); } };
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

    void create_tables();
    StmtPtr prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    std::string db_path_;
    std::unique_ptr<sqlite3, DbCloser> db_;
    StmtPtr upsert_stmt_;
    StmtPtr delete_stmt_;
};
