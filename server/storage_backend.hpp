// storage_backend.hpp
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "player_record.hpp"

enum class StorageBackend { File, Database, Auto };

// file|json, database|sqlite, auto. Case-insensitive.
std::optional<StorageBackend> parse_storage_backend(const std::string& name);
const char* to_string(StorageBackend backend);

// Flat backend: the whole collection lives in one document.
// Implementations throw std::runtime_error on I/O or parse failure.
class FlatFileBackend {
public:
    virtual ~FlatFileBackend() = default;
    virtual bool exists() const = 0;
    virtual std::vector<PlayerRecord> load_all() = 0;
    virtual void save_all(const std::vector<PlayerRecord>& records) = 0;
};

// Relational backend: one row per player, keyed by username.
// Only ever called from the gateway's write-behind worker.
class RelationalBackend {
public:
    virtual ~RelationalBackend() = default;
    virtual std::vector<PlayerRecord> load_all() = 0;
    // Full-row replace on conflict.
    virtual void upsert_one(const PlayerRecord& record) = 0;
    // No-op when the row does not exist.
    virtual void delete_one(const std::string& username) = 0;
};
