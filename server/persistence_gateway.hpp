// persistence_gateway.hpp
#pragma once
#include <future>
#include <memory>
#include <vector>
#include "storage_backend.hpp"
#include "write_behind_queue.hpp"

// Outcome of one save call. The flat-file part is known on return; the
// relational part (if any) completes later on the write-behind worker.
struct SaveTicket {
    bool suppressed = false;   // test mode, nothing written
    bool file_ok = true;
    std::shared_future<bool> relational;

    bool relational_queued() const { return relational.valid(); }
    // Blocks until the relational write has settled. True if every part succeeded.
    bool wait() const;
};

enum class LoadSource { None, File, Database };

struct LoadResult {
    std::vector<PlayerRecord> records;
    LoadSource source = LoadSource::None;
};

// Routes player-collection loads and saves to the flat and relational
// backends under a mode fixed at construction:
//   File      load/save the flat file only
//   Database  load/save the relational store only, no fallback
//   Auto      load relational first and fall back to the flat file;
//             save to both, relational queued, flat file synchronous
class PersistenceGateway {
public:
    // Either backend may be null when the mode never touches it.
    PersistenceGateway(StorageBackend mode,
                       std::unique_ptr<FlatFileBackend> file,
                       std::unique_ptr<RelationalBackend> relational);
    ~PersistenceGateway();

    LoadResult load();
    SaveTicket save(const std::vector<PlayerRecord>& records);
    // Drops one player's row from the relational store. Saves only upsert, so
    // a deletion needs this to stay deleted. The flat file is rewritten whole
    // by the next save and needs nothing here.
    SaveTicket remove(const std::string& username);

    // Waits for all queued relational writes.
    void flush();

    void set_test_mode(bool enabled);
    bool test_mode() const { return test_mode_; }
    StorageBackend mode() const { return mode_; }

private:
    std::vector<PlayerRecord> load_file();
    std::vector<PlayerRecord> load_database();
    bool save_file(const std::vector<PlayerRecord>& records);
    std::shared_future<bool> queue_database_save(std::vector<PlayerRecord> records);

    StorageBackend mode_;
    bool test_mode_;
    std::unique_ptr<FlatFileBackend> file_;
    std::unique_ptr<RelationalBackend> relational_;
    // Declared last so it is joined before the backends it uses are destroyed.
    WriteBehindQueue queue_;
};
