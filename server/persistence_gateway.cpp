// persistence_gateway.cpp
#include "persistence_gateway.hpp"
#include "logger.hpp"
#include <cctype>
#include <stdexcept>

std::optional<StorageBackend> parse_storage_backend(const std::string& name) {
    std::string s(name);
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "file" || s == "json") return StorageBackend::File;
    if (s == "database" || s == "sqlite") return StorageBackend::Database;
    if (s == "auto") return StorageBackend::Auto;
    return std::nullopt;
}

const char* to_string(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::File: return "file";
        case StorageBackend::Database: return "database";
        case StorageBackend::Auto: return "auto";
    }
    return "auto";
}

bool SaveTicket::wait() const {
    if (suppressed) return true;
    bool ok = file_ok;
    if (relational.valid()) ok = relational.get() && ok;
    return ok;
}

PersistenceGateway::PersistenceGateway(StorageBackend mode,
                                       std::unique_ptr<FlatFileBackend> file,
                                       std::unique_ptr<RelationalBackend> relational)
    : mode_(mode),
      test_mode_(false),
      file_(std::move(file)),
      relational_(std::move(relational)) {
    Logger::instance().info("Persistence gateway ready", {
        {"mode", to_string(mode_)},
        {"file_backend", file_ != nullptr},
        {"relational_backend", relational_ != nullptr} });
}

PersistenceGateway::~PersistenceGateway() {
    std::size_t outstanding = queue_.pending();
    if (outstanding > 0) {
        Logger::instance().info("Draining queued database writes", { {"pending", static_cast<uint64_t>(outstanding)} });
    }
}

void PersistenceGateway::set_test_mode(bool enabled) {
    test_mode_ = enabled;
    Logger::instance().info(enabled ? "Test mode enabled - persistence disabled" : "Test mode disabled - persistence enabled");
}

std::vector<PlayerRecord> PersistenceGateway::load_file() {
    if (!file_) {
        Logger::instance().warn("No flat-file backend configured");
        return {};
    }
    try {
        if (!file_->exists()) {
            Logger::instance().info("No users file yet, starting empty");
            return {};
        }
        return file_->load_all();
    } catch (const std::exception& ex) {
        Logger::instance().error("Error loading users from file", { {"what", ex.what()} });
        return {};
    }
}

std::vector<PlayerRecord> PersistenceGateway::load_database() {
    if (!relational_) throw std::runtime_error("no relational backend configured");
    RelationalBackend* backend = relational_.get();
    return queue_.submit([backend]() { return backend->load_all(); }).get();
}

LoadResult PersistenceGateway::load() {
    LoadResult result;
    switch (mode_) {
        case StorageBackend::File:
            result.records = load_file();
            result.source = LoadSource::File;
            break;

        case StorageBackend::Database:
            try {
                result.records = load_database();
                result.source = LoadSource::Database;
            } catch (const std::exception& ex) {
                Logger::instance().error("Database load failed (no fallback)", { {"what", ex.what()} });
            }
            break;

        case StorageBackend::Auto:
            try {
                result.records = load_database();
                result.source = LoadSource::Database;
            } catch (const std::exception& ex) {
                Logger::instance().warn("Database load failed, falling back to file", { {"what", ex.what()} });
                result.records = load_file();
                result.source = LoadSource::File;
            }
            break;
    }
    return result;
}

bool PersistenceGateway::save_file(const std::vector<PlayerRecord>& records) {
    if (!file_) {
        Logger::instance().error("Error saving users to file", { {"what", "no flat-file backend configured"} });
        return false;
    }
    try {
        file_->save_all(records);
        return true;
    } catch (const std::exception& ex) {
        Logger::instance().error("Error saving users to file", { {"what", ex.what()} });
        return false;
    }
}

// Upserts run one row at a time; a failure stops the batch, leaving earlier rows written.
std::shared_future<bool> PersistenceGateway::queue_database_save(std::vector<PlayerRecord> records) {
    RelationalBackend* backend = relational_.get();
    if (!backend) {
        std::promise<bool> failed;
        failed.set_value(false);
        Logger::instance().error("Database save failed", { {"what", "no relational backend configured"} });
        return failed.get_future().share();
    }
    auto batch = std::make_shared<std::vector<PlayerRecord>>(std::move(records));
    return queue_.enqueue("save users to database", [backend, batch]() {
        for (const auto& record : *batch) backend->upsert_one(record);
    });
}

SaveTicket PersistenceGateway::save(const std::vector<PlayerRecord>& records) {
    SaveTicket ticket;
    if (test_mode_) {
        Logger::instance().debug("Skipping save - test mode active");
        ticket.suppressed = true;
        return ticket;
    }

    switch (mode_) {
        case StorageBackend::File:
            ticket.file_ok = save_file(records);
            break;
        case StorageBackend::Database:
            ticket.relational = queue_database_save(records);
            break;
        case StorageBackend::Auto:
            ticket.relational = queue_database_save(records);
            ticket.file_ok = save_file(records);
            break;
    }
    return ticket;
}

SaveTicket PersistenceGateway::remove(const std::string& username) {
    SaveTicket ticket;
    if (test_mode_) {
        ticket.suppressed = true;
        return ticket;
    }
    if (mode_ == StorageBackend::File) return ticket;

    RelationalBackend* backend = relational_.get();
    if (!backend) {
        std::promise<bool> failed;
        failed.set_value(false);
        Logger::instance().error("Database delete failed", { {"username", username}, {"what", "no relational backend configured"} });
        ticket.relational = failed.get_future().share();
        return ticket;
    }
    ticket.relational = queue_.enqueue("delete user from database", [backend, username]() {
        backend->delete_one(username);
    });
    return ticket;
}

void PersistenceGateway::flush() {
    queue_.flush();
}
