// json_file_backend.cpp
#include "json_file_backend.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

JsonFileBackend::JsonFileBackend(std::string file_path)
    : file_path_(std::move(file_path)) {
}

bool JsonFileBackend::exists() const {
    std::error_code ec;
    return fs::exists(file_path_, ec);
}

std::vector<PlayerRecord> JsonFileBackend::load_all() {
    std::ifstream in(file_path_);
    if (!in.is_open()) throw std::runtime_error("cannot open " + file_path_);

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("bad JSON in " + file_path_ + ": " + ex.what());
    }
    if (!doc.is_array()) throw std::runtime_error(file_path_ + " does not hold a JSON array");

    std::vector<PlayerRecord> records;
    records.reserve(doc.size());
    for (const auto& entry : doc) {
        if (!entry.is_object()) throw std::runtime_error(file_path_ + " contains a non-object entry");
        records.push_back(entry.get<PlayerRecord>());
    }
    Logger::instance().info("Loaded users from file", { {"path", file_path_}, {"count", static_cast<uint64_t>(records.size())} });
    return records;
}

void JsonFileBackend::save_all(const std::vector<PlayerRecord>& records) {
    fs::path target(file_path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw std::runtime_error("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    // Write beside the target and rename, so a crash mid-write leaves the old file intact.
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        json doc = records;
        out << doc.dump(2);
        out.flush();
        if (!out) throw std::runtime_error("write to " + tmp.string() + " failed");
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) throw std::runtime_error("cannot replace " + file_path_ + ": " + ec.message());

    Logger::instance().debug("Saved users to file", { {"path", file_path_}, {"count", static_cast<uint64_t>(records.size())} });
}
