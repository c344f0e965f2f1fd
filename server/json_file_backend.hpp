// json_file_backend.hpp
#pragma once
#include <string>
#include "storage_backend.hpp"

// users.json: a pretty-printed array of player records.
class JsonFileBackend : public FlatFileBackend {
public:
    explicit JsonFileBackend(std::string file_path);

    bool exists() const override;
    std::vector<PlayerRecord> load_all() override;
    void save_all(const std::vector<PlayerRecord>& records) override;

    const std::string& path() const { return file_path_; }

private:
    std::string file_path_;
};
