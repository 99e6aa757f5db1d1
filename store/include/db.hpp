#pragma once
#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"

namespace exospec {

// Hex XXH64 of the run kind, the model-file text and the data fingerprint.
std::string compute_run_id(RunKind kind, const std::string& model_json,
                           const std::string& data_fingerprint);

class DB {
   public:
    explicit DB(std::string db_file);
    ~DB();
    DB(const DB&) = delete;
    DB& operator=(const DB&) = delete;

    void build_tables();
    // Replaces any earlier run with the same id.
    void save_run(const RunSummary& summary, const std::string& model_json,
                  const DepthResult& binned, const DepthResult& unbinned);
    bool has_run(const std::string& run_id);
    std::optional<StoredRun> load_run(const std::string& run_id);
    std::vector<RunSummary> list_runs();

   private:
    void exec(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void throw_error(const std::string& context);
    void insert_points(sqlite3_stmt* insert_point, const std::string& run_id,
                       const char* series, const DepthResult& points);

    std::string db_file_;
    sqlite3* db_ = nullptr;
};

}  // namespace exospec
