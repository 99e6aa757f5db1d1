#include "db.hpp"

#include <sqlite3.h>
#include <xxhash.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "parser.hpp"

namespace exospec {

namespace {

// Finalizes a prepared statement when it leaves scope.
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() {
        sqlite3_finalize(stmt);
    }
};

std::string column_text(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

double column_double(sqlite3_stmt* stmt, int column) {
    // NaN is stored as NULL
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return sqlite3_column_double(stmt, column);
}

RunSummary read_summary(sqlite3_stmt* stmt) {
    RunSummary summary;
    summary.run_id = column_text(stmt, 0);
    summary.kind = parse_run_kind(column_text(stmt, 1));
    summary.model_path = column_text(stmt, 2);
    summary.created_at = sqlite3_column_int64(stmt, 3);
    summary.num_points = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
    return summary;
}

}  // namespace

std::string compute_run_id(RunKind kind, const std::string& model_json,
                           const std::string& data_fingerprint) {
    std::string hash_source_string
        = run_kind_name(kind) + "\n" + model_json + "\n" + data_fingerprint;
    uint64_t hash_id
        = XXH64(hash_source_string.data(), hash_source_string.size(), 0);
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(hash_id));
    return hex;
}

DB::DB(std::string db_file) : db_file_(std::move(db_file)) {
    if (sqlite3_open(db_file_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open " + db_file_ + ": " + message);
    }
    try {
        exec("PRAGMA foreign_keys = ON;");
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

DB::~DB() {
    sqlite3_close(db_);
}

void DB::throw_error(const std::string& context) {
    throw std::runtime_error(context + ": " + sqlite3_errmsg(db_));
}

void DB::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::string("sqlite: ") + message);
    }
}

sqlite3_stmt* DB::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw_error("prepare");
    }
    return stmt;
}

void DB::build_tables() {
    const char* db_tables
        = "CREATE TABLE IF NOT EXISTS runs ("
          "  run_id TEXT PRIMARY KEY,"
          "  kind TEXT NOT NULL,"
          "  model_path TEXT NOT NULL,"
          "  model_json TEXT NOT NULL,"
          "  created_at INTEGER NOT NULL,"
          "  num_points INTEGER NOT NULL"
          ");"
          "CREATE TABLE IF NOT EXISTS spectrum_points("
          "  run_id TEXT NOT NULL,"
          "  series TEXT NOT NULL,"
          "  order_number INTEGER NOT NULL,"
          "  wavelength REAL NOT NULL,"
          "  value REAL,"
          "  PRIMARY KEY (run_id, series, order_number),"
          "  FOREIGN KEY (run_id)"
          "    REFERENCES runs (run_id)"
          "    ON DELETE CASCADE"
          "    ON UPDATE CASCADE"
          ");";
    exec(db_tables);
}

void DB::insert_points(sqlite3_stmt* insert_point, const std::string& run_id,
                       const char* series, const DepthResult& points) {
    for (size_t i = 0; i < points.wavelengths.size(); ++i) {
        sqlite3_bind_text(insert_point, 1, run_id.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_point, 2, series, -1, SQLITE_STATIC);
        sqlite3_bind_int64(insert_point, 3, static_cast<sqlite3_int64>(i));
        sqlite3_bind_double(insert_point, 4, points.wavelengths[i]);
        if (std::isnan(points.values[i])) {
            sqlite3_bind_null(insert_point, 5);
        } else {
            sqlite3_bind_double(insert_point, 5, points.values[i]);
        }
        if (sqlite3_step(insert_point) != SQLITE_DONE) {
            throw_error("insert spectrum point");
        }
        sqlite3_reset(insert_point);
    }
}

void DB::save_run(const RunSummary& summary, const std::string& model_json,
                  const DepthResult& binned, const DepthResult& unbinned) {
    if (binned.wavelengths.size() != binned.values.size()
        || unbinned.wavelengths.size() != unbinned.values.size()) {
        throw std::invalid_argument(
            "Spectrum wavelengths and values differ in length");
    }
    exec("BEGIN TRANSACTION;");
    try {
        Statement delete_run{prepare("DELETE FROM runs WHERE run_id = ?;")};
        sqlite3_bind_text(delete_run.stmt, 1, summary.run_id.c_str(), -1,
                          SQLITE_TRANSIENT);
        if (sqlite3_step(delete_run.stmt) != SQLITE_DONE) {
            throw_error("delete run");
        }

        Statement insert_run{
            prepare("INSERT INTO runs(run_id, kind, model_path, model_json, "
                    "created_at, num_points) VALUES (?, ?, ?, ?, ?, ?);")};
        const std::string kind = run_kind_name(summary.kind);
        const int64_t created_at = summary.created_at != 0
                                       ? summary.created_at
                                       : static_cast<int64_t>(std::time(nullptr));
        sqlite3_bind_text(insert_run.stmt, 1, summary.run_id.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_run.stmt, 2, kind.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_run.stmt, 3, summary.model_path.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_text(insert_run.stmt, 4, model_json.c_str(), -1,
                          SQLITE_TRANSIENT);
        sqlite3_bind_int64(insert_run.stmt, 5, created_at);
        sqlite3_bind_int64(insert_run.stmt, 6,
                           static_cast<sqlite3_int64>(binned.values.size()));
        if (sqlite3_step(insert_run.stmt) != SQLITE_DONE) {
            throw_error("insert run");
        }

        Statement insert_point{
            prepare("INSERT INTO spectrum_points(run_id, series, order_number, "
                    "wavelength, value) VALUES (?, ?, ?, ?, ?);")};
        insert_points(insert_point.stmt, summary.run_id, "binned", binned);
        insert_points(insert_point.stmt, summary.run_id, "unbinned", unbinned);
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    exec("COMMIT;");
    std::cerr << "[db] saved run " << summary.run_id << " ("
              << binned.values.size() << " points)\n";
}

bool DB::has_run(const std::string& run_id) {
    Statement select{prepare("SELECT 1 FROM runs WHERE run_id = ?;")};
    sqlite3_bind_text(select.stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(select.stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) throw_error("has_run");
    return rc == SQLITE_ROW;
}

std::optional<StoredRun> DB::load_run(const std::string& run_id) {
    Statement select_run{
        prepare("SELECT run_id, kind, model_path, created_at, num_points "
                "FROM runs WHERE run_id = ?;")};
    sqlite3_bind_text(select_run.stmt, 1, run_id.c_str(), -1,
                      SQLITE_TRANSIENT);
    int rc = sqlite3_step(select_run.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw_error("load run");

    StoredRun run;
    run.summary = read_summary(select_run.stmt);
    Statement select_points{
        prepare("SELECT series, wavelength, value FROM spectrum_points "
                "WHERE run_id = ? ORDER BY series, order_number;")};
    sqlite3_bind_text(select_points.stmt, 1, run_id.c_str(), -1,
                      SQLITE_TRANSIENT);
    while ((rc = sqlite3_step(select_points.stmt)) == SQLITE_ROW) {
        DepthResult& series = column_text(select_points.stmt, 0) == "binned"
                                  ? run.binned
                                  : run.unbinned;
        series.wavelengths.push_back(
            sqlite3_column_double(select_points.stmt, 1));
        series.values.push_back(column_double(select_points.stmt, 2));
    }
    if (rc != SQLITE_DONE) throw_error("load spectrum points");
    return run;
}

std::vector<RunSummary> DB::list_runs() {
    Statement select{
        prepare("SELECT run_id, kind, model_path, created_at, num_points "
                "FROM runs ORDER BY created_at DESC, run_id;")};
    std::vector<RunSummary> runs;
    int rc;
    while ((rc = sqlite3_step(select.stmt)) == SQLITE_ROW) {
        runs.push_back(read_summary(select.stmt));
    }
    if (rc != SQLITE_DONE) throw_error("list runs");
    return runs;
}

}  // namespace exospec
