#include "ciflow/storage/run_store.hpp"

#include "ciflow/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <chrono>

namespace ciflow {

namespace {

auto to_timestamp(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_timestamp(std::int64_t ts) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ts));
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int col, std::string_view value) -> void {
  sqlite3_bind_text(stmt, col, value.empty() ? "" : value.data(),
                    static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

auto bind_optional_time(sqlite3_stmt* stmt, int col,
                        const std::optional<Timestamp>& t) -> void {
  if (t) {
    sqlite3_bind_int64(stmt, col, to_timestamp(*t));
  } else {
    sqlite3_bind_null(stmt, col);
  }
}

auto col_optional_time(sqlite3_stmt* stmt, int col)
    -> std::optional<Timestamp> {
  if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return from_timestamp(sqlite3_column_int64(stmt, col));
}

}  // namespace

auto RunStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

RunStore::Statement::~Statement() {
  reset();
}

auto RunStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

auto RunStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

RunStore::RunStore(std::string_view db_path) : db_path_(db_path) {
}

RunStore::~RunStore() {
  close();
}

auto RunStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Database opened: {}", db_path_);
  return ok();
}

auto RunStore::close() -> void {
  db_.reset();
}

auto RunStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS runs (
      id TEXT PRIMARY KEY,
      workflow TEXT NOT NULL DEFAULT '',
      verdict TEXT NOT NULL,
      cancelled INTEGER NOT NULL DEFAULT 0,
      started_at INTEGER NOT NULL,
      finished_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS job_instances (
      run_id TEXT NOT NULL,
      instance_id TEXT NOT NULL,
      position INTEGER NOT NULL,
      job_id TEXT NOT NULL,
      binding TEXT NOT NULL DEFAULT '[]',
      status TEXT NOT NULL,
      cause TEXT NOT NULL DEFAULT 'none',
      exit_code INTEGER,
      started_at INTEGER,
      finished_at INTEGER,
      error_message TEXT DEFAULT '',
      output TEXT DEFAULT '',
      PRIMARY KEY (run_id, instance_id),
      FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_runs_workflow
      ON runs(workflow, started_at);
  )";

  return execute(sql);
}

auto RunStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto RunStore::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto RunStore::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto RunStore::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

auto RunStore::save_report(const RunReport& report) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  if (auto r = begin_transaction(); !r)
    return r;

  constexpr auto sql = R"(
    INSERT INTO runs (id, workflow, verdict, cancelled, started_at, finished_at)
    VALUES (?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      workflow = excluded.workflow,
      verdict = excluded.verdict,
      cancelled = excluded.cancelled,
      started_at = excluded.started_at,
      finished_at = excluded.finished_at;
  )";

  auto result = prepare(sql);
  if (!result) {
    (void)rollback_transaction();
    return std::unexpected(result.error());
  }
  Statement stmt(*result);

  bind_text(stmt.get(), 1, report.run_id.value());
  bind_text(stmt.get(), 2, report.workflow);
  bind_text(stmt.get(), 3, verdict_name(report.verdict));
  sqlite3_bind_int(stmt.get(), 4, report.cancelled ? 1 : 0);
  sqlite3_bind_int64(stmt.get(), 5, to_timestamp(report.started_at));
  sqlite3_bind_int64(stmt.get(), 6, to_timestamp(report.finished_at));

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to save run {}: {}", report.run_id,
               sqlite3_errmsg(db_.get()));
    (void)rollback_transaction();
    return fail(Error::DatabaseQueryFailed);
  }

  if (auto r = save_instances(report); !r) {
    (void)rollback_transaction();
    return r;
  }
  return commit_transaction();
}

auto RunStore::save_instances(const RunReport& report) -> Result<void> {
  {
    auto result = prepare("DELETE FROM job_instances WHERE run_id = ?;");
    if (!result)
      return std::unexpected(result.error());
    Statement stmt(*result);
    bind_text(stmt.get(), 1, report.run_id.value());
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail(Error::DatabaseQueryFailed);
    }
  }

  constexpr auto sql = R"(
    INSERT INTO job_instances (run_id, instance_id, position, job_id, binding,
                               status, cause, exit_code, started_at,
                               finished_at, error_message, output)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  for (std::size_t i = 0; i < report.instances.size(); ++i) {
    const auto& r = report.instances[i];
    std::string binding = nlohmann::json(r.binding).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);

    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    bind_text(stmt.get(), 1, report.run_id.value());
    bind_text(stmt.get(), 2, r.id.value());
    sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(i));
    bind_text(stmt.get(), 4, r.job.value());
    bind_text(stmt.get(), 5, binding);
    bind_text(stmt.get(), 6, job_status_name(r.status));
    bind_text(stmt.get(), 7, failure_cause_name(r.cause));
    if (r.exit_code) {
      sqlite3_bind_int(stmt.get(), 8, *r.exit_code);
    } else {
      sqlite3_bind_null(stmt.get(), 8);
    }
    bind_optional_time(stmt.get(), 9, r.started_at);
    bind_optional_time(stmt.get(), 10, r.finished_at);
    bind_text(stmt.get(), 11, r.error);
    bind_text(stmt.get(), 12, r.output);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      log::error("Failed to save instance {}: {}", r.id,
                 sqlite3_errmsg(db_.get()));
      return fail(Error::DatabaseQueryFailed);
    }
  }
  return ok();
}

auto RunStore::get_report(std::string_view run_id) -> Result<RunReport> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }

  constexpr auto sql = R"(
    SELECT id, workflow, verdict, cancelled, started_at, finished_at
    FROM runs WHERE id = ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, run_id);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::NotFound);
  }

  RunReport report;
  report.run_id = RunId{col_text(stmt.get(), 0)};
  report.workflow = col_text(stmt.get(), 1);
  report.verdict =
      parse_verdict(col_text(stmt.get(), 2)).value_or(Verdict::Failure);
  report.cancelled = sqlite3_column_int(stmt.get(), 3) != 0;
  report.started_at = from_timestamp(sqlite3_column_int64(stmt.get(), 4));
  report.finished_at = from_timestamp(sqlite3_column_int64(stmt.get(), 5));

  if (auto r = load_instances(report); !r) {
    return std::unexpected(r.error());
  }
  return report;
}

auto RunStore::get_instances(std::string_view run_id)
    -> Result<std::vector<InstanceReport>> {
  auto report = get_report(run_id);
  if (!report) {
    return std::unexpected(report.error());
  }
  return std::move(report->instances);
}

auto RunStore::load_instances(RunReport& report) -> Result<void> {
  constexpr auto sql = R"(
    SELECT instance_id, job_id, binding, status, cause, exit_code,
           started_at, finished_at, error_message, output
    FROM job_instances WHERE run_id = ? ORDER BY position;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, report.run_id.value());

  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    InstanceReport r;
    r.id = InstanceId{col_text(stmt.get(), 0)};
    r.job = JobId{col_text(stmt.get(), 1)};
    try {
      r.binding = nlohmann::json::parse(col_text(stmt.get(), 2))
                      .get<MatrixBinding>();
    } catch (const nlohmann::json::exception& e) {
      log::warn("Bad binding stored for {}: {}", r.id, e.what());
    }
    r.status = parse_job_status(col_text(stmt.get(), 3))
                   .value_or(JobStatus::Pending);
    r.cause = parse_failure_cause(col_text(stmt.get(), 4));
    if (sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL) {
      r.exit_code = sqlite3_column_int(stmt.get(), 5);
    }
    r.started_at = col_optional_time(stmt.get(), 6);
    r.finished_at = col_optional_time(stmt.get(), 7);
    r.error = col_text(stmt.get(), 8);
    r.output = col_text(stmt.get(), 9);

    if (r.status == JobStatus::Failed || r.status == JobStatus::Cancelled) {
      report.culprits.push_back(r.id);
    }
    report.instances.push_back(std::move(r));
  }
  return ok();
}

auto RunStore::list_runs(std::string_view workflow, std::size_t limit)
    -> Result<std::vector<RunSummary>> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }

  constexpr auto sql = R"(
    SELECT r.id, r.workflow, r.verdict, r.cancelled, r.started_at,
           r.finished_at, COUNT(i.instance_id),
           SUM(CASE WHEN i.status IN ('failed', 'cancelled') THEN 1 ELSE 0 END)
    FROM runs r LEFT JOIN job_instances i ON i.run_id = r.id
    WHERE ?1 = '' OR r.workflow = ?1
    GROUP BY r.id
    ORDER BY r.started_at DESC, r.id
    LIMIT ?2;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, workflow);
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

  std::vector<RunSummary> runs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    runs.push_back(
        {.run_id = RunId{col_text(stmt.get(), 0)},
         .workflow = col_text(stmt.get(), 1),
         .verdict = parse_verdict(col_text(stmt.get(), 2))
                        .value_or(Verdict::Failure),
         .cancelled = sqlite3_column_int(stmt.get(), 3) != 0,
         .started_at = sqlite3_column_int64(stmt.get(), 4),
         .finished_at = sqlite3_column_int64(stmt.get(), 5),
         .instance_count =
             static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 6)),
         .culprit_count =
             static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 7))});
  }
  return runs;
}

}  // namespace ciflow
