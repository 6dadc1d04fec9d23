#pragma once

#include "ciflow/core/error.hpp"
#include "ciflow/report/report.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ciflow {

// One row of `ciflow history`.
struct RunSummary {
  RunId run_id;
  std::string workflow;
  Verdict verdict{Verdict::Success};
  bool cancelled{false};
  std::int64_t started_at{0};  // ms since epoch
  std::int64_t finished_at{0};
  std::size_t instance_count{0};
  std::size_t culprit_count{0};
};

// SQLite history of finished runs.
class RunStore {
public:
  explicit RunStore(std::string_view db_path);
  ~RunStore();

  RunStore(const RunStore&) = delete;
  RunStore& operator=(const RunStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  // Replaces any earlier copy of the same run.
  [[nodiscard]] auto save_report(const RunReport& report) -> Result<void>;
  [[nodiscard]] auto get_report(std::string_view run_id) -> Result<RunReport>;
  [[nodiscard]] auto get_instances(std::string_view run_id)
      -> Result<std::vector<InstanceReport>>;
  // Newest first. An empty workflow matches all.
  [[nodiscard]] auto list_runs(std::string_view workflow = "",
                               std::size_t limit = 20)
      -> Result<std::vector<RunSummary>>;

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto save_instances(const RunReport& report) -> Result<void>;
  [[nodiscard]] auto load_instances(RunReport& report) -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace ciflow
