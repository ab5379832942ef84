#include "tollgate/cost/ledger.hpp"

namespace tollgate::cost {

namespace {

constexpr const char *NOT_OPEN = "usage ledger not initialized";

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message);
  }
  return common::Status::success();
}

void bind_optional(sqlite3_stmt *stmt, const int index, const std::optional<std::string> &value) {
  if (value.has_value()) {
    sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, index);
  }
}

std::optional<std::string> column_optional(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  if (text == nullptr) {
    return std::nullopt;
  }
  return std::string(text);
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  return column_optional(stmt, index).value_or("");
}

LedgerEntry row_to_entry(sqlite3_stmt *stmt) {
  LedgerEntry entry;
  entry.tracker = column_text(stmt, 0);
  entry.record.provider = column_text(stmt, 1);
  entry.record.model = column_text(stmt, 2);
  entry.record.input_tokens = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
  entry.record.output_tokens = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
  entry.record.estimated_cost_usd = sqlite3_column_double(stmt, 5);
  entry.record.layer = column_optional(stmt, 6);
  entry.record.run_id = column_optional(stmt, 7);
  entry.record.scope = column_optional(stmt, 8);
  entry.record.timestamp = common::from_unix_seconds(sqlite3_column_double(stmt, 9));
  return entry;
}

} // namespace

UsageLedger::UsageLedger(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ != nullptr ? sqlite3_errmsg(db_) : "sqlite3_open failed";
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  const auto schema = init_schema();
  if (!schema.ok()) {
    open_error_ = schema.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

UsageLedger::~UsageLedger() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status UsageLedger::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS usage_records (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  tracker TEXT NOT NULL,
  provider TEXT NOT NULL,
  model TEXT NOT NULL,
  input_tokens INTEGER NOT NULL,
  output_tokens INTEGER NOT NULL,
  cost_usd REAL NOT NULL,
  layer TEXT,
  run_id TEXT,
  scope TEXT,
  recorded_at REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_usage_run ON usage_records(run_id);
CREATE INDEX IF NOT EXISTS idx_usage_recorded_at ON usage_records(recorded_at);
)");
}

common::Status UsageLedger::append(const std::string &tracker, const UsageRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(open_error_.empty() ? NOT_OPEN : NOT_OPEN + (": " + open_error_));
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO usage_records(tracker, provider, model, input_tokens, "
                    "output_tokens, cost_usd, layer, run_id, scope, recorded_at) "
                    "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, tracker.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, record.provider.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.model.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.input_tokens));
  sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(record.output_tokens));
  sqlite3_bind_double(stmt, 6, record.estimated_cost_usd);
  bind_optional(stmt, 7, record.layer);
  bind_optional(stmt, 8, record.run_id);
  bind_optional(stmt, 9, record.scope);
  sqlite3_bind_double(stmt, 10, common::to_unix_seconds(record.timestamp));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::vector<LedgerEntry>>
UsageLedger::entries(const UsageFilter &filter, const std::optional<std::string> &tracker) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<LedgerEntry>>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT tracker, provider, model, input_tokens, output_tokens, cost_usd, "
                    "layer, run_id, scope, recorded_at FROM usage_records "
                    "WHERE (?1 IS NULL OR run_id = ?1) AND (?2 IS NULL OR scope = ?2) "
                    "AND (?3 IS NULL OR tracker = ?3) ORDER BY id ASC";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<LedgerEntry>>::failure(sqlite3_errmsg(db_));
  }
  bind_optional(stmt, 1, filter.run_id);
  bind_optional(stmt, 2, filter.scope);
  bind_optional(stmt, 3, tracker);

  std::vector<LedgerEntry> out;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_entry(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<LedgerEntry>>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::vector<LedgerEntry>>::success(std::move(out));
}

common::Result<UsageSummary> UsageLedger::summary(const UsageFilter &filter,
                                                  const std::optional<std::string> &tracker) {
  auto rows = entries(filter, tracker);
  if (!rows.ok()) {
    return common::Result<UsageSummary>::failure(rows.error());
  }
  std::vector<UsageRecord> records;
  records.reserve(rows.value().size());
  for (auto &entry : rows.value()) {
    records.push_back(std::move(entry.record));
  }
  return common::Result<UsageSummary>::success(summarize(records));
}

common::Result<std::vector<CostBucket>> UsageLedger::costs(const CostPeriod period,
                                                           const std::size_t count,
                                                           const common::TimePoint now,
                                                           const UsageFilter &filter) {
  if (const auto checked = check_bucket_count(period, count); !checked.ok()) {
    return common::Result<std::vector<CostBucket>>::failure(checked.error());
  }
  auto rows = entries(filter);
  if (!rows.ok()) {
    return common::Result<std::vector<CostBucket>>::failure(rows.error());
  }
  std::vector<UsageRecord> records;
  records.reserve(rows.value().size());
  for (auto &entry : rows.value()) {
    records.push_back(std::move(entry.record));
  }
  return common::Result<std::vector<CostBucket>>::success(
      bucket_costs(records, period, count, now));
}

common::Result<std::uint64_t> UsageLedger::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::uint64_t>::failure(NOT_OPEN);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM usage_records", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::uint64_t>::failure(sqlite3_errmsg(db_));
  }
  std::uint64_t total = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    total = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return common::Result<std::uint64_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::uint64_t>::success(total);
}

} // namespace tollgate::cost
