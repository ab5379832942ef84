#pragma once

#include "tollgate/common/result.hpp"
#include "tollgate/cost/cost_tracker.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace tollgate::cost {

struct LedgerEntry {
  std::string tracker;
  UsageRecord record;
};

/// SQLite export of tracked usage for offline audit. Trackers write through it; nothing reads it
/// back into tracker state.
class UsageLedger final : public IUsageSink {
public:
  explicit UsageLedger(std::filesystem::path db_path);
  ~UsageLedger() override;

  UsageLedger(const UsageLedger &) = delete;
  UsageLedger &operator=(const UsageLedger &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

  common::Status append(const std::string &tracker, const UsageRecord &record) override;

  [[nodiscard]] common::Result<std::vector<LedgerEntry>>
  entries(const UsageFilter &filter = {},
          const std::optional<std::string> &tracker = std::nullopt);
  [[nodiscard]] common::Result<UsageSummary>
  summary(const UsageFilter &filter = {},
          const std::optional<std::string> &tracker = std::nullopt);
  [[nodiscard]] common::Result<std::vector<CostBucket>>
  costs(CostPeriod period, std::size_t count, common::TimePoint now,
        const UsageFilter &filter = {});
  [[nodiscard]] common::Result<std::uint64_t> count();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace tollgate::cost
