#pragma once

#include "tollgate/common/result.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tollgate::common {

/// Name -> shared instance cache. get_or_create runs the factory under the registry lock, so
/// concurrent first use of a name builds exactly one instance.
template <typename T> class Registry {
public:
  using Factory = std::function<std::shared_ptr<T>(const std::string &name)>;

  explicit Registry(Factory factory) : factory_(std::move(factory)) {}

  std::shared_ptr<T> get_or_create(const std::string &name) {
    return get_or_create(name, factory_);
  }

  std::shared_ptr<T> get_or_create(const std::string &name, const Factory &factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = instances_.find(name); it != instances_.end()) {
      return it->second;
    }
    auto created = factory(name);
    instances_.emplace(name, created);
    return created;
  }

  [[nodiscard]] std::shared_ptr<T> get(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = instances_.find(name);
    return it == instances_.end() ? nullptr : it->second;
  }

  [[nodiscard]] std::vector<std::pair<std::string, std::shared_ptr<T>>> all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {instances_.begin(), instances_.end()};
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
  }

  /// Forget every instance. Callers holding a shared_ptr keep a detached copy.
  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_.clear();
  }

private:
  Factory factory_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<T>> instances_;
};

template <typename Snapshot> class IStatsSource {
public:
  virtual ~IStatsSource() = default;

  [[nodiscard]] virtual Result<std::vector<Snapshot>> all_stats() const = 0;
};

} // namespace tollgate::common
