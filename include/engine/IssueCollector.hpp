#pragma once
#include <mutex>
#include <vector>

#include "model/Issue.hpp"

namespace selfaudit::engine {

// Thread-safe sink shared by concurrently running engines.
class IssueCollector {
public:
  void collect(std::vector<model::Issue> batch) {
    std::lock_guard<std::mutex> lk(mu_);
    issues_.insert(issues_.end(), std::make_move_iterator(batch.begin()),
                   std::make_move_iterator(batch.end()));
  }

  [[nodiscard]] std::vector<model::Issue> issues() const {
    std::lock_guard<std::mutex> lk(mu_);
    return issues_;
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return issues_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lk(mu_);
    issues_.clear();
  }

private:
  mutable std::mutex mu_;
  std::vector<model::Issue> issues_;
};

} // namespace selfaudit::engine
