#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "engine/AnalysisEngine.hpp"
#include "engine/IssueCollector.hpp"
#include "engine/Workspace.hpp"

namespace selfaudit::retention { class Reclaimer; }

namespace selfaudit::engine {

// Runs every registered engine concurrently against one shared disk workspace.
class Runner {
public:
  Runner(std::vector<std::shared_ptr<IAnalysisEngine>> engines,
         WorkspaceFactory factory,
         retention::Reclaimer* reclaimer = nullptr);

  void set_verbose(bool v) { verbose_ = v; }

  // Hard engine failures are joined into err; issues from the engines that
  // succeeded are still available through issues().
  [[nodiscard]] bool run(const AnalysisContext& ctx, const std::filesystem::path& root, std::string& err);

  [[nodiscard]] std::vector<model::Issue> issues() const { return collector_.issues(); }

private:
  std::vector<std::shared_ptr<IAnalysisEngine>> engines_;
  WorkspaceFactory factory_;
  retention::Reclaimer* reclaimer_{nullptr};
  IssueCollector collector_;
  bool verbose_{false};
};

} // namespace selfaudit::engine
