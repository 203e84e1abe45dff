#include "engine/AnalysisEngine.hpp"

#include <cstdio>

#include "util/Format.hpp"

namespace selfaudit::engine {

model::Issue task_failure_issue(const std::string& engine_name,
                                const std::string& cause,
                                const std::filesystem::path& root) {
  model::Issue issue{};
  issue.id = "ENGINE-TASK-FAILURE";
  issue.category = model::Category::CodeQuality;
  issue.severity = model::Severity::Medium;
  issue.priority = model::Priority::P2;
  issue.title = "Task failed in " + engine_name;
  issue.description = cause;
  issue.location = root.string();
  issue.suggestion = "Check logs and environment settings.";
  issue.effort = model::Effort::Small;
  issue.status = model::IssueStatus::Pending;
  return issue;
}

bool BaseEngine::analyze(const AnalysisContext& ctx,
                         const std::filesystem::path& root,
                         Workspace& ws,
                         std::vector<model::Issue>& issues,
                         std::string& /*err*/) {
  for (auto& task : tasks_) {
    if (ctx.cancelled()) break;
    std::vector<model::Issue> found;
    std::string task_err;
    if (!task(ctx, root, ws, found, task_err)) {
      std::fprintf(stderr, "selfaudit: %s: task failed: %s\n", name_.c_str(),
                   util::sanitize_output(task_err).c_str());
      issues.push_back(task_failure_issue(name_, task_err, root));
      continue;
    }
    issues.insert(issues.end(), std::make_move_iterator(found.begin()),
                  std::make_move_iterator(found.end()));
  }
  return true;
}

} // namespace selfaudit::engine
