#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "engine/Workspace.hpp"
#include "model/Issue.hpp"

namespace selfaudit::engine {

// Cancellation scope handed to every engine and task. Engines poll cancelled()
// in long loops; nothing is preempted.
struct AnalysisContext {
  std::stop_token stop{};
  std::optional<std::chrono::steady_clock::time_point> deadline{};

  [[nodiscard]] bool cancelled() const {
    if (stop.stop_requested()) return true;
    return deadline && std::chrono::steady_clock::now() >= *deadline;
  }
};

// One analysis engine. analyze() appends findings to issues; a false return is
// a hard failure that the Runner reports with the engine's name.
class IAnalysisEngine {
public:
  virtual ~IAnalysisEngine() = default;

  [[nodiscard]] virtual const std::string& name() const = 0;

  [[nodiscard]] virtual bool analyze(const AnalysisContext& ctx,
                                     const std::filesystem::path& root,
                                     Workspace& ws,
                                     std::vector<model::Issue>& issues,
                                     std::string& err) = 0;
};

using AnalysisTask = std::function<bool(const AnalysisContext&,
                                        const std::filesystem::path&,
                                        Workspace&,
                                        std::vector<model::Issue>&,
                                        std::string&)>;

// Engine built from an ordered list of tasks. A failing task becomes an
// ENGINE-TASK-FAILURE issue instead of failing the engine.
class BaseEngine : public IAnalysisEngine {
public:
  explicit BaseEngine(std::string name) : name_(std::move(name)) {}

  const std::string& name() const override { return name_; }

  void register_task(AnalysisTask task) { tasks_.push_back(std::move(task)); }

  bool analyze(const AnalysisContext& ctx,
               const std::filesystem::path& root,
               Workspace& ws,
               std::vector<model::Issue>& issues,
               std::string& err) override;

private:
  std::string name_;
  std::vector<AnalysisTask> tasks_;
};

[[nodiscard]] model::Issue task_failure_issue(const std::string& engine_name,
                                              const std::string& cause,
                                              const std::filesystem::path& root);

} // namespace selfaudit::engine
