#include "engine/Runner.hpp"

#include <cstdio>
#include <mutex>
#include <thread>

#include "retention/Reclaimer.hpp"
#include "util/Format.hpp"

namespace selfaudit::engine {

Runner::Runner(std::vector<std::shared_ptr<IAnalysisEngine>> engines,
               WorkspaceFactory factory,
               retention::Reclaimer* reclaimer)
    : engines_(std::move(engines)), factory_(std::move(factory)), reclaimer_(reclaimer) {}

bool Runner::run(const AnalysisContext& ctx, const std::filesystem::path& root, std::string& err) {
  collector_.clear();
  std::shared_ptr<Workspace> ws;
  std::string ws_err;
  if (!factory_ || !factory_(WorkspaceKind::Disk, ws, ws_err) || !ws) {
    err = "failed to create workspace: " + (ws_err.empty() ? std::string("no workspace factory") : ws_err);
    return false;
  }
  if (reclaimer_) reclaimer_->register_workspace(ws);
  if (verbose_) {
    std::fprintf(stderr, "selfaudit: Runner: workspace %s, %zu engines\n",
                 util::sanitize_output(ws->root().string()).c_str(), engines_.size());
  }

  std::mutex err_mu;
  std::vector<std::string> failures;
  {
    std::vector<std::jthread> threads;
    threads.reserve(engines_.size());
    for (auto& eng : engines_) {
      // Engines observe the caller's token; the Runner itself never requests a stop
      threads.emplace_back([&, eng] {
        std::vector<model::Issue> found;
        std::string e;
        if (!eng->analyze(ctx, root, *ws, found, e)) {
          std::lock_guard<std::mutex> lk(err_mu);
          failures.push_back("engine " + eng->name() + " failed: " + e);
          return;
        }
        if (verbose_) {
          std::fprintf(stderr, "selfaudit: Runner: %s reported %zu issues\n", eng->name().c_str(), found.size());
        }
        collector_.collect(std::move(found));
      });
    }
  } // jthreads join here

  std::string cleanup_err;
  if (!ws->cleanup(cleanup_err)) {
    std::fprintf(stderr, "selfaudit: Runner: workspace cleanup failed: %s\n",
                 util::sanitize_output(cleanup_err).c_str());
  }

  if (!failures.empty()) {
    err = "analysis engines encountered errors: ";
    for (const auto& f : failures) { err += f; err += "; "; }
    return false;
  }
  return true;
}

} // namespace selfaudit::engine
