#include "minitest.hpp"
#include "engine/AnalysisEngine.hpp"
#include "engine/IssueCollector.hpp"
#include "engine/Runner.hpp"
#include "retention/Reclaimer.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace selfaudit;
using engine::AnalysisContext;
using engine::Workspace;

static model::Issue make_issue(const std::string& id) {
  model::Issue i{};
  i.id = id;
  return i;
}

class FixedEngine : public engine::IAnalysisEngine {
public:
  FixedEngine(std::string name, int n_issues, bool fail)
      : name_(std::move(name)), n_(n_issues), fail_(fail) {}
  const std::string& name() const override { return name_; }
  bool analyze(const AnalysisContext&, const fs::path&, Workspace& ws, std::vector<model::Issue>& issues,
               std::string& err) override {
    std::string werr;
    if (!ws.write_file(name_ + "/marker.txt", "x", werr)) { err = werr; return false; }
    seen_root = ws.root();
    if (fail_) { err = "cannot read root path"; return false; }
    for (int i = 0; i < n_; ++i) issues.push_back(make_issue(name_ + "-" + std::to_string(i)));
    return true;
  }
  fs::path seen_root;

private:
  std::string name_;
  int n_;
  bool fail_;
};

static fs::path make_base(const char* tag) {
  auto base = fs::temp_directory_path() / ("selfaudit_test_runner_" + std::string(tag) + "_" + std::to_string(::getpid()));
  fs::create_directories(base);
  return base;
}

TEST(issue_collector_returns_copy) {
  engine::IssueCollector c;
  c.collect({make_issue("A"), make_issue("B")});
  auto copy = c.issues();
  copy[0].id = "mutated";
  copy.clear();
  ASSERT_EQ(c.size(), 2u);
  ASSERT_EQ(c.issues()[0].id, "A");
}

TEST(issue_collector_concurrent_collect) {
  engine::IssueCollector c;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
      threads.emplace_back([&c] {
        for (int i = 0; i < 100; ++i) c.collect({make_issue("x")});
      });
    }
  }
  ASSERT_EQ(c.size(), 800u);
}

TEST(base_engine_absorbs_task_failure) {
  engine::BaseEngine eng("Composite");
  eng.register_task([](const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>& out, std::string&) {
    out.push_back(make_issue("FIRST"));
    return true;
  });
  eng.register_task([](const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>& out, std::string& err) {
    out.push_back(make_issue("DISCARDED"));
    err = "tool not installed";
    return false;
  });
  eng.register_task([](const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>& out, std::string&) {
    out.push_back(make_issue("THIRD"));
    return true;
  });
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_TRUE(eng.analyze(AnalysisContext{}, "/proj", ws, issues, err));
  ASSERT_EQ(issues.size(), 3u);
  ASSERT_EQ(issues[0].id, "FIRST");
  ASSERT_EQ(issues[1].id, "ENGINE-TASK-FAILURE");
  ASSERT_EQ(issues[1].title, "Task failed in Composite");
  ASSERT_EQ(issues[1].description, "tool not installed");
  ASSERT_EQ(issues[1].location, "/proj");
  ASSERT_TRUE(issues[1].category == model::Category::CodeQuality);
  ASSERT_TRUE(issues[1].severity == model::Severity::Medium);
  ASSERT_TRUE(issues[1].priority == model::Priority::P2);
  ASSERT_EQ(issues[2].id, "THIRD");
}

TEST(base_engine_stops_scheduling_when_cancelled) {
  std::stop_source src;
  engine::BaseEngine eng("Cancellable");
  int ran = 0;
  eng.register_task([&](const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>& out, std::string&) {
    ++ran;
    out.push_back(make_issue("KEPT"));
    src.request_stop();
    return true;
  });
  eng.register_task([&](const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>&, std::string&) {
    ++ran;
    return true;
  });
  engine::MemoryWorkspace ws;
  std::vector<model::Issue> issues;
  std::string err;
  ASSERT_TRUE(eng.analyze(AnalysisContext{.stop = src.get_token()}, "/p", ws, issues, err));
  ASSERT_EQ(ran, 1);
  ASSERT_EQ(issues.size(), 1u);
  ASSERT_EQ(issues[0].id, "KEPT");
}

TEST(context_deadline_counts_as_cancelled) {
  AnalysisContext ctx{};
  ASSERT_FALSE(ctx.cancelled());
  ctx.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
  ASSERT_TRUE(ctx.cancelled());
}

TEST(runner_collects_from_successes_and_joins_failures) {
  auto base = make_base("mixed");
  auto bad = std::make_shared<FixedEngine>("Broken", 0, true);
  auto good = std::make_shared<FixedEngine>("Healthy", 2, false);
  engine::Runner runner({bad, good}, engine::default_workspace_factory(base));
  std::string err;
  ASSERT_FALSE(runner.run(AnalysisContext{}, base, err));
  ASSERT_TRUE(err.rfind("analysis engines encountered errors: ", 0) == 0);
  ASSERT_TRUE(err.find("engine Broken failed: cannot read root path; ") != std::string::npos);
  auto issues = runner.issues();
  ASSERT_EQ(issues.size(), 2u);
  // one shared workspace, disposed at the end
  ASSERT_EQ(bad->seen_root, good->seen_root);
  ASSERT_FALSE(fs::exists(good->seen_root));
  fs::remove_all(base);
}

TEST(runner_lists_every_failing_engine) {
  auto base = make_base("allfail");
  engine::Runner runner({std::make_shared<FixedEngine>("A", 0, true), std::make_shared<FixedEngine>("B", 0, true)},
                        engine::default_workspace_factory(base));
  std::string err;
  ASSERT_FALSE(runner.run(AnalysisContext{}, base, err));
  ASSERT_TRUE(err.find("engine A failed") != std::string::npos);
  ASSERT_TRUE(err.find("engine B failed") != std::string::npos);
  ASSERT_TRUE(runner.issues().empty());
  fs::remove_all(base);
}

TEST(runner_success_registers_workspace_with_reclaimer) {
  auto base = make_base("ok");
  retention::Reclaimer reclaimer(false, [](const fs::path&) { return std::optional<double>(10.0); });
  auto e = std::make_shared<FixedEngine>("Solo", 3, false);
  engine::Runner runner({e}, engine::default_workspace_factory(base), &reclaimer);
  std::string err;
  ASSERT_TRUE(runner.run(AnalysisContext{}, base, err));
  ASSERT_EQ(runner.issues().size(), 3u);
  ASSERT_EQ(reclaimer.tracked_workspaces(), 1u);
  fs::remove_all(base);
}

TEST(runner_second_run_reports_only_its_own_issues) {
  auto base = make_base("rerun");
  auto e = std::make_shared<FixedEngine>("Solo", 3, false);
  engine::Runner runner({e}, engine::default_workspace_factory(base));
  std::string err;
  ASSERT_TRUE(runner.run(AnalysisContext{}, base, err));
  ASSERT_EQ(runner.issues().size(), 3u);
  ASSERT_TRUE(runner.run(AnalysisContext{}, base, err));
  ASSERT_EQ(runner.issues().size(), 3u);
  fs::remove_all(base);
}

TEST(runner_fails_before_engines_when_workspace_cannot_be_created) {
  std::atomic<int> calls{0};
  struct Counting : engine::IAnalysisEngine {
    std::atomic<int>& calls;
    std::string n{"Counting"};
    explicit Counting(std::atomic<int>& c) : calls(c) {}
    const std::string& name() const override { return n; }
    bool analyze(const AnalysisContext&, const fs::path&, Workspace&, std::vector<model::Issue>&, std::string&) override {
      ++calls;
      return true;
    }
  };
  engine::WorkspaceFactory failing = [](engine::WorkspaceKind, std::shared_ptr<Workspace>&, std::string& err) {
    err = "disk full";
    return false;
  };
  engine::Runner runner({std::make_shared<Counting>(calls)}, failing);
  std::string err;
  ASSERT_FALSE(runner.run(AnalysisContext{}, "/", err));
  ASSERT_TRUE(err.find("disk full") != std::string::npos);
  ASSERT_EQ(calls.load(), 0);
}
