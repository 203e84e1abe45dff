#include "engines/DocGapScanner.hpp"

#include "engines/MarkerScanner.hpp"

namespace selfaudit::engines {

namespace fs = std::filesystem;

static bool is_test_file(const fs::path& p) {
  auto stem = p.stem().string();
  return stem.size() > 5 && stem.compare(stem.size() - 5, 5, "_test") == 0;
}

DocGapScanner::DocGapScanner(std::shared_ptr<source::ISourceModelProvider> provider,
                             std::vector<std::string> extensions)
    : BaseEngine("Documentation"),
      provider_(provider ? std::move(provider) : std::make_shared<source::TokenSourceModelProvider>()),
      extensions_(std::move(extensions)) {
  register_task([this](const engine::AnalysisContext& ctx, const fs::path& root, engine::Workspace&,
                       std::vector<model::Issue>& issues, std::string& err) {
    std::vector<fs::path> files;
    if (!collect_source_files(root, extensions_, files, err)) return false;
    for (const auto& file : files) {
      if (ctx.cancelled()) break;
      if (is_test_file(file)) continue;
      source::SourceModel sm;
      std::string perr;
      if (!provider_->parse_file(file, sm, perr)) continue;
      for (const auto& sym : sm.symbols) {
        if (!sym.exported || sym.documented) continue;
        model::Issue i{};
        i.id = "DOC-MISSING-COMMENT";
        i.category = model::Category::Documentation;
        i.severity = model::Severity::Low;
        i.priority = model::Priority::P3;
        i.effort = model::Effort::Small;
        i.title = "Exported symbol '" + sym.name + "' is undocumented";
        i.description = "The exported symbol '" + sym.name + "' has no documentation comment.";
        i.location = file.string() + ":" + std::to_string(sym.line);
        i.suggestion = "Add a doc comment describing '" + sym.name + "'.";
        issues.push_back(std::move(i));
      }
    }
    return true;
  });
}

} // namespace selfaudit::engines
