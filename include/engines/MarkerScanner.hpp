#pragma once
#include <string>
#include <vector>

#include "engine/AnalysisEngine.hpp"

namespace selfaudit::engines {

// Reports TODO/FIXME/HACK/XXX markers left in source comments.
class MarkerScanner : public engine::BaseEngine {
public:
  explicit MarkerScanner(std::vector<std::string> extensions = {".go", ".c", ".cc", ".cpp", ".h", ".hpp"});

  // An unreadable root fails the engine instead of becoming a task issue.
  bool analyze(const engine::AnalysisContext& ctx, const std::filesystem::path& root, engine::Workspace& ws,
               std::vector<model::Issue>& issues, std::string& err) override;

private:
  std::vector<std::string> extensions_;

  [[nodiscard]] bool scan(const engine::AnalysisContext& ctx, const std::filesystem::path& root,
                          engine::Workspace& ws, std::vector<model::Issue>& issues, std::string& err) const;
};

// Walks root and returns source files with one of the extensions, skipping
// hidden directories and common build/vendor output. Sorted.
[[nodiscard]] bool collect_source_files(const std::filesystem::path& root,
                                        const std::vector<std::string>& extensions,
                                        std::vector<std::filesystem::path>& out, std::string& err);

} // namespace selfaudit::engines
