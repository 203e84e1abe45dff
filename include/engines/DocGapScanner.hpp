#pragma once
#include <memory>
#include <string>
#include <vector>

#include "engine/AnalysisEngine.hpp"
#include "source/SourceModel.hpp"

namespace selfaudit::engines {

// Reports exported symbols that carry no documentation comment.
class DocGapScanner : public engine::BaseEngine {
public:
  explicit DocGapScanner(std::shared_ptr<source::ISourceModelProvider> provider = nullptr,
                         std::vector<std::string> extensions = {".go"});

private:
  std::shared_ptr<source::ISourceModelProvider> provider_;
  std::vector<std::string> extensions_;
};

} // namespace selfaudit::engines
