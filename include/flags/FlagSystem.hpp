#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "engine/AnalysisEngine.hpp"
#include "flags/FieldNameMapper.hpp"
#include "flags/FlagLayout.hpp"
#include "flags/HelpText.hpp"
#include "model/FlagStatus.hpp"
#include "source/SourceModel.hpp"

namespace selfaudit::flags {

inline constexpr const char* kPresentInHelp = "Present in help output";
inline constexpr const char* kNotFoundInHelp = "Not found in help output";

// Audits a program's command-line flags against its implementation, its help
// text and its documentation. Phases run in order over one FlagStatus list:
// catalog -> classify -> cross_reference -> detect_conflicts -> validate.
class FlagSystem : public engine::IAnalysisEngine {
public:
  explicit FlagSystem(FlagLayout layout = {},
                      std::shared_ptr<source::ISourceModelProvider> provider = nullptr,
                      std::shared_ptr<IHelpTextRenderer> help = nullptr);

  const std::string& name() const override { return name_; }

  void set_verbose(bool v) { verbose_ = v; }
  void set_help_renderer(std::shared_ptr<IHelpTextRenderer> help) { help_ = std::move(help); }

  // Directory of the configuration package: the shallowest directory named
  // layout.config_package below root/layout.package_root.
  [[nodiscard]] bool locate_config_package(const std::filesystem::path& root,
                                           std::filesystem::path& dir, std::string& err) const;

  [[nodiscard]] bool catalog(const engine::AnalysisContext& ctx, const std::filesystem::path& root,
                             engine::Workspace& ws, std::vector<model::FlagStatus>& flags, std::string& err);
  [[nodiscard]] bool classify(const engine::AnalysisContext& ctx, const std::filesystem::path& root,
                              engine::Workspace& ws, std::vector<model::FlagStatus>& flags, std::string& err);
  [[nodiscard]] bool cross_reference(const engine::AnalysisContext& ctx, const std::filesystem::path& root,
                                     engine::Workspace& ws, std::vector<model::FlagStatus>& flags, std::string& err);
  // Appends conflicts; calling it twice on the same list duplicates them.
  void detect_conflicts(std::vector<model::FlagStatus>& flags) const;
  [[nodiscard]] bool validate(const engine::AnalysisContext& ctx, engine::Workspace& ws,
                              std::vector<model::FlagStatus>& flags, std::string& err);

  // All five phases. Only a cataloging failure is fatal; later phase errors
  // are logged and the list carries on with what it has.
  [[nodiscard]] bool reconcile(const engine::AnalysisContext& ctx, const std::filesystem::path& root,
                               engine::Workspace& ws, std::vector<model::FlagStatus>& flags, std::string& err);

  bool analyze(const engine::AnalysisContext& ctx, const std::filesystem::path& root, engine::Workspace& ws,
               std::vector<model::Issue>& issues, std::string& err) override;

  // Flags from the last analyze() call.
  [[nodiscard]] const std::vector<model::FlagStatus>& last_flags() const { return last_flags_; }

  [[nodiscard]] std::vector<model::Issue> report_issues(const std::filesystem::path& location,
                                                        const std::vector<model::FlagStatus>& flags) const;

private:
  std::string name_{"FlagSystem"};
  FlagLayout layout_;
  std::shared_ptr<source::ISourceModelProvider> provider_;
  std::shared_ptr<IHelpTextRenderer> help_;
  FieldNameMapper mapper_;
  std::vector<model::FlagStatus> last_flags_;
  bool verbose_{false};

  [[nodiscard]] bool config_sources(const std::filesystem::path& root, std::vector<std::filesystem::path>& files,
                                    std::string& err) const;
  [[nodiscard]] bool parse_registration(const source::Call& call, model::FlagStatus& out) const;
  [[nodiscard]] std::string read_combined(const std::filesystem::path& root,
                                          const std::vector<std::string>& rel_paths) const;
};

// Every distinct --flag token in text, in first-seen order.
[[nodiscard]] std::vector<std::string> extract_flag_tokens(const std::string& text);

} // namespace selfaudit::flags
