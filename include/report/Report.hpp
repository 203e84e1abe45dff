#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "model/FlagStatus.hpp"
#include "model/Issue.hpp"

namespace selfaudit::report {

// Stable: priority (P0 first), then severity (Critical first).
void sort_issues(std::vector<model::Issue>& issues);

// Markdown table, one row per flag.
[[nodiscard]] std::string render_flag_report(const std::vector<model::FlagStatus>& flags);

// RFC 4180 CSV with a header row.
[[nodiscard]] std::string render_issues_csv(const std::vector<model::Issue>& issues);

// Markdown counts by severity and category.
[[nodiscard]] std::string render_summary(const std::vector<model::Issue>& issues);

[[nodiscard]] std::string csv_field(const std::string& value);

// Writes each {filename, content} into latest_dir (created as needed).
[[nodiscard]] bool write_latest(const std::filesystem::path& latest_dir,
                                const std::vector<std::pair<std::string, std::string>>& files,
                                std::string& err);

} // namespace selfaudit::report
