#pragma once
#include <filesystem>
#include <string>

namespace selfaudit::flags {

// Source of the audited program's rendered help text.
class IHelpTextRenderer {
public:
  virtual ~IHelpTextRenderer() = default;
  [[nodiscard]] virtual bool render(std::string& text, std::string& err) = 0;
};

class StaticHelpText : public IHelpTextRenderer {
public:
  explicit StaticHelpText(std::string text) : text_(std::move(text)) {}
  bool render(std::string& text, std::string&) override { text = text_; return true; }

private:
  std::string text_;
};

class FileHelpText : public IHelpTextRenderer {
public:
  explicit FileHelpText(std::filesystem::path path) : path_(std::move(path)) {}
  bool render(std::string& text, std::string& err) override;

private:
  std::filesystem::path path_;
};

// Runs a shell command and captures its stdout (stderr discarded).
class CommandHelpText : public IHelpTextRenderer {
public:
  explicit CommandHelpText(std::string command) : command_(std::move(command)) {}
  bool render(std::string& text, std::string& err) override;

private:
  std::string command_;
};

} // namespace selfaudit::flags
