#pragma once
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace selfaudit::engine {

enum class WorkspaceKind { Memory, Disk };

// Disposable scratch storage handed to engines. Relative paths are resolved
// against the backend root; any path that could escape it ('..' segments,
// absolute paths) is refused on both read and write.
class Workspace {
public:
  virtual ~Workspace() = default;

  [[nodiscard]] virtual WorkspaceKind kind() const = 0;
  [[nodiscard]] bool is_disk() const { return kind() == WorkspaceKind::Disk; }

  // Backend root: the unique directory for disk, "/" for memory.
  [[nodiscard]] virtual const std::filesystem::path& root() const = 0;

  [[nodiscard]] std::filesystem::path path(std::initializer_list<std::string_view> segments) const;

  [[nodiscard]] virtual bool write_file(std::string_view rel, std::string_view bytes, std::string& err) = 0;
  [[nodiscard]] virtual bool read_file(std::string_view rel, std::string& bytes, std::string& err) const = 0;

  // Release the backing storage. Idempotent.
  [[nodiscard]] virtual bool cleanup(std::string& err) = 0;
  [[nodiscard]] virtual bool disposed() const = 0;

protected:
  [[nodiscard]] static bool check_relative(std::string_view rel, std::string& err);
};

class MemoryWorkspace : public Workspace {
public:
  MemoryWorkspace();
  WorkspaceKind kind() const override { return WorkspaceKind::Memory; }
  const std::filesystem::path& root() const override { return root_; }
  bool write_file(std::string_view rel, std::string_view bytes, std::string& err) override;
  bool read_file(std::string_view rel, std::string& bytes, std::string& err) const override;
  bool cleanup(std::string& err) override;
  bool disposed() const override;

private:
  std::filesystem::path root_{"/"};
  mutable std::mutex mu_;
  // Null once disposed
  std::unique_ptr<std::map<std::string, std::string>> files_;
};

class DiskWorkspace : public Workspace {
  // Only create() can mint a Key, so construction always goes through mkdtemp
  class Key {
    friend class DiskWorkspace;
    Key() = default;
  };

public:
  DiskWorkspace(Key, std::filesystem::path root) : root_(std::move(root)) {}

  // Creates <base_dir>/selfaudit-workspace-XXXXXX with a unique suffix.
  [[nodiscard]] static bool create(const std::filesystem::path& base_dir,
                                   std::shared_ptr<DiskWorkspace>& out, std::string& err);
  ~DiskWorkspace() override = default;
  DiskWorkspace(const DiskWorkspace&) = delete;
  DiskWorkspace& operator=(const DiskWorkspace&) = delete;

  WorkspaceKind kind() const override { return WorkspaceKind::Disk; }
  const std::filesystem::path& root() const override { return root_; }
  bool write_file(std::string_view rel, std::string_view bytes, std::string& err) override;
  bool read_file(std::string_view rel, std::string& bytes, std::string& err) const override;
  bool cleanup(std::string& err) override;
  bool disposed() const override;

private:
  std::filesystem::path root_;
  mutable std::mutex mu_;
  bool disposed_{false};
};

// Creates workspaces on behalf of the Runner and orchestration code, so that
// tests can substitute their own backend or base directory.
using WorkspaceFactory =
    std::function<bool(WorkspaceKind, std::shared_ptr<Workspace>&, std::string&)>;

[[nodiscard]] WorkspaceFactory default_workspace_factory(std::filesystem::path base_dir);

// SELFAUDIT_TMPDIR, then TMPDIR, then the system temp directory.
[[nodiscard]] std::filesystem::path default_scratch_dir();

} // namespace selfaudit::engine
