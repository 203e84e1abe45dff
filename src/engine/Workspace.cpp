#include "engine/Workspace.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

namespace selfaudit::engine {

namespace fs = std::filesystem;

// '.' and '..' components are dropped so the result never leaves root()
fs::path Workspace::path(std::initializer_list<std::string_view> segments) const {
  fs::path p = root();
  for (auto seg : segments) {
    for (const auto& part : fs::path(seg).relative_path()) {
      if (part.empty() || part == "." || part == "..") continue;
      p /= part;
    }
  }
  return p;
}

bool Workspace::check_relative(std::string_view rel, std::string& err) {
  fs::path p(rel);
  bool bad = p.has_root_path() || p.has_root_directory();
  for (const auto& part : p) {
    if (part == "..") { bad = true; break; }
  }
  if (bad) {
    err = "path traversal not allowed: " + std::string(rel);
    return false;
  }
  if (rel.empty()) {
    err = "empty workspace path";
    return false;
  }
  // "a/" and "a/." name a directory, not a file
  if (p.filename().empty() || p.filename() == ".") {
    err = "not a file path: " + std::string(rel);
    return false;
  }
  return true;
}

// ---- memory backend ----

MemoryWorkspace::MemoryWorkspace()
    : files_(std::make_unique<std::map<std::string, std::string>>()) {}

static std::string memory_key(std::string_view rel) {
  return (fs::path("/") / fs::path(rel)).lexically_normal().string();
}

bool MemoryWorkspace::write_file(std::string_view rel, std::string_view bytes, std::string& err) {
  if (!check_relative(rel, err)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  if (!files_) { err = "workspace disposed"; return false; }
  (*files_)[memory_key(rel)] = std::string(bytes);
  return true;
}

bool MemoryWorkspace::read_file(std::string_view rel, std::string& bytes, std::string& err) const {
  if (!check_relative(rel, err)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  if (!files_) { err = "workspace disposed"; return false; }
  auto key = memory_key(rel);
  auto it = files_->find(key);
  if (it == files_->end()) {
    err = "open " + key + ": file does not exist";
    return false;
  }
  bytes = it->second;
  return true;
}

bool MemoryWorkspace::cleanup(std::string&) {
  std::lock_guard<std::mutex> lk(mu_);
  files_.reset();
  return true;
}

bool MemoryWorkspace::disposed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return !files_;
}

// ---- disk backend ----

bool DiskWorkspace::create(const fs::path& base_dir, std::shared_ptr<DiskWorkspace>& out, std::string& err) {
  std::string tmpl = (base_dir / "selfaudit-workspace-XXXXXX").string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    err = "failed to create workspace root: " + tmpl + ": " + std::strerror(errno);
    return false;
  }
  out = std::make_shared<DiskWorkspace>(Key{}, fs::path(buf.data()));
  return true;
}

bool DiskWorkspace::write_file(std::string_view rel, std::string_view bytes, std::string& err) {
  if (!check_relative(rel, err)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  if (disposed_) { err = "workspace disposed"; return false; }
  auto target = path({rel});
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    err = "mkdir " + target.parent_path().string() + ": " + ec.message();
    return false;
  }
  std::ofstream f(target, std::ios::binary | std::ios::trunc);
  if (!f) {
    err = "open " + target.string() + ": " + std::strerror(errno);
    return false;
  }
  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!f) {
    err = "write " + target.string() + ": short write";
    return false;
  }
  return true;
}

bool DiskWorkspace::read_file(std::string_view rel, std::string& bytes, std::string& err) const {
  if (!check_relative(rel, err)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  if (disposed_) { err = "workspace disposed"; return false; }
  auto target = path({rel});
  std::ifstream f(target, std::ios::binary);
  if (!f) {
    err = "open " + target.string() + ": " + std::strerror(errno);
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return true;
}

bool DiskWorkspace::cleanup(std::string& err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (disposed_) return true;
  std::error_code ec;
  fs::remove_all(root_, ec);  // an already-absent root is not an error
  if (ec) {
    err = "remove " + root_.string() + ": " + ec.message();
    return false;
  }
  disposed_ = true;
  return true;
}

bool DiskWorkspace::disposed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return disposed_;
}

// ---- factory ----

WorkspaceFactory default_workspace_factory(fs::path base_dir) {
  return [base = std::move(base_dir)](WorkspaceKind kind, std::shared_ptr<Workspace>& out, std::string& err) {
    if (kind == WorkspaceKind::Memory) {
      out = std::make_shared<MemoryWorkspace>();
      return true;
    }
    std::shared_ptr<DiskWorkspace> ws;
    if (!DiskWorkspace::create(base, ws, err)) return false;
    out = std::move(ws);
    return true;
  };
}

fs::path default_scratch_dir() {
  if (const char* v = std::getenv("SELFAUDIT_TMPDIR"); v && *v) return fs::path(v);
  if (const char* v = std::getenv("TMPDIR"); v && *v) return fs::path(v);
  std::error_code ec;
  auto p = fs::temp_directory_path(ec);
  if (ec) return fs::path("/tmp");
  return p;
}

} // namespace selfaudit::engine
