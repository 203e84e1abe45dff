#include "util/FileIO.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace selfaudit::util {

namespace fs = std::filesystem;

auto read_file_string(const fs::path& p) -> std::optional<std::string> {
  std::ifstream in(p, std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return s;
}

bool dir_size(const fs::path& p, uint64_t& bytes, std::string& err) {
  bytes = 0;
  std::error_code ec;
  auto st = fs::symlink_status(p, ec);
  if (ec) { err = p.string() + ": " + ec.message(); return false; }
  if (fs::is_regular_file(st)) {
    auto sz = fs::file_size(p, ec);
    if (ec) { err = p.string() + ": " + ec.message(); return false; }
    bytes = sz;
    return true;
  }
  if (!fs::is_directory(st)) return true;

  fs::recursive_directory_iterator it(p, fs::directory_options::none, ec);
  if (ec) { err = p.string() + ": " + ec.message(); return false; }
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) { err = p.string() + ": " + ec.message(); return false; }
    std::error_code fec;
    if (it->is_symlink(fec)) continue;
    if (it->is_regular_file(fec)) {
      auto sz = it->file_size(fec);
      if (!fec) bytes += sz;
    }
  }
  if (ec) { err = p.string() + ": " + ec.message(); return false; }
  return true;
}

bool write_file_string(const fs::path& p, const std::string& content, std::string& err) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) {
    err = p.string() + ": " + std::strerror(errno);
    return false;
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    err = p.string() + ": write failed";
    return false;
  }
  return true;
}

} // namespace selfaudit::util
