#include "flags/HelpText.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

#include "util/FileIO.hpp"

namespace selfaudit::flags {

bool FileHelpText::render(std::string& text, std::string& err) {
  auto content = util::read_file_string(path_);
  if (!content) {
    err = "cannot read help text from " + path_.string();
    return false;
  }
  text = std::move(*content);
  return true;
}

bool CommandHelpText::render(std::string& text, std::string& err) {
  if (command_.empty()) {
    err = "no help command configured";
    return false;
  }
  std::string cmd = command_ + " 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    err = "failed to run '" + command_ + "': " + std::strerror(errno);
    return false;
  }
  std::string out;
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) out.append(buf, n);
  int status = ::pclose(fp);
  // Many CLIs exit non-zero after printing --help; only fail when nothing came back
  bool failed = status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0;
  if (failed && out.empty()) {
    err = "help command '" + command_ + "' failed with status " + std::to_string(status);
    return false;
  }
  text = std::move(out);
  return true;
}

} // namespace selfaudit::flags
