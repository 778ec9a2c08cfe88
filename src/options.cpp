#include "stackgit/options.hpp"

#include "stackgit/fs.hpp"
#include "stackgit/util.hpp"

#include <cstdlib>
#include <system_error>
#include <sstream>
#include <string_view>

namespace stackgit {

Options load_options(const std::filesystem::path &file) {
  Options out{};
  std::error_code ec;
  if (file.empty() || !std::filesystem::exists(file, ec))
    return out;

  const auto bytes = fs::read_file(file);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_git = "git:";
  constexpr std::string_view k_level = "log-level:";
  constexpr std::string_view k_style = "conflict-style:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.rfind(k_git, 0) == 0) {
      out.git_executable = strutil::trim(sv.substr(k_git.size()));
    } else if (sv.rfind(k_level, 0) == 0) {
      out.log_level = strutil::trim(sv.substr(k_level.size()));
    } else if (sv.rfind(k_style, 0) == 0) {
      out.merge_conflict_style = strutil::trim(sv.substr(k_style.size()));
    }
  }
  return out;
}

void apply_env_overrides(Options &opts) {
  if (const char *v = std::getenv("STACKGIT_GIT"); v && *v)
    opts.git_executable = v;
  if (const char *v = std::getenv("STACKGIT_LOG_LEVEL"); v && *v)
    opts.log_level = v;
  if (const char *v = std::getenv("STACKGIT_CONFLICT_STYLE"); v && *v)
    opts.merge_conflict_style = v;
}

std::filesystem::path default_options_path() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "stackgit" / "config";
  if (const char *home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".config" / "stackgit" / "config";
  return {};
}

} // namespace stackgit
