#pragma once
#include <filesystem>
#include <string>

namespace stackgit {

struct Options {
  std::filesystem::path git_executable{"git"};
  std::string log_level{"warn"};
  std::string merge_conflict_style; // empty: git's default
};

// Read options from a "key: value" file. Missing file gives the defaults.
// Recognized keys: git, log-level, conflict-style. Lines starting with '#'
// are comments.
Options load_options(const std::filesystem::path& file);

// Override fields from STACKGIT_GIT, STACKGIT_LOG_LEVEL and
// STACKGIT_CONFLICT_STYLE when set.
void apply_env_overrides(Options& opts);

// $XDG_CONFIG_HOME/stackgit/config, falling back to ~/.config/stackgit/config.
// Empty when neither variable is set.
std::filesystem::path default_options_path();

} // namespace stackgit
