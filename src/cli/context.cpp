#include "cli/context.hpp"

#include "stackgit/errors.hpp"
#include "stackgit/log.hpp"

#include <filesystem>
#include <iostream>

namespace stackgit::cli {

Options load_cli_options() {
  Options opts = load_options(default_options_path());
  apply_env_overrides(opts);
  if (!log::set_level(opts.log_level)) {
    std::cerr << "warning: unknown log level \"" << opts.log_level << "\"\n";
  }
  return opts;
}

GitOptions git_options(const Options &opts) {
  return GitOptions{.executable = opts.git_executable,
                    .work_dir = std::filesystem::current_path(),
                    .env = {}};
}

int report_error(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what() << "\n";
  if (dynamic_cast<const InternalInvariantViolation *>(&e) != nullptr) {
    return 128;
  }
  return 1;
}

} // namespace stackgit::cli
