#include "cli/registry.hpp"

#include "cli/context.hpp"

#include <algorithm>
#include <iostream>
#include <map>

namespace stackgit::cli {

namespace {

std::map<std::string, command, std::less<>> &table() {
  static std::map<std::string, command, std::less<>> t;
  return t;
}

} // namespace

void register_command(std::string name, command cmd) { table().insert_or_assign(std::move(name), std::move(cmd)); }

const command *find_command(std::string_view name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &os) {
  os << "usage: stackgit <command> [args]\n\ncommands:\n";
  std::size_t width = 0;
  for (const auto &[name, cmd] : table()) {
    width = std::max(width, name.size());
  }
  for (const auto &[name, cmd] : table()) {
    os << "  " << name << std::string(width - name.size() + 2, ' ') << cmd.help << "\n";
  }
}

int dispatch(int argc, char **argv) {
  const std::string_view name = argv[0];
  const command *cmd = find_command(name);
  if (cmd == nullptr) {
    std::cerr << "unknown command: " << name << "\n";
    print_usage(std::cerr);
    return 2;
  }
  try {
    return cmd->fn(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << name << ": " << e.what() << "\n";
    std::cerr << "usage: stackgit " << name << " " << cmd->args << "\n";
    return 2;
  } catch (const std::exception &e) {
    return report_error(name, e);
  }
}

} // namespace stackgit::cli
