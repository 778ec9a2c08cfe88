#pragma once
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace stackgit::log {

// The library-wide logger ("stackgit"), writing to stderr.
// Created on first use with level `warn`.
std::shared_ptr<spdlog::logger> get();

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names leave the level unchanged and return false.
bool set_level(std::string_view level);

} // namespace stackgit::log
