#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

// File and zlib helpers for the loose-object layout. Failures are reported
// as StoreIOError (I/O) or ProtocolError (corrupt compressed data).
namespace stackgit::fs {

auto read_file(const std::filesystem::path &p) -> std::vector<std::uint8_t>;

// Create `p` with `data` unless it already exists. The bytes go to a
// uniquely named sibling first and are linked into place, so readers never
// see a partial file and concurrent writers of the same object do not clash.
void publish_file(const std::filesystem::path &p, std::span<const std::uint8_t> data);

// zlib stream of the concatenation of `parts`.
auto deflate(std::span<const std::span<const std::uint8_t>> parts) -> std::vector<std::uint8_t>;
auto inflate(std::span<const std::uint8_t> data) -> std::vector<std::uint8_t>;

} // namespace stackgit::fs
