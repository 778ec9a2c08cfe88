#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace stackgit {

// Binary SHA-1 object id.
using oid = std::array<std::uint8_t, 20>;

// SHA-1 of the concatenation of `parts`. Object ids are the digest of
// "<type> SP <size> NUL" followed by the payload.
oid sha1(std::span<const std::span<const std::uint8_t>> parts);
oid sha1(std::string_view text);

// Lowercase hex, 40 characters.
std::string to_hex(const oid &id);
// False unless `hex` is exactly 40 hex digits (either case).
bool from_hex(std::string_view hex, oid &out);

/**
 * Hex object id as handed out by a store.
 *
 * The value is opaque: it may be full length or abbreviated. A hash made of
 * nothing but '0' characters (including the empty string) is the zero hash
 * and stands for "no object".
 */
class Hash {
public:
  Hash() = default;
  explicit Hash(std::string hex) : hex_(std::move(hex)) {}

  static Hash zero();
  static Hash from_oid(const oid &id) { return Hash{to_hex(id)}; }

  [[nodiscard]] bool is_zero() const noexcept;
  [[nodiscard]] const std::string &str() const noexcept { return hex_; }
  [[nodiscard]] bool empty() const noexcept { return hex_.empty(); }
  // First 7 characters, or the whole value if shorter.
  [[nodiscard]] std::string short_form() const;

  auto operator<=>(const Hash &) const = default;

private:
  std::string hex_;
};

inline std::ostream &operator<<(std::ostream &os, const Hash &h) { return os << h.str(); }

} // namespace stackgit

template <> struct std::hash<stackgit::Hash> {
  std::size_t operator()(const stackgit::Hash &h) const noexcept {
    return std::hash<std::string>{}(h.str());
  }
};
