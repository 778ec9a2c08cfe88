#include "stackgit/hash.hpp"

#include "stackgit/consts.hpp"

#include <algorithm>
#include <charconv>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace stackgit {

namespace {

using DigestCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr std::string_view kHexDigits = "0123456789abcdef";

} // namespace

oid sha1(std::span<const std::span<const std::uint8_t>> parts) {
  DigestCtx ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
    throw std::runtime_error("sha1: digest init failed");
  }
  for (const auto part : parts) {
    if (!part.empty() && EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      throw std::runtime_error("sha1: digest update failed");
    }
  }
  oid out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
    throw std::runtime_error("sha1: digest final failed");
  }
  return out;
}

oid sha1(std::string_view text) {
  const std::span<const std::uint8_t> part(reinterpret_cast<const std::uint8_t *>(text.data()),
                                           text.size());
  return sha1(std::span<const std::span<const std::uint8_t>>(&part, 1));
}

std::string to_hex(const oid &id) {
  std::string s;
  s.reserve(consts::kOidHexLen);
  for (const std::uint8_t b : id) {
    s.push_back(kHexDigits[b >> 4U]);
    s.push_back(kHexDigits[b & 0xFU]);
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    const char *first = hex.data() + (2 * i);
    const auto [ptr, ec] = std::from_chars(first, first + 2, out[i], 16);
    if (ec != std::errc{} || ptr != first + 2) {
      return false;
    }
  }
  return true;
}

Hash Hash::zero() { return Hash{std::string(consts::kOidHexLen, '0')}; }

bool Hash::is_zero() const noexcept {
  // Abbreviated zero ids count too.
  return hex_.find_first_not_of('0') == std::string::npos;
}

std::string Hash::short_form() const { return hex_.substr(0, consts::kShortHexLen); }

} // namespace stackgit
