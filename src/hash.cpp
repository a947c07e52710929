#include "aiblame/hash.hpp"
#include "aiblame/consts.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace aiblame {

namespace {

// Run one EVP digest over `data` into `out`; returns the digest length.
unsigned int evp_digest(const EVP_MD *md, std::span<const std::uint8_t> data,
                        unsigned char *out) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out, &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);
  return len;
}

constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                       '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

std::string bytes_to_hex(const unsigned char *bytes, std::size_t n) {
  std::string s;
  s.resize(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    const unsigned b = bytes[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace

oid sha1(std::span<const std::uint8_t> data) {
  oid out{}; // 20 bytes
  const unsigned int len = evp_digest(EVP_sha1(), data, out.data());
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

oid object_id(std::string_view type, std::span<const std::uint8_t> payload) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  const std::string header = std::string(type) + " " + std::to_string(payload.size()) + '\0';
  oid out{};
  unsigned int len = 0;
  const bool ok = EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, header.data(), header.size()) == 1 &&
                  (payload.empty() || EVP_DigestUpdate(ctx, payload.data(), payload.size()) == 1) &&
                  EVP_DigestFinal_ex(ctx, out.data(), &len) == 1;
  EVP_MD_CTX_free(ctx);
  if (!ok || len != out.size()) {
    throw std::runtime_error("object id digest failed");
  }
  return out;
}

std::string sha256_hex(std::string_view text) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> buf{};
  const unsigned int len = evp_digest(
      EVP_sha256(),
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()),
                                    text.size()),
      buf.data());
  return bytes_to_hex(buf.data(), len);
}

std::string to_hex(const oid &id) { return bytes_to_hex(id.data(), consts::kOidRawLen); }

bool from_hex(std::string_view hex, oid &out) {
  if (hex.size() != consts::kOidHexLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < consts::kOidRawLen; ++i) {
    const int hi = nibble(hex[2 * i]);
    const int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

} // namespace aiblame
