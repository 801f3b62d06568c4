#include "revenant/hash.hpp"

// BLAKE3 is the only hash primitive. Domain prefixes ("req:", "sess:",
// "blob:") are part of the on-disk cache contract; changing one invalidates
// every stored session key and requires a SESSION_CACHE_FORMAT_VERSION bump.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace revenant {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_version_string() {
  const char* ver = blake3_version();
  return ver ? ver : "unknown";
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string request_digest(std::string_view canonical_request_json) {
  return hash_domain("req:", canonical_request_json);
}

std::string session_key_hash(std::string_view material) {
  return hash_domain("sess:", material);
}

std::string blob_hash(std::string_view stored_bytes) {
  return hash_domain("blob:", stored_bytes);
}

bool valid_digest(std::string_view d) {
  if (d.size() != 64) return false;
  for (char c : d) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace revenant
