#pragma once

// revenant/version.hpp — Version manifest for every persisted or wire format.
//
// INVARIANT:
//   Readers of a versioned format check the matching constant before use and
//   treat a mismatch as a miss, never as data.

#include <cstdint>
#include <string>

namespace revenant {
namespace version {

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// Prover wire framing: one JSON request unit, one JSON response unit, each
// terminated by a blank line.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// ---------------------------------------------------------------------------
// SESSION_CACHE_FORMAT_VERSION
// On-disk layout of <root>/sessions/<key>.state + .meta and <root>/pickles/.
// Changing the key derivation, meta fields or blob encoding requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t SESSION_CACHE_FORMAT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte output, hex-encoded.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t session_cache_format{SESSION_CACHE_FORMAT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string engine_semver;
  std::string hash_primitive;
  std::string hash_library_version;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

// True when a stored session cache entry written with `stored_version` can be
// read by this build.
bool session_cache_compatible(uint32_t stored_version);

}  // namespace version
}  // namespace revenant
