#include "revenant/version.hpp"

#include <sstream>

#include "revenant/hash.hpp"
#include "revenant/jsonlite.hpp"

#ifndef REVENANT_VERSION
#define REVENANT_VERSION "0.1.0"
#endif

namespace revenant {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.engine_semver = REVENANT_VERSION;
  m.hash_primitive = "blake3";
  m.hash_library_version = blake3_version_string();
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"protocol_framing\":" << m.protocol_framing
    << ",\"session_cache_format\":" << m.session_cache_format
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"engine_semver\":\"" << jsonlite::escape(m.engine_semver) << "\""
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"hash_library_version\":\"" << jsonlite::escape(m.hash_library_version) << "\""
    << "}";
  return o.str();
}

bool session_cache_compatible(uint32_t stored_version) {
  return stored_version == SESSION_CACHE_FORMAT_VERSION;
}

}  // namespace version
}  // namespace revenant
