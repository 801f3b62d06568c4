#pragma once

#include <string>
#include <string_view>

namespace revenant {

// Core BLAKE3 hashing (64-char lowercase hex).
std::string blake3_hex(std::string_view payload);
std::string blake3_version_string();

// Domain-separated hashing. Domains in use:
//   "req:"  canonical request JSON (RunResult::request_digest)
//   "sess:" session cache keys
//   "blob:" stored session blobs (.meta stored_blob_hash)
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string request_digest(std::string_view canonical_request_json);
std::string session_key_hash(std::string_view material);
std::string blob_hash(std::string_view stored_bytes);

bool valid_digest(std::string_view digest);

}  // namespace revenant
