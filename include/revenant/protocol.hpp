#pragma once

// revenant/protocol.hpp — Prover wire codec.
//
// FRAMING (PROTOCOL_FRAMING_VERSION = 1):
//   request  : one JSON object, then "\n\n".
//   response : one JSON object, possibly spread over several lines, terminated
//              by a blank line. Leading blank lines are ignored.
//
// The codec only extracts ids, diagnostics and the flag-gated fields. Domain
// payloads (tactics, infotree, declarations) stay opaque canonical JSON.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "revenant/jsonlite.hpp"
#include "revenant/types.hpp"

namespace revenant {

constexpr std::string_view kFrameTerminator = "\n\n";

// Canonical JSON of a request (no terminator). Stable across runs.
std::string encode_request(const Request& request);
jsonlite::Object request_to_object(const Request& request);

// Inverse of encode_request, used to load replay recipes from the cache.
std::optional<Request> decode_request(const std::string& json, std::string* error);

struct DecodeResult {
  bool ok{false};
  Response response;
  std::string error;
};

// Decode one response unit for `request`. Prover-level errors
// ({"message": ...}) decode successfully as ResponseKind::lean_error.
DecodeResult decode_response(const std::string& unit, const Request& request);

// ---------------------------------------------------------------------------
// FrameAssembler — splits a byte stream into response units.
// ---------------------------------------------------------------------------
class FrameAssembler {
 public:
  explicit FrameAssembler(std::size_t max_unit_bytes = 64u << 20) : max_unit_bytes_(max_unit_bytes) {}

  void feed(std::string_view bytes);

  // Next complete unit, without its terminating blank line.
  std::optional<std::string> next();

  // Non-blank bytes buffered that do not yet form a complete unit.
  bool has_partial() const;

  // True once the buffered partial unit exceeds the configured bound.
  bool overflowed() const { return buf_.size() > max_unit_bytes_; }

  void clear() {
    buf_.clear();
    scan_ = 0;
  }

 private:
  std::string buf_;
  // buf_[0, scan_) holds complete non-blank lines of the unit in progress.
  std::size_t scan_{0};
  std::size_t max_unit_bytes_;
};

}  // namespace revenant
