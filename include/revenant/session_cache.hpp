#pragma once

// revenant/session_cache.hpp — Durable store of pinned session states.
//
// LAYOUT (SESSION_CACHE_FORMAT_VERSION = 1):
//   <root>/sessions/<key>.state   replay recipe: canonical request JSON
//                                 (identity or zstd encoded)
//   <root>/sessions/<key>.meta    JSON metadata incl. stored_blob_hash
//   <root>/pickles/<key>.olean    prover-written pickle (pickle strategy)
//   <root>/sessions.counter       last allocated session id and sequence
//   <root>/sessions.lock          flock(2) target serializing allocation
//
// INVARIANTS:
//   1. Writes are atomic: tmp + rename within the same directory.
//   2. Reads verify BLAKE3("blob:", stored bytes) against the .meta record
//      before decoding. Any mismatch, format mismatch or parse error is a
//      miss, never an exception.
//   3. put() under an existing key keeps its session_id and sequence (last
//      write wins on the payload).
//   4. Session ids are negative and never reused within one cache root, also
//      across processes: put() holds an exclusive flock on sessions.lock from
//      id allocation through the .meta write.
//   5. list(), find_session() and prune() work from an in-memory index. An
//      entry is re-read and re-verified only when the inode, size or
//      timestamps of its .meta or .state file change. get() always verifies.
//
// Concurrent readers across OS processes are safe. Concurrent writers of the
// same key are last-write-wins and not linearized across processes.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace revenant {

enum class SessionKind {
  environment,
  proof_state,
};

enum class CacheStrategy {
  replay,
  pickle,
};

std::string to_string(SessionKind kind);
std::string to_string(CacheStrategy strategy);
std::optional<CacheStrategy> parse_cache_strategy(const std::string& s);

// What the Supervisor hands the cache when pinning.
struct SessionArtifact {
  SessionKind kind{SessionKind::environment};
  CacheStrategy strategy{CacheStrategy::replay};
  // Request JSON that rebuilds the state: the pinned request itself (replay)
  // or the unpickle request (pickle).
  std::string recipe;
  std::string request_digest;
};

struct SessionState {
  std::string key;
  int64_t session_id{0};
  SessionKind kind{SessionKind::environment};
  CacheStrategy strategy{CacheStrategy::replay};
  uint64_t sequence{0};
  uint64_t created_at_unix_ts{0};
  std::string request_digest;
  uint64_t size_estimate{0};
  std::string recipe;
  std::string encoding{"identity"};
  std::string stored_blob_hash;
};

struct CacheRetention {
  std::size_t max_entries{1024};  // 0 = unbounded
  std::chrono::seconds max_age{0};  // 0 = no TTL
};

// ---------------------------------------------------------------------------
// ISessionCache — storage interface consumed by the Supervisor.
// ---------------------------------------------------------------------------
// Thread-safety: implementations must be safe for concurrent calls.
class ISessionCache {
 public:
  virtual ~ISessionCache() = default;

  // Store under `key`. Returns nullopt when the write fails.
  virtual std::optional<SessionState> put(const std::string& key, const SessionArtifact& artifact) = 0;

  virtual std::optional<SessionState> get(const std::string& key) const = 0;
  virtual std::optional<SessionState> find_session(int64_t session_id) const = 0;

  // All readable entries in creation order.
  virtual std::vector<SessionState> list() const = 0;

  // Returns true if anything was removed.
  virtual bool clear(const std::string& key) = 0;
  virtual std::size_t clear_all() = 0;

  // Apply the retention policy. Returns the number of evicted entries.
  virtual std::size_t prune() = 0;

  // Fresh key for a new pinned state, independent of process-local ids.
  virtual std::string derive_key(const SessionArtifact& artifact) = 0;

  // Where the prover should write the pickle for `key`.
  virtual std::string pickle_path(const std::string& key) const = 0;
};

// ---------------------------------------------------------------------------
// SessionCache — local filesystem implementation.
// ---------------------------------------------------------------------------
class SessionCache : public ISessionCache {
 public:
  // compression: "off" or "zstd" (identity when built without REVENANT_WITH_ZSTD).
  explicit SessionCache(std::string root, CacheRetention retention = {}, std::string compression = "off");

  std::optional<SessionState> put(const std::string& key, const SessionArtifact& artifact) override;
  std::optional<SessionState> get(const std::string& key) const override;
  std::optional<SessionState> find_session(int64_t session_id) const override;
  std::vector<SessionState> list() const override;
  bool clear(const std::string& key) override;
  std::size_t clear_all() override;
  std::size_t prune() override;
  std::string derive_key(const SessionArtifact& artifact) override;
  std::string pickle_path(const std::string& key) const override;

  const std::string& root() const { return root_; }
  const CacheRetention& retention() const { return retention_; }

 private:
  std::string state_path(const std::string& key) const;
  std::string meta_path(const std::string& key) const;
  std::string counter_path() const;
  std::string lock_path() const;
  std::vector<std::string> scan_keys() const;
  bool remove_files(const std::string& key);

  struct FileStamp {
    uint64_t inode{0};
    uint64_t size{0};
    int64_t mtime_ns{0};
    int64_t ctime_ns{0};
    bool operator==(const FileStamp& o) const {
      return inode == o.inode && size == o.size && mtime_ns == o.mtime_ns && ctime_ns == o.ctime_ns;
    }
  };
  struct IndexEntry {
    FileStamp meta;
    FileStamp state;
    std::optional<SessionState> st;  // nullopt: unreadable or failed verification
  };
  static FileStamp stamp(const std::string& path);
  // Caller holds mu_.
  void refresh_index() const;
  std::vector<SessionState> indexed_states() const;

  struct Counter {
    int64_t last_session_id{0};
    uint64_t last_sequence{0};
  };
  Counter load_counter() const;
  bool store_counter(const Counter& c) const;

  std::string root_;
  CacheRetention retention_;
  std::string compression_;
  mutable std::mutex mu_;
  mutable std::map<std::string, IndexEntry> index_;
};

bool valid_session_key(const std::string& key);

}  // namespace revenant
