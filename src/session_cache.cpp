#include "revenant/session_cache.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#if defined(REVENANT_WITH_ZSTD)
#include <zstd.h>
#endif

#include "revenant/hash.hpp"
#include "revenant/jsonlite.hpp"
#include "revenant/version.hpp"

namespace fs = std::filesystem;

namespace revenant {

namespace {

#if defined(REVENANT_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

// Exclusive flock(2) on a lock file, held for the object's lifetime.
class DirLock {
 public:
  explicit DirLock(const std::string& path) : fd_(::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644)) {
    if (fd_ < 0) return;
    int rc;
    do {
      rc = ::flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }
  ~DirLock() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }
  DirLock(const DirLock&) = delete;
  DirLock& operator=(const DirLock&) = delete;

  bool held() const { return fd_ >= 0; }

 private:
  int fd_;
};

std::optional<SessionKind> parse_kind(const std::string& s) {
  if (s == "environment") return SessionKind::environment;
  if (s == "proof_state") return SessionKind::proof_state;
  return std::nullopt;
}

std::string meta_to_json(const SessionState& st, std::size_t original_size, std::size_t stored_size) {
  using jsonlite::Value;
  jsonlite::Object o;
  o["format_version"] = Value{static_cast<std::uint64_t>(version::SESSION_CACHE_FORMAT_VERSION)};
  o["key"] = Value{st.key};
  o["session_id"] = Value{static_cast<std::int64_t>(st.session_id)};
  o["kind"] = Value{to_string(st.kind)};
  o["strategy"] = Value{to_string(st.strategy)};
  o["sequence"] = Value{static_cast<std::uint64_t>(st.sequence)};
  o["created_at"] = Value{static_cast<std::uint64_t>(st.created_at_unix_ts)};
  o["request_digest"] = Value{st.request_digest};
  o["size_estimate"] = Value{static_cast<std::uint64_t>(st.size_estimate)};
  o["encoding"] = Value{st.encoding};
  o["original_size"] = Value{static_cast<std::uint64_t>(original_size)};
  o["stored_size"] = Value{static_cast<std::uint64_t>(stored_size)};
  o["stored_blob_hash"] = Value{st.stored_blob_hash};
  return jsonlite::serialize(o);
}

}  // namespace

std::string to_string(SessionKind kind) {
  switch (kind) {
    case SessionKind::environment: return "environment";
    case SessionKind::proof_state: return "proof_state";
  }
  return "";
}

std::string to_string(CacheStrategy strategy) {
  switch (strategy) {
    case CacheStrategy::replay: return "replay";
    case CacheStrategy::pickle: return "pickle";
  }
  return "";
}

std::optional<CacheStrategy> parse_cache_strategy(const std::string& s) {
  if (s == "replay") return CacheStrategy::replay;
  if (s == "pickle") return CacheStrategy::pickle;
  return std::nullopt;
}

bool valid_session_key(const std::string& key) {
  return valid_digest(key);
}

SessionCache::SessionCache(std::string root, CacheRetention retention, std::string compression)
    : root_(std::move(root)), retention_(retention), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "sessions", ec);
  fs::create_directories(fs::path(root_) / "pickles", ec);
}

std::string SessionCache::state_path(const std::string& key) const {
  return (fs::path(root_) / "sessions" / (key + ".state")).string();
}

std::string SessionCache::meta_path(const std::string& key) const {
  return (fs::path(root_) / "sessions" / (key + ".meta")).string();
}

std::string SessionCache::pickle_path(const std::string& key) const {
  return (fs::path(root_) / "pickles" / (key + ".olean")).string();
}

std::string SessionCache::counter_path() const {
  return (fs::path(root_) / "sessions.counter").string();
}

std::string SessionCache::lock_path() const {
  return (fs::path(root_) / "sessions.lock").string();
}

std::string SessionCache::derive_key(const SessionArtifact& artifact) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  const auto now = std::chrono::system_clock::now().time_since_epoch().count();
  std::string material;
  material.reserve(artifact.recipe.size() + 96);
  material += to_string(artifact.kind);
  material += '\n';
  material += artifact.recipe;
  material += '\n';
  material += std::to_string(dist(rng));
  material += '\n';
  material += std::to_string(now);
  return session_key_hash(material);
}

SessionCache::Counter SessionCache::load_counter() const {
  Counter c;
  auto text = read_file(counter_path());
  if (!text) return c;
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(*text, &err);
  if (err) return c;
  c.last_session_id = jsonlite::get_i64(o, "last_session_id").value_or(0);
  c.last_sequence = jsonlite::get_u64(o, "last_sequence", 0);
  return c;
}

bool SessionCache::store_counter(const Counter& c) const {
  jsonlite::Object o;
  o["last_session_id"] = jsonlite::Value{static_cast<std::int64_t>(c.last_session_id)};
  o["last_sequence"] = jsonlite::Value{static_cast<std::uint64_t>(c.last_sequence)};
  return atomic_write(counter_path(), jsonlite::serialize(o));
}

std::vector<std::string> SessionCache::scan_keys() const {
  std::vector<std::string> keys;
  std::error_code ec;
  const fs::path dir = fs::path(root_) / "sessions";
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const fs::path& p = it->path();
    if (p.extension() != ".meta") continue;
    const std::string key = p.stem().string();
    if (valid_session_key(key)) keys.push_back(key);
  }
  return keys;
}

std::optional<SessionState> SessionCache::put(const std::string& key, const SessionArtifact& artifact) {
  if (!valid_session_key(key)) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  DirLock dir_lock(lock_path());
  if (!dir_lock.held()) return std::nullopt;

  SessionState st;
  st.key = key;
  st.kind = artifact.kind;
  st.strategy = artifact.strategy;
  st.request_digest = artifact.request_digest;
  st.recipe = artifact.recipe;
  st.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));

  if (auto existing = get(key)) {
    st.session_id = existing->session_id;
    st.sequence = existing->sequence;
    st.created_at_unix_ts = existing->created_at_unix_ts;
  } else {
    Counter c = load_counter();
    // Entries survive a lost counter file.
    refresh_index();
    for (const auto& [k, e] : index_) {
      if (!e.st) continue;
      c.last_session_id = std::min(c.last_session_id, e.st->session_id);
      c.last_sequence = std::max(c.last_sequence, e.st->sequence);
    }
    c.last_session_id -= 1;
    c.last_sequence += 1;
    if (!store_counter(c)) return std::nullopt;
    st.session_id = c.last_session_id;
    st.sequence = c.last_sequence;
  }

  std::string stored = artifact.recipe;
  st.encoding = "identity";
#if defined(REVENANT_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(artifact.recipe);
    if (!c.empty()) {
      stored = std::move(c);
      st.encoding = "zstd";
    }
  }
#endif
  st.stored_blob_hash = blob_hash(stored);
  st.size_estimate = artifact.recipe.size();
  if (artifact.strategy == CacheStrategy::pickle) {
    std::error_code ec;
    const auto sz = fs::file_size(pickle_path(key), ec);
    if (!ec) st.size_estimate += static_cast<uint64_t>(sz);
  }

  if (!atomic_write(state_path(key), stored)) return std::nullopt;
  if (!atomic_write(meta_path(key), meta_to_json(st, artifact.recipe.size(), stored.size()))) {
    std::error_code ec;
    fs::remove(state_path(key), ec);
    return std::nullopt;
  }
  return st;
}

std::optional<SessionState> SessionCache::get(const std::string& key) const {
  if (!valid_session_key(key)) return std::nullopt;
  auto meta_text = read_file(meta_path(key));
  if (!meta_text) return std::nullopt;

  std::optional<jsonlite::JsonError> err;
  const auto m = jsonlite::parse(*meta_text, &err);
  if (err) return std::nullopt;
  if (!version::session_cache_compatible(static_cast<uint32_t>(jsonlite::get_u64(m, "format_version", 0)))) {
    return std::nullopt;
  }
  if (jsonlite::get_string(m, "key", "") != key) return std::nullopt;

  SessionState st;
  st.key = key;
  auto sid = jsonlite::get_i64(m, "session_id");
  auto kind = parse_kind(jsonlite::get_string(m, "kind", ""));
  auto strategy = parse_cache_strategy(jsonlite::get_string(m, "strategy", ""));
  if (!sid || *sid >= 0 || !kind || !strategy) return std::nullopt;
  st.session_id = *sid;
  st.kind = *kind;
  st.strategy = *strategy;
  st.sequence = jsonlite::get_u64(m, "sequence", 0);
  st.created_at_unix_ts = jsonlite::get_u64(m, "created_at", 0);
  st.request_digest = jsonlite::get_string(m, "request_digest", "");
  st.size_estimate = jsonlite::get_u64(m, "size_estimate", 0);
  st.encoding = jsonlite::get_string(m, "encoding", "identity");
  st.stored_blob_hash = jsonlite::get_string(m, "stored_blob_hash", "");
  const auto original_size = jsonlite::get_u64(m, "original_size", 0);

  auto stored = read_file(state_path(key));
  if (!stored) return std::nullopt;
  // Fail closed on any blob mismatch.
  if (st.stored_blob_hash.empty() || blob_hash(*stored) != st.stored_blob_hash) return std::nullopt;

  if (st.encoding == "identity") {
    st.recipe = std::move(*stored);
  } else if (st.encoding == "zstd") {
#if defined(REVENANT_WITH_ZSTD)
    auto plain = decompress_zstd(*stored, static_cast<std::size_t>(original_size));
    if (!plain) return std::nullopt;
    st.recipe = std::move(*plain);
#else
    (void)original_size;
    return std::nullopt;
#endif
  } else {
    return std::nullopt;
  }
  return st;
}

SessionCache::FileStamp SessionCache::stamp(const std::string& path) {
  FileStamp s;
  struct stat sb;
  if (::stat(path.c_str(), &sb) != 0) return s;
  s.inode = static_cast<uint64_t>(sb.st_ino);
  s.size = static_cast<uint64_t>(sb.st_size);
  s.mtime_ns = static_cast<int64_t>(sb.st_mtim.tv_sec) * 1000000000 + sb.st_mtim.tv_nsec;
  s.ctime_ns = static_cast<int64_t>(sb.st_ctim.tv_sec) * 1000000000 + sb.st_ctim.tv_nsec;
  return s;
}

void SessionCache::refresh_index() const {
  std::map<std::string, IndexEntry> next;
  for (const auto& key : scan_keys()) {
    IndexEntry e;
    e.meta = stamp(meta_path(key));
    e.state = stamp(state_path(key));
    auto it = index_.find(key);
    if (it != index_.end() && it->second.meta == e.meta && it->second.state == e.state) {
      e.st = std::move(it->second.st);
    } else {
      e.st = get(key);
    }
    next.emplace(key, std::move(e));
  }
  index_ = std::move(next);
}

std::vector<SessionState> SessionCache::indexed_states() const {
  std::vector<SessionState> out;
  for (const auto& [key, e] : index_) {
    if (e.st) out.push_back(*e.st);
  }
  std::sort(out.begin(), out.end(), [](const SessionState& a, const SessionState& b) {
    if (a.sequence != b.sequence) return a.sequence < b.sequence;
    return a.key < b.key;
  });
  return out;
}

std::optional<SessionState> SessionCache::find_session(int64_t session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_index();
  for (const auto& [key, e] : index_) {
    if (e.st && e.st->session_id == session_id) return e.st;
  }
  return std::nullopt;
}

std::vector<SessionState> SessionCache::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_index();
  return indexed_states();
}

bool SessionCache::remove_files(const std::string& key) {
  std::error_code ec;
  bool removed = false;
  removed |= fs::remove(meta_path(key), ec);
  removed |= fs::remove(state_path(key), ec);
  removed |= fs::remove(pickle_path(key), ec);
  return removed;
}

bool SessionCache::clear(const std::string& key) {
  if (!valid_session_key(key)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  return remove_files(key);
}

std::size_t SessionCache::clear_all() {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& key : scan_keys()) {
    if (remove_files(key)) ++n;
  }
  return n;
}

std::size_t SessionCache::prune() {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_index();
  std::vector<SessionState> entries = indexed_states();

  std::size_t removed = 0;
  const uint64_t now = static_cast<uint64_t>(std::time(nullptr));
  std::vector<SessionState> kept;
  for (auto& st : entries) {
    const auto max_age = static_cast<uint64_t>(retention_.max_age.count());
    if (max_age > 0 && st.created_at_unix_ts + max_age < now) {
      if (remove_files(st.key)) ++removed;
    } else {
      kept.push_back(std::move(st));
    }
  }
  if (retention_.max_entries > 0 && kept.size() > retention_.max_entries) {
    const std::size_t excess = kept.size() - retention_.max_entries;
    for (std::size_t i = 0; i < excess; ++i) {
      if (remove_files(kept[i].key)) ++removed;
    }
  }
  return removed;
}

}  // namespace revenant
