#include "aed/store/store.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>

#include <lmdb.h>

#include "aed/util/logging.hpp"

namespace aed::store {
using aed::util::DetectionEvent;
using aed::util::ErrorCode;
using aed::util::Expected;

// -----------------------------
// Helpers: error mapping, endian, varint
// -----------------------------

namespace {
inline ErrorCode map_mdb(int rc) noexcept {
  if (rc == 0) return ErrorCode::None;
  switch (rc) {
    case MDB_NOTFOUND:
      return ErrorCode::NotFound;
    case MDB_MAP_FULL:
      return ErrorCode::ResourceExhausted;
    case MDB_PANIC:
    case MDB_CORRUPTED:
      return ErrorCode::PersistenceError;
    case MDB_BAD_VALSIZE:
    case MDB_BAD_DBI:
    case EINVAL:
      return ErrorCode::InvalidArgument;
    case ENOSPC:
    case ENOMEM:
      return ErrorCode::OutOfMemory;
    default:
      return ErrorCode::IOError;
  }
}

// Little-endian put/get
inline void put_u32(std::string& o, std::uint32_t v) {
  o.push_back(static_cast<char>((v) & 0xFFu));
  o.push_back(static_cast<char>((v >> 8) & 0xFFu));
  o.push_back(static_cast<char>((v >> 16) & 0xFFu));
  o.push_back(static_cast<char>((v >> 24) & 0xFFu));
}

inline std::uint32_t get_u32(const std::uint8_t* p) {
  return (std::uint32_t)p[0] | ((std::uint32_t)p[1] << 8) | (
           (std::uint32_t)p[2] << 16) | (
           (std::uint32_t)p[3] << 24);
}

// Unsigned base-128 varint
inline void put_varu(std::string& out, std::uint64_t v) {
  while (v >= 0x80) {
    out.push_back(static_cast<char>((v & 0x7F) | 0x80));
    v >>= 7;
  }
  out.push_back(static_cast<char>(v & 0x7F));
}

inline const std::uint8_t* get_varu(const std::uint8_t* p,
                                    const std::uint8_t* end, std::uint64_t& v) {
  v = 0;
  int s = 0;
  while (p < end) {
    std::uint8_t b = *p++;
    v |= (std::uint64_t)(b & 0x7F) << s;
    if (!(b & 0x80)) return p;
    s += 7;
    if (s > 63) return nullptr;
  }
  return nullptr;
}

inline void put_str(std::string& out, std::string_view s) {
  put_varu(out, s.size());
  out.append(s.data(), s.size());
}

inline const std::uint8_t* get_str(const std::uint8_t* p, const std::uint8_t* end, std::string& s) {
  std::uint64_t n = 0;
  p = get_varu(p, end, n);
  if (!p || n > std::uint64_t(end - p)) return nullptr;
  s.assign(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n));
  return p + n;
}

// Status value (LE):
// [count u32] repeat count: [name str][value str]   (str = varint len + bytes)
using Flags = std::map<std::string, std::string>;

inline std::string encode_flags(const Flags& f) {
  std::string out;
  put_u32(out, static_cast<std::uint32_t>(f.size()));
  for (const auto& [name, value] : f) {
    put_str(out, name);
    put_str(out, value);
  }
  return out;
}

inline Expected<Flags> decode_flags(const std::uint8_t* p, std::size_t len) {
  const std::uint8_t* end = p + len;
  if (len < 4) return tl::unexpected(ErrorCode::PersistenceError);
  const std::uint32_t n = get_u32(p);
  p += 4;
  Flags f;
  for (std::uint32_t i = 0; i < n; ++i) {
    std::string name, value;
    p = get_str(p, end, name);
    if (p) p = get_str(p, end, value);
    if (!p) return tl::unexpected(ErrorCode::PersistenceError);
    f.emplace(std::move(name), std::move(value));
  }
  return f;
}

// Result value (LE):
// [count u32] repeat count: [label_index u32][probability f32 bits u32][label str]
inline std::string encode_events(const std::vector<DetectionEvent>& events) {
  std::string out;
  put_u32(out, static_cast<std::uint32_t>(events.size()));
  for (const auto& e : events) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &e.probability, sizeof(bits));
    put_u32(out, e.label_index);
    put_u32(out, bits);
    put_str(out, e.label);
  }
  return out;
}

inline Expected<std::vector<DetectionEvent>> decode_events(const std::uint8_t* p, std::size_t len) {
  const std::uint8_t* end = p + len;
  if (len < 4) return tl::unexpected(ErrorCode::PersistenceError);
  const std::uint32_t n = get_u32(p);
  p += 4;
  std::vector<DetectionEvent> out;
  out.reserve(n);
  for (std::uint32_t i = 0; i < n; ++i) {
    if (end - p < 8) return tl::unexpected(ErrorCode::PersistenceError);
    DetectionEvent e;
    e.label_index = static_cast<util::LabelIndex>(get_u32(p));
    const std::uint32_t bits = get_u32(p + 4);
    std::memcpy(&e.probability, &bits, sizeof(bits));
    p = get_str(p + 8, end, e.label);
    if (!p) return tl::unexpected(ErrorCode::PersistenceError);
    out.push_back(std::move(e));
  }
  return out;
}

inline MDB_val as_val(std::string_view s) {
  MDB_val v;
  v.mv_size = s.size();
  v.mv_data = const_cast<char*>(s.data());
  return v;
}

// Aborts on scope exit unless committed.
class Txn {
public:
  Txn(const Txn&) = delete;
  Txn& operator=(const Txn&) = delete;
  explicit Txn(MDB_txn* t) : t_(t) {}
  Txn(Txn&& o) noexcept : t_(std::exchange(o.t_, nullptr)) {}
  ~Txn() {
    if (t_) mdb_txn_abort(t_);
  }
  MDB_txn* get() const noexcept { return t_; }
  int commit() {
    const int rc = mdb_txn_commit(t_);
    t_ = nullptr;
    return rc;
  }

private:
  MDB_txn* t_{nullptr};
};

// Closed on scope exit; must not outlive its transaction.
class Cursor {
public:
  Cursor(const Cursor&) = delete;
  Cursor& operator=(const Cursor&) = delete;
  Cursor() = default;
  ~Cursor() {
    if (c_) mdb_cursor_close(c_);
  }
  int open(MDB_txn* txn, MDB_dbi dbi) { return mdb_cursor_open(txn, dbi, &c_); }
  MDB_cursor* get() const noexcept { return c_; }

private:
  MDB_cursor* c_{nullptr};
};
} // namespace

// -----------------------------
// Environment
// -----------------------------

class LmdbEnv {
public:
  LmdbEnv() = default;
  LmdbEnv(const LmdbEnv&) = delete;
  LmdbEnv& operator=(const LmdbEnv&) = delete;

  ~LmdbEnv() {
    if (env_) {
      // DBIs are closed with the environment
      mdb_env_close(env_);
      env_ = nullptr;
    }
  }

  ErrorCode open(const std::filesystem::path& path, const LmdbOptions& opts) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) return ErrorCode::IOError;

    int rc = mdb_env_create(&env_);
    if (rc != 0) return map_mdb(rc);

    unsigned int flags = 0;
    if (opts.use_nosync) flags |= MDB_NOSYNC;

    rc = mdb_env_set_mapsize(env_, (size_t)opts.map_size_bytes);
    if (rc != 0) return map_mdb(rc);
    rc = mdb_env_set_maxdbs(env_, 2);
    if (rc != 0) return map_mdb(rc);

    rc = mdb_env_open(env_, path.c_str(), flags, 0644);
    if (rc != 0) return map_mdb(rc);

    MDB_txn* raw = nullptr;
    rc = mdb_txn_begin(env_, nullptr, 0, &raw);
    if (rc != 0) return map_mdb(rc);
    Txn txn(raw);

    rc = mdb_dbi_open(txn.get(), "status", MDB_CREATE, &status_dbi_);
    if (rc != 0) return map_mdb(rc);
    rc = mdb_dbi_open(txn.get(), "results", MDB_CREATE, &results_dbi_);
    if (rc != 0) return map_mdb(rc);

    rc = txn.commit();
    if (rc != 0) return map_mdb(rc);
    return ErrorCode::None;
  }

  Expected<Txn> begin(bool read_only) const {
    MDB_txn* raw = nullptr;
    const int rc = mdb_txn_begin(env_, nullptr, read_only ? MDB_RDONLY : 0, &raw);
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return Expected<Txn>(tl::in_place, raw);
  }

  MDB_dbi status_dbi() const noexcept { return status_dbi_; }
  MDB_dbi results_dbi() const noexcept { return results_dbi_; }

private:
  MDB_env* env_{nullptr};
  MDB_dbi status_dbi_{0};
  MDB_dbi results_dbi_{0};
};

Expected<std::shared_ptr<LmdbEnv>> open_lmdb(const std::filesystem::path& path,
                                             const LmdbOptions& opts) {
  auto env = std::make_shared<LmdbEnv>();
  if (auto e = env->open(path, opts); e != ErrorCode::None) {
    AED_LOG_WARN("lmdb open " << path.string() << " failed: " << util::error_name(e));
    return tl::unexpected(e);
  }
  return env;
}

// -----------------------------
// Status store
// -----------------------------

namespace {

class LmdbStatusStore final : public IStatusStore {
public:
  explicit LmdbStatusStore(std::shared_ptr<LmdbEnv> env) : env_(std::move(env)) {}

  Expected<void> register_unit(std::string_view unit_id) override {
    if (unit_id.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
    auto txn = env_->begin(false);
    if (!txn) return tl::unexpected(txn.error());

    MDB_val k = as_val(unit_id);
    const std::string empty = encode_flags({});
    MDB_val v = as_val(empty);
    int rc = mdb_put(txn->get(), env_->status_dbi(), &k, &v, MDB_NOOVERWRITE);
    if (rc == MDB_KEYEXIST) return {};
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    rc = txn->commit();
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return {};
  }

  Expected<StatusUpdate> mark_completed(std::string_view unit_id, std::string_view flag,
                                        std::chrono::milliseconds timeout) override {
    if (unit_id.empty() || flag.empty()) return tl::unexpected(ErrorCode::InvalidArgument);
    const auto deadline = util::Deadline::after(timeout);

    auto txn = env_->begin(false);
    if (!txn) return tl::unexpected(txn.error());
    if (deadline.expired()) return tl::unexpected(ErrorCode::Timeout);

    MDB_val k = as_val(unit_id);
    MDB_val v;
    int rc = mdb_get(txn->get(), env_->status_dbi(), &k, &v);
    if (rc == MDB_NOTFOUND) return StatusUpdate::NoMatchingRecord;
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    auto flags = decode_flags(static_cast<const std::uint8_t*>(v.mv_data), v.mv_size);
    if (!flags) return tl::unexpected(flags.error());
    (*flags)[std::string(flag)] = std::string(kCompletedValue);

    const std::string enc = encode_flags(*flags);
    MDB_val nv = as_val(enc);
    rc = mdb_put(txn->get(), env_->status_dbi(), &k, &nv, 0);
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    if (deadline.expired()) return tl::unexpected(ErrorCode::Timeout);
    rc = txn->commit();
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return StatusUpdate::Updated;
  }

  Expected<std::optional<std::string>> flag_value(std::string_view unit_id,
                                                  std::string_view flag) override {
    auto txn = env_->begin(true);
    if (!txn) return tl::unexpected(txn.error());

    MDB_val k = as_val(unit_id);
    MDB_val v;
    const int rc = mdb_get(txn->get(), env_->status_dbi(), &k, &v);
    if (rc == MDB_NOTFOUND) return std::optional<std::string>{};
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    auto flags = decode_flags(static_cast<const std::uint8_t*>(v.mv_data), v.mv_size);
    if (!flags) return tl::unexpected(flags.error());
    auto it = flags->find(std::string(flag));
    if (it == flags->end()) return std::optional<std::string>{};
    return std::optional<std::string>{it->second};
  }

private:
  std::shared_ptr<LmdbEnv> env_;
};

// -----------------------------
// Result store
// -----------------------------

// unit_id and window_key joined by NUL, which neither may contain.
std::string result_key(std::string_view unit_id, std::string_view window_key) {
  std::string k;
  k.reserve(unit_id.size() + 1 + window_key.size());
  k.append(unit_id);
  k.push_back('\0');
  k.append(window_key);
  return k;
}

bool valid_key_part(std::string_view s) {
  return !s.empty() && s.find('\0') == std::string_view::npos;
}

class LmdbResultStore final : public IResultStore {
public:
  explicit LmdbResultStore(std::shared_ptr<LmdbEnv> env) : env_(std::move(env)) {}

  Expected<void> put(std::string_view unit_id, std::string_view window_key,
                     const std::vector<DetectionEvent>& events,
                     std::chrono::milliseconds timeout) override {
    if (!valid_key_part(unit_id) || !valid_key_part(window_key))
      return tl::unexpected(ErrorCode::InvalidArgument);
    const auto deadline = util::Deadline::after(timeout);

    auto txn = env_->begin(false);
    if (!txn) return tl::unexpected(txn.error());

    const std::string key = result_key(unit_id, window_key);
    const std::string val = encode_events(events);
    MDB_val k = as_val(key);
    MDB_val v = as_val(val);
    int rc = mdb_put(txn->get(), env_->results_dbi(), &k, &v, 0);
    if (rc != 0) return tl::unexpected(map_mdb(rc));

    if (deadline.expired()) return tl::unexpected(ErrorCode::Timeout);
    rc = txn->commit();
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return {};
  }

  Expected<std::vector<DetectionEvent>> get(std::string_view unit_id,
                                            std::string_view window_key) override {
    if (!valid_key_part(unit_id) || !valid_key_part(window_key))
      return tl::unexpected(ErrorCode::InvalidArgument);
    auto txn = env_->begin(true);
    if (!txn) return tl::unexpected(txn.error());

    const std::string key = result_key(unit_id, window_key);
    MDB_val k = as_val(key);
    MDB_val v;
    const int rc = mdb_get(txn->get(), env_->results_dbi(), &k, &v);
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return decode_events(static_cast<const std::uint8_t*>(v.mv_data), v.mv_size);
  }

  Expected<std::size_t> erase_unit(std::string_view unit_id,
                                   std::chrono::milliseconds timeout) override {
    if (!valid_key_part(unit_id)) return tl::unexpected(ErrorCode::InvalidArgument);
    const auto deadline = util::Deadline::after(timeout);

    auto txn = env_->begin(false);
    if (!txn) return tl::unexpected(txn.error());

    std::size_t n = 0;
    {
      Cursor cur;
      int rc = cur.open(txn->get(), env_->results_dbi());
      if (rc != 0) return tl::unexpected(map_mdb(rc));

      // Keys of one unit are contiguous: "<unit_id>\0<window_key>".
      const std::string prefix = result_key(unit_id, "");
      MDB_val k = as_val(prefix);
      MDB_val v;
      rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
      while (rc == 0) {
        const std::string_view key(static_cast<const char*>(k.mv_data), k.mv_size);
        if (key.substr(0, prefix.size()) != prefix) break;
        rc = mdb_cursor_del(cur.get(), 0);
        if (rc != 0) return tl::unexpected(map_mdb(rc));
        ++n;
        rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
      }
      if (rc != 0 && rc != MDB_NOTFOUND) return tl::unexpected(map_mdb(rc));
    }

    if (deadline.expired()) return tl::unexpected(ErrorCode::Timeout);
    const int rc = txn->commit();
    if (rc != 0) return tl::unexpected(map_mdb(rc));
    return n;
  }

private:
  std::shared_ptr<LmdbEnv> env_;
};

} // namespace

std::unique_ptr<IStatusStore> make_lmdb_status_store(std::shared_ptr<LmdbEnv> env) {
  return std::make_unique<LmdbStatusStore>(std::move(env));
}

std::unique_ptr<IResultStore> make_lmdb_result_store(std::shared_ptr<LmdbEnv> env) {
  return std::make_unique<LmdbResultStore>(std::move(env));
}
} // namespace aed::store
