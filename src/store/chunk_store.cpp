#include "playsync/chunk_store.hpp"
#include "playsync/item_json.hpp"
#include "playsync/url_utils.hpp"
#include <sqlite3.h>
#include <iostream>

namespace ps {

static constexpr const char* kSchemaSQL =
  "CREATE TABLE IF NOT EXISTS playlist_chunks ("
  "  owner_id TEXT NOT NULL,"
  "  chunk_id INTEGER NOT NULL,"
  "  items    TEXT NOT NULL,"
  "  PRIMARY KEY (owner_id, chunk_id)"
  ") WITHOUT ROWID;"
  // Whole-playlist records written by older versions; only ever deleted.
  "CREATE TABLE IF NOT EXISTS playlists ("
  "  id   TEXT PRIMARY KEY,"
  "  data TEXT"
  ");";

namespace {

// Finalizes on scope exit.
struct Stmt {
  sqlite3_stmt* s{nullptr};
  Stmt(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &s, nullptr) != SQLITE_OK) s = nullptr;
  }
  ~Stmt() { if (s) sqlite3_finalize(s); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;
  explicit operator bool() const noexcept { return s != nullptr; }

  void bind_text(int idx, std::string_view v) {
    sqlite3_bind_text(s, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void bind_int64(int idx, std::int64_t v) { sqlite3_bind_int64(s, idx, v); }
};

std::string_view column_text(sqlite3_stmt* s, int col) {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(s, col));
  return p ? std::string_view(p, static_cast<size_t>(sqlite3_column_bytes(s, col))) : std::string_view{};
}

}

static constexpr std::string_view kTempPrefix = "temp_";

std::string temp_owner_id(std::string_view resource_id) {
  return std::string(kTempPrefix) + std::string(resource_id);
}

bool is_temp_owner_id(std::string_view id) noexcept {
  return id.size() >= kTempPrefix.size() && id.compare(0, kTempPrefix.size(), kTempPrefix) == 0;
}

ChunkStore::ChunkStore() : ChunkStore(Config{}) {}

ChunkStore::ChunkStore(Config cfg) : cfg_(std::move(cfg)) {
  if (!open()) std::cerr << "[store] open failed: " << err_ << "\n";
}

ChunkStore::~ChunkStore() {
  if (db_) sqlite3_close(db_);
}

void ChunkStore::fail(const char* what) {
  err_ = std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open");
  std::cerr << "[store] " << err_ << "\n";
}

bool ChunkStore::open() {
  if (cfg_.path != ":memory:" && !ensure_parent_dirs(cfg_.path)) {
    err_ = "cannot create parent directory for " + cfg_.path;
    return false;
  }
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(cfg_.path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    err_ = db_ ? sqlite3_errmsg(db_) : "sqlite3_open_v2 failed";
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
    return false;
  }
  sqlite3_busy_timeout(db_, cfg_.busy_timeout_ms);
  if (cfg_.wal && cfg_.path != ":memory:") {
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
  }
  if (!exec(kSchemaSQL)) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

bool ChunkStore::exec(const char* sql) {
  if (!db_) { err_ = "database not open"; return false; }
  char* msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
    err_ = msg ? msg : "sqlite3_exec failed";
    sqlite3_free(msg);
    std::cerr << "[store] " << err_ << " (" << sql << ")\n";
    return false;
  }
  return true;
}

bool ChunkStore::begin() { return exec("BEGIN IMMEDIATE"); }
bool ChunkStore::commit() { return exec("COMMIT"); }
void ChunkStore::rollback() { (void)exec("ROLLBACK"); }

bool ChunkStore::put(std::string_view owner_id, std::int64_t chunk_id, const ItemBatch& items) {
  const std::string payload = ItemJson::to_json(items);
  std::lock_guard<std::mutex> lk(mu_);
  if (!db_) { err_ = "database not open"; return false; }

  Stmt st(db_, "INSERT OR REPLACE INTO playlist_chunks (owner_id, chunk_id, items) VALUES (?1, ?2, ?3)");
  if (!st) { fail("put prepare"); return false; }
  st.bind_text(1, owner_id);
  st.bind_int64(2, chunk_id);
  st.bind_text(3, payload);
  if (sqlite3_step(st.s) != SQLITE_DONE) { fail("put"); return false; }
  return true;
}

std::optional<ItemBatch> ChunkStore::get_items(std::string_view owner_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!db_) { err_ = "database not open"; return std::nullopt; }

  Stmt st(db_, "SELECT chunk_id, items FROM playlist_chunks WHERE owner_id = ?1 ORDER BY chunk_id ASC");
  if (!st) { fail("get_all prepare"); return std::nullopt; }
  st.bind_text(1, owner_id);

  ItemBatch items;
  bool any = false;
  int rc;
  while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
    any = true;
    std::string perr;
    if (!ItemJson::from_json(column_text(st.s, 1), items, &perr)) {
      err_ = "chunk " + std::to_string(sqlite3_column_int64(st.s, 0)) + " of " +
             std::string(owner_id) + " undecodable: " + perr;
      std::cerr << "[store] " << err_ << "\n";
      return std::nullopt;
    }
  }
  if (rc != SQLITE_DONE) { fail("get_all"); return std::nullopt; }
  if (!any) return std::nullopt;
  return items;
}

std::optional<Dataset> ChunkStore::get_all(std::string_view owner_id) {
  auto items = get_items(owner_id);
  if (!items) return std::nullopt;
  Dataset data;
  for (auto& it : *items) data.add(std::move(it));
  return data;
}

bool ChunkStore::move_locked(std::string_view source_id, std::string_view target_id) {
  Stmt next(db_, "SELECT chunk_id, items FROM playlist_chunks WHERE owner_id = ?1 ORDER BY chunk_id ASC LIMIT 1");
  Stmt ins(db_, "INSERT OR REPLACE INTO playlist_chunks (owner_id, chunk_id, items) VALUES (?1, ?2, ?3)");
  Stmt del(db_, "DELETE FROM playlist_chunks WHERE owner_id = ?1 AND chunk_id = ?2");
  if (!next || !ins || !del) { fail("move prepare"); return false; }

  // Drain one chunk at a time: write under target, then delete under source.
  while (true) {
    sqlite3_reset(next.s);
    next.bind_text(1, source_id);
    const int rc = sqlite3_step(next.s);
    if (rc == SQLITE_DONE) return true;
    if (rc != SQLITE_ROW) { fail("move read"); return false; }

    const std::int64_t chunk_id = sqlite3_column_int64(next.s, 0);
    const std::string items(column_text(next.s, 1));
    sqlite3_reset(next.s);

    sqlite3_reset(ins.s);
    ins.bind_text(1, target_id);
    ins.bind_int64(2, chunk_id);
    ins.bind_text(3, items);
    if (sqlite3_step(ins.s) != SQLITE_DONE) { fail("move write"); return false; }

    sqlite3_reset(del.s);
    del.bind_text(1, source_id);
    del.bind_int64(2, chunk_id);
    if (sqlite3_step(del.s) != SQLITE_DONE) { fail("move delete"); return false; }
  }
}

bool ChunkStore::move(std::string_view source_id, std::string_view target_id) {
  if (source_id == target_id) return true;
  std::lock_guard<std::mutex> lk(mu_);
  if (!begin()) return false;
  if (!move_locked(source_id, target_id)) { rollback(); return false; }
  if (!commit()) { rollback(); return false; }
  return true;
}

bool ChunkStore::replace(std::string_view source_id, std::string_view target_id) {
  if (source_id == target_id) return true;
  std::lock_guard<std::mutex> lk(mu_);
  if (!begin()) return false;
  if (!delete_owner_locked(target_id) || !move_locked(source_id, target_id)) {
    rollback();
    return false;
  }
  if (!commit()) { rollback(); return false; }
  return true;
}

bool ChunkStore::delete_owner_locked(std::string_view owner_id) {
  Stmt chunks(db_, "DELETE FROM playlist_chunks WHERE owner_id = ?1");
  Stmt legacy(db_, "DELETE FROM playlists WHERE id = ?1");
  if (!chunks || !legacy) { fail("delete prepare"); return false; }
  chunks.bind_text(1, owner_id);
  legacy.bind_text(1, owner_id);
  if (sqlite3_step(chunks.s) != SQLITE_DONE) { fail("delete chunks"); return false; }
  if (sqlite3_step(legacy.s) != SQLITE_DONE) { fail("delete legacy record"); return false; }
  return true;
}

bool ChunkStore::delete_all(std::string_view owner_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!begin()) return false;
  if (!delete_owner_locked(owner_id)) { rollback(); return false; }
  if (!commit()) { rollback(); return false; }
  return true;
}

bool ChunkStore::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!begin()) return false;
  if (!exec("DELETE FROM playlist_chunks") || !exec("DELETE FROM playlists")) {
    rollback();
    return false;
  }
  if (!commit()) { rollback(); return false; }
  return true;
}

std::int64_t ChunkStore::chunk_count(std::string_view owner_id) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!db_) return 0;
  Stmt st(db_, "SELECT COUNT(*) FROM playlist_chunks WHERE owner_id = ?1");
  if (!st) { fail("count prepare"); return 0; }
  st.bind_text(1, owner_id);
  if (sqlite3_step(st.s) != SQLITE_ROW) { fail("count"); return 0; }
  return sqlite3_column_int64(st.s, 0);
}

std::vector<std::int64_t> ChunkStore::chunk_ids(std::string_view owner_id) {
  std::vector<std::int64_t> ids;
  std::lock_guard<std::mutex> lk(mu_);
  if (!db_) return ids;
  Stmt st(db_, "SELECT chunk_id FROM playlist_chunks WHERE owner_id = ?1 ORDER BY chunk_id ASC");
  if (!st) { fail("chunk ids prepare"); return ids; }
  st.bind_text(1, owner_id);
  int rc;
  while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) ids.push_back(sqlite3_column_int64(st.s, 0));
  if (rc != SQLITE_DONE) fail("chunk ids");
  return ids;
}

}
