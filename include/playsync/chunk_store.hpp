#pragma once
#include "playsync/playlist_item.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

namespace ps {

// Owner-namespaced, durable storage of item batches keyed by (owner_id, chunk_id).
//
// Every operation is one SQLite transaction. Failures are logged and
// reported as false / std::nullopt; last_error() keeps the message. An absent
// read means "sync again", never a distinguishable data-loss signal.
class ChunkStore {
public:
  struct Config {
    std::string path = "playsync.db";   // ":memory:" for a private in-memory store
    int busy_timeout_ms = 5000;
    bool wal = true;
  };

  ChunkStore();
  explicit ChunkStore(Config cfg);
  ~ChunkStore();
  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  bool is_open() const noexcept { return db_ != nullptr; }

  // Upsert one chunk.
  bool put(std::string_view owner_id, std::int64_t chunk_id, const ItemBatch& items);

  // Chunks in chunk_id order, regrouped category -> group -> items.
  // nullopt when the owner has no chunks (or on failure).
  std::optional<Dataset> get_all(std::string_view owner_id);

  // Raw chunk items in chunk_id order, without regrouping.
  std::optional<ItemBatch> get_items(std::string_view owner_id);

  // Reassign every chunk of source to target, preserving chunk ids. All or nothing.
  bool move(std::string_view source_id, std::string_view target_id);

  // Like move(), but target's existing chunks are deleted in the same
  // transaction, so readers see either the old or the new dataset.
  bool replace(std::string_view source_id, std::string_view target_id);

  // Chunks plus any legacy whole-playlist record. No-op for unknown owners.
  bool delete_all(std::string_view owner_id);

  // Wipe everything (full application reset).
  bool clear();

  std::int64_t chunk_count(std::string_view owner_id);
  // Ascending.
  std::vector<std::int64_t> chunk_ids(std::string_view owner_id);
  const std::string& last_error() const noexcept { return err_; }

private:
  bool open();
  bool exec(const char* sql);
  bool begin();
  bool commit();
  void rollback();
  bool move_locked(std::string_view source_id, std::string_view target_id);
  bool delete_owner_locked(std::string_view owner_id);
  void fail(const char* what);

  Config cfg_;
  sqlite3* db_{nullptr};
  std::mutex mu_;   // one connection; serializes transactions across sync flows
  std::string err_;
};

// Staging owner id used while a sync is in flight.
std::string temp_owner_id(std::string_view resource_id);

// True for ids in the staging namespace; resources may not use them.
bool is_temp_owner_id(std::string_view id) noexcept;

}
