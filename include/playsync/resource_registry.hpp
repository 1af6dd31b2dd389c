#pragma once
#include "playsync/resource.hpp"
#include <cstddef>
#include <list>
#include <string>
#include <string_view>
#include <vector>

namespace ps {

class ChunkStore;

// How merge_remote() treats local resources missing from the remote list.
enum class MergePolicy {
  AddOrUpdate,  // keep them
  Mirror        // delete them (descriptor and stored chunks)
};

struct MergeResult {
  std::size_t added = 0;
  std::size_t updated = 0;
  std::vector<std::string> deleted_ids;
  bool changed() const noexcept { return added || updated || !deleted_ids.empty(); }
};

// Resource descriptors persisted as a JSON array. Not thread-safe.
// References returned by add()/find() stay valid until that resource is removed.
class ResourceRegistry {
public:
  struct Config {
    std::string path = "resources.json";
  };

  ResourceRegistry();
  explicit ResourceRegistry(Config cfg);

  // A missing file is an empty registry. Transient state is reset:
  // queued if active, disabled otherwise.
  bool load();
  // Written to "<path>.tmp" and renamed over <path>.
  bool save();

  Resource& add(std::string name, std::string url);
  Resource& add_provider(std::string name, ProviderCredentials creds);

  // Drops the descriptor and, with a store, its chunks. False for unknown ids.
  bool remove(const std::string& id, ChunkStore* store = nullptr);
  bool set_active(const std::string& id, bool active);

  // Renames; a changed source (url, type or credentials) also clears stats,
  // last sync time, dataset and stored chunks and sets status pending.
  bool update(const std::string& id, std::string name, std::string url,
              ResourceType type, std::optional<ProviderCredentials> creds = std::nullopt,
              ChunkStore* store = nullptr);

  Resource* find(const std::string& id);
  const Resource* find(const std::string& id) const;

  std::list<Resource>& resources() noexcept { return items_; }
  const std::list<Resource>& resources() const noexcept { return items_; }
  std::size_t size() const noexcept { return items_.size(); }

  // For active resources without a dataset: hit -> synced, miss -> pending.
  // Returns the number of hits.
  std::size_t load_cached(ChunkStore& store);

  // Datasets of active resources merged into one view; items carry the
  // resource name in `source`.
  Dataset aggregate() const;

  // Remote list matched by id, or by url and name. Unknown entries are added
  // as pending; a changed source marks the local entry pending.
  MergeResult merge_remote(std::string_view json, MergePolicy policy = MergePolicy::AddOrUpdate,
                           ChunkStore* store = nullptr);

  // Persisted shape of all descriptors / of one resource with its status.
  std::string to_json() const;
  static std::string descriptor_json(const Resource& r, bool with_status);

  // Decodes a descriptor array. Entries without an id, or with one in the
  // staging namespace, get one assigned.
  static bool parse(std::string_view json, std::vector<Resource>& out, std::string* err = nullptr);

  const Config& config() const noexcept { return cfg_; }
  const std::string& last_error() const noexcept { return err_; }

private:
  std::string new_id(std::string_view name, std::string_view source) const;

  Config cfg_;
  std::list<Resource> items_;
  std::string err_;
};

}
