#pragma once
#include "playsync/chunk_store.hpp"
#include "playsync/fetcher.hpp"
#include "playsync/metrics.hpp"
#include "playsync/provider_client.hpp"
#include "playsync/resource.hpp"
#include "playsync/stream_parser.hpp"
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace ps {

// Drives one resource sync from trigger to committed state.
//
// Data is staged under temp_owner_id(id) and becomes visible under id only
// through ChunkStore::replace(). A new sync of a resource cancels the one in
// flight and waits for it to settle, so each owner id has one writer.
// Distinct resources may sync concurrently from different threads.
class SyncOrchestrator {
public:
  struct Config {
    StreamParser::Config parser;
    std::size_t provider_chunk_size = 2000;
    std::size_t queue_depth = 1;             // batches buffered between parser and writer
    HttpFetcher::Config http;                // playlist downloads
    HttpFetcher::Config provider_http{30, 30, true, "playsync/1.0"};
  };

  // Observer hooks. on_status_update may run on the parsing thread.
  struct Observer {
    std::function<void(const std::string& resource_id, const Stats&)> on_status_update;
    std::function<void()> on_render;
  };

  using ProviderFactory =
      std::function<std::unique_ptr<ProviderSource>(const ProviderCredentials&)>;

  // Uses HttpFetcher for playlists and XtreamClient for providers.
  explicit SyncOrchestrator(ChunkStore& store);
  SyncOrchestrator(ChunkStore& store, Config cfg);
  SyncOrchestrator(ChunkStore& store, Config cfg, std::shared_ptr<Fetcher> fetcher,
                   ProviderFactory providers);
  ~SyncOrchestrator();
  SyncOrchestrator(const SyncOrchestrator&) = delete;
  SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

  // Runs to a terminal status (synced, error or cancelled) and returns it.
  // A request superseded before it started returns cancelled and leaves
  // `res` untouched.
  SyncStatus sync(Resource& res, const Observer& obs = {});

  // Signals the in-flight token of the resource. False when none is running.
  bool cancel_sync(const std::string& resource_id);
  bool cancel_sync(const Resource& res) { return cancel_sync(res.id); }
  void cancel_all();

  bool is_syncing(const std::string& resource_id) const;

  std::optional<SyncReport> last_report(const std::string& resource_id) const;

  ChunkStore& store() noexcept { return store_; }
  const Config& config() const noexcept { return cfg_; }

private:
  struct Slot {
    CancelTokenPtr token;   // newest request
    bool active = false;    // a flow is between start and cleanup
  };

  Stats run_playlist(Resource& res, const std::string& temp, const CancelToken& token,
                     const Observer& obs, MetricsRegistry& metrics);
  Stats run_provider(Resource& res, const std::string& temp, const CancelToken& token,
                     const Observer& obs, MetricsRegistry& metrics);
  void release(const std::string& resource_id, const CancelTokenPtr& token);

  ChunkStore& store_;
  Config cfg_;
  std::shared_ptr<Fetcher> fetcher_;
  std::shared_ptr<Fetcher> provider_fetcher_;
  ProviderFactory providers_;

  mutable std::mutex mu_;
  std::condition_variable settled_;
  std::unordered_map<std::string, Slot> slots_;
  std::unordered_map<std::string, SyncReport> reports_;
};

}
