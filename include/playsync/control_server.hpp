#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace ps {

class ResourceRegistry;
class SyncOrchestrator;

// Local JSON API over cpp-httplib for a presentation layer:
//   GET  /resources              descriptors with status
//   GET  /resources/<id>/data    committed dataset, grouped
//   GET  /aggregate              datasets of all active resources
//   POST /resources/<id>/sync    start a background sync (202)
//   POST /resources/<id>/cancel  signal the in-flight sync
//   GET  /revision               bumped on every render notification
class ControlServer {
public:
  struct Config {
    std::string host = "127.0.0.1";
    int port = 8080;                 // 0 picks a free port
    bool save_after_sync = true;     // persist descriptors when a sync commits
  };

  ControlServer(ResourceRegistry& registry, SyncOrchestrator& orchestrator, Config cfg);
  ~ControlServer();
  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Bind only; returns false on bind error.
  bool start();

  // Blocking run (binds first if needed); returns when stopped.
  int run();

  // Stops listening, cancels queued and running syncs and joins their threads.
  void stop();

  // Same as POST /resources/<id>/sync. False for unknown ids.
  bool start_sync(const std::string& id);

  // Same as POST /resources/<id>/cancel. Also stops a request whose worker
  // has not reached the orchestrator yet. True if anything was pending.
  bool cancel_sync(const std::string& id);

  // Sync threads not yet joined; finished ones are joined on the next start_sync.
  std::size_t worker_count() const;

  int port() const noexcept;
  std::uint64_t revision() const noexcept;

private:
  struct Impl;
  Impl* p_;
};

}
