#include "playsync/control_server.hpp"
#include "playsync/item_json.hpp"
#include "playsync/resource_registry.hpp"
#include "playsync/sync_orchestrator.hpp"
#include <httplib.h>
#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ps {

namespace {

const char* kJson = "application/json; charset=utf-8";

// Descriptor fields only; the dataset stays with the registry.
Resource work_copy(const Resource& r) {
  Resource w;
  w.id = r.id;
  w.name = r.name;
  w.type = r.type;
  w.url = r.url;
  w.credentials = r.credentials;
  w.active = r.active;
  w.stats = r.stats;
  w.last_synced_ms = r.last_synced_ms;
  w.status = r.status;
  return w;
}

void json_error(httplib::Response& res, int status, const std::string& msg) {
  std::ostringstream o;
  o << "{\"error\":"; write_json_string(o, msg); o << '}';
  res.status = status;
  res.set_content(o.str(), kJson);
}

}

struct ControlServer::Impl {
  ResourceRegistry& registry;
  SyncOrchestrator& orch;
  Config cfg;
  httplib::Server svr;
  bool bound = false;
  int bound_port = 0;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::mutex mu;   // registry and bookkeeping below
  std::unordered_map<std::string, std::uint64_t> generation;
  std::unordered_map<std::string, std::uint64_t> cancelled_upto;   // generations <= value are cancelled
  std::unordered_map<std::string, int> in_flight;
  std::vector<Worker> workers;
  bool stopping = false;
  std::atomic<std::uint64_t> revision{0};

  Impl(ResourceRegistry& r, SyncOrchestrator& o, Config c)
    : registry(r), orch(o), cfg(std::move(c)) {}

  bool cancel_requested(const std::string& id, std::uint64_t gen) const {
    auto it = cancelled_upto.find(id);
    return it != cancelled_upto.end() && it->second >= gen;
  }

  // Caller holds mu. A finished worker no longer touches mu, so the join is short.
  void reap_finished() {
    for (auto it = workers.begin(); it != workers.end();) {
      if (it->done->load()) {
        it->thread.join();
        it = workers.erase(it);
      } else {
        ++it;
      }
    }
  }

  bool start_sync(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu);
    if (stopping) return false;
    Resource* r = registry.find(id);
    if (!r) return false;
    reap_finished();

    const std::uint64_t gen = ++generation[id];
    ++in_flight[id];
    Resource work = work_copy(*r);
    r->status = SyncStatus::Syncing;
    r->loading = true;
    r->progress = Stats{};
    ++revision;

    auto done = std::make_shared<std::atomic<bool>>(false);
    workers.push_back(Worker{std::thread([this, gen, done, work = std::move(work)]() mutable {
      run_sync(std::move(work), gen);
      done->store(true);
    }), done});
    return true;
  }

  // Marks every queued or running generation of `id` cancelled and signals
  // the orchestrator. True if anything was pending.
  bool cancel(const std::string& id) {
    bool pending;
    {
      std::lock_guard<std::mutex> lk(mu);
      cancelled_upto[id] = generation[id];
      pending = in_flight[id] > 0;
    }
    const bool signalled = orch.cancel_sync(id);
    return pending || signalled;
  }

  void run_sync(Resource work, std::uint64_t gen) {
    const std::string id = work.id;
    SyncOrchestrator::Observer obs;
    obs.on_status_update = [this, &id, &work, gen](const std::string&, const Stats& s) {
      std::lock_guard<std::mutex> lk(mu);
      // work.cancel_token is live from the first update on; a cancel that
      // arrived before the orchestrator issued it is applied here.
      if (cancel_requested(id, gen) && work.cancel_token) work.cancel_token->cancel();
      if (generation[id] != gen) return;
      if (Resource* r = registry.find(id)) r->progress = s;
    };
    obs.on_render = [this] { ++revision; };

    bool skip;
    {
      std::lock_guard<std::mutex> lk(mu);
      skip = stopping || cancel_requested(id, gen);
    }
    const SyncStatus status = skip ? SyncStatus::Cancelled : orch.sync(work, obs);

    std::lock_guard<std::mutex> lk(mu);
    --in_flight[id];
    if (generation[id] != gen) return;   // a newer request reports
    Resource* r = registry.find(id);
    if (!r) return;
    r->loading = false;
    r->progress.reset();
    r->status = status;
    if (status == SyncStatus::Synced) {
      r->stats = work.stats;
      r->last_synced_ms = work.last_synced_ms;
      r->data = std::move(work.data);
      if (cfg.save_after_sync && !registry.save())
        std::cerr << "[server] saving resources failed: " << registry.last_error() << "\n";
    }
    ++revision;
  }

  void routes() {
    svr.Get("/resources", [this](const httplib::Request&, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mu);
      std::ostringstream o;
      o << '[';
      bool first = true;
      for (const auto& r : registry.resources()) {
        if (!first) o << ',';
        first = false;
        o << ResourceRegistry::descriptor_json(r, /*with_status=*/true);
      }
      o << ']';
      res.set_content(o.str(), kJson);
    });

    svr.Get(R"(/resources/([^/]+)/data)", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mu);
      const Resource* r = registry.find(req.matches[1].str());
      if (!r) { json_error(res, 404, "unknown resource"); return; }
      if (!r->data) { json_error(res, 404, "no data"); return; }
      res.set_content(ItemJson::dataset_to_json(*r->data), kJson);
    });

    svr.Get("/aggregate", [this](const httplib::Request&, httplib::Response& res) {
      std::lock_guard<std::mutex> lk(mu);
      res.set_content(ItemJson::dataset_to_json(registry.aggregate()), kJson);
    });

    svr.Post(R"(/resources/([^/]+)/sync)", [this](const httplib::Request& req, httplib::Response& res) {
      const std::string id = req.matches[1].str();
      if (!start_sync(id)) { json_error(res, 404, "unknown resource"); return; }
      std::ostringstream o;
      o << "{\"id\":"; write_json_string(o, id); o << ",\"status\":\"syncing\"}";
      res.status = 202;
      res.set_content(o.str(), kJson);
    });

    svr.Post(R"(/resources/([^/]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
      const std::string id = req.matches[1].str();
      {
        std::lock_guard<std::mutex> lk(mu);
        if (!registry.find(id)) { json_error(res, 404, "unknown resource"); return; }
      }
      const bool signalled = cancel(id);
      res.set_content(std::string("{\"cancelled\":") + (signalled ? "true" : "false") + "}", kJson);
    });

    svr.Get("/revision", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content("{\"revision\":" + std::to_string(revision.load()) + "}", kJson);
    });
  }

  bool bind() {
    if (bound) return true;
    if (cfg.port == 0) {
      bound_port = svr.bind_to_any_port(cfg.host);
      bound = bound_port > 0;
    } else {
      bound = svr.bind_to_port(cfg.host, cfg.port);
      bound_port = bound ? cfg.port : 0;
    }
    if (!bound) std::cerr << "[server] cannot bind " << cfg.host << ":" << cfg.port << "\n";
    return bound;
  }

  void shutdown() {
    std::vector<Worker> joinable;
    {
      std::lock_guard<std::mutex> lk(mu);
      stopping = true;
      for (const auto& kv : generation) cancelled_upto[kv.first] = kv.second;
      joinable.swap(workers);
    }
    svr.stop();
    orch.cancel_all();
    for (auto& w : joinable) w.thread.join();
  }
};

ControlServer::ControlServer(ResourceRegistry& registry, SyncOrchestrator& orchestrator, Config cfg)
  : p_(new Impl(registry, orchestrator, std::move(cfg))) { p_->routes(); }

ControlServer::~ControlServer() {
  p_->shutdown();
  delete p_;
}

bool ControlServer::start() { return p_->bind(); }

int ControlServer::run() {
  if (!p_->bind()) return -1;
  std::cout << "[server] listening on http://" << p_->cfg.host << ":" << p_->bound_port << "\n";
  p_->svr.listen_after_bind();
  return 0;
}

void ControlServer::stop() { p_->shutdown(); }

bool ControlServer::start_sync(const std::string& id) { return p_->start_sync(id); }

bool ControlServer::cancel_sync(const std::string& id) {
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    if (!p_->registry.find(id)) return false;
  }
  return p_->cancel(id);
}

std::size_t ControlServer::worker_count() const {
  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->workers.size();
}

int ControlServer::port() const noexcept { return p_->bound_port; }

std::uint64_t ControlServer::revision() const noexcept { return p_->revision.load(); }

}
