#include "playsync/chunk_store.hpp"
#include "playsync/control_server.hpp"
#include "playsync/item_json.hpp"
#include "playsync/resource_registry.hpp"
#include "playsync/sync_orchestrator.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Cli {
  std::string db = "playsync.db";
  std::string resources = "resources.json";
  int port = 8080;
  int batch_size = 2000;
  int cancel_after_ms = 0;
  std::string proxy;                // empty keeps the default template
  bool no_proxy = false;
  bool list = false;
  bool sync_all = false;
  bool serve = false;
  bool mirror = false;
  std::vector<std::string> syncs;
  std::vector<std::string> removes;
  std::vector<std::string> dumps;
  std::string merge_remote;         // file holding a remote descriptor list
  struct AddM3u { std::string name, url; };
  struct AddProvider { std::string name; ps::ProviderCredentials creds; };
  std::vector<AddM3u> add_m3u;
  std::vector<AddProvider> add_provider;
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    auto eat_list = [&](const char* pfx, std::vector<std::string>* out){
      if (a.rfind(pfx, 0) == 0) { out->push_back(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--db=", &c.db)) continue;
    if (eat("--resources=", &c.resources)) continue;
    if (eat_i("--port=", &c.port)) continue;
    if (eat_i("--batch-size=", &c.batch_size)) continue;
    if (eat_i("--cancel-after-ms=", &c.cancel_after_ms)) continue;
    if (eat("--proxy=", &c.proxy)) continue;
    if (eat("--merge-remote=", &c.merge_remote)) continue;
    if (eat_list("--sync=", &c.syncs)) continue;
    if (eat_list("--remove=", &c.removes)) continue;
    if (eat_list("--dump=", &c.dumps)) continue;
    if (a == "--no-proxy") { c.no_proxy = true; continue; }
    if (a == "--list")     { c.list = true; continue; }
    if (a == "--sync-all") { c.sync_all = true; continue; }
    if (a == "--serve")    { c.serve = true; continue; }
    if (a == "--mirror")   { c.mirror = true; continue; }
    if (a == "--add-m3u" && i+2 < argc) {
      c.add_m3u.push_back({argv[i+1], argv[i+2]});
      i += 2;
      continue;
    }
    if (a == "--add-provider" && i+4 < argc) {
      c.add_provider.push_back({argv[i+1], {argv[i+2], argv[i+3], argv[i+4]}});
      i += 4;
      continue;
    }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: playsync [--db=FILE] [--resources=FILE] [--list]\n"
        "                [--add-m3u NAME URL] [--add-provider NAME HOST USER PASS]\n"
        "                [--remove=ID] [--merge-remote=FILE [--mirror]]\n"
        "                [--sync=ID] [--sync-all] [--cancel-after-ms=N]\n"
        "                [--batch-size=N] [--proxy=TEMPLATE|--no-proxy]\n"
        "                [--dump=ID] [--serve] [--port=N]\n";
      std::exit(0);
    }
    std::cerr << "[cli] ignoring unknown argument: " << a << "\n";
  }
  return c;
}

std::string format_stats(const ps::Stats& s) {
  std::ostringstream o;
  o << "channels=" << s.channels << " movies=" << s.movies << " series=" << s.series;
  return o.str();
}

void print_list(const ps::ResourceRegistry& reg) {
  if (reg.size() == 0) { std::cout << "(no resources)\n"; return; }
  for (const auto& r : reg.resources()) {
    std::cout << r.id << "  " << ps::type_name(r.type) << "  "
              << ps::status_name(r.status) << "  " << r.name << "  "
              << format_stats(r.stats) << "  last_synced="
              << (r.last_synced_ms ? std::to_string(*r.last_synced_ms) : std::string("never"))
              << "\n";
  }
}

bool read_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);

  ps::ChunkStore::Config scfg;
  scfg.path = cli.db;
  ps::ChunkStore store(scfg);
  if (!store.is_open()) {
    std::cerr << "[store] cannot open " << cli.db << ": " << store.last_error() << "\n";
    return 2;
  }

  ps::ResourceRegistry::Config rcfg;
  rcfg.path = cli.resources;
  ps::ResourceRegistry registry(rcfg);
  if (!registry.load()) return 2;

  bool dirty = false;

  for (const auto& a : cli.add_m3u) {
    auto& r = registry.add(a.name, a.url);
    std::cout << "[registry] added " << r.id << " (" << r.name << ")\n";
    dirty = true;
  }
  for (const auto& a : cli.add_provider) {
    auto& r = registry.add_provider(a.name, a.creds);
    std::cout << "[registry] added " << r.id << " (" << r.name << ")\n";
    dirty = true;
  }
  for (const auto& id : cli.removes) {
    if (registry.remove(id, &store)) { std::cout << "[registry] removed " << id << "\n"; dirty = true; }
    else std::cerr << "[registry] unknown resource: " << id << "\n";
  }
  if (!cli.merge_remote.empty()) {
    std::string body;
    if (!read_file(cli.merge_remote, body)) {
      std::cerr << "[registry] cannot read " << cli.merge_remote << "\n";
      return 2;
    }
    auto policy = cli.mirror ? ps::MergePolicy::Mirror : ps::MergePolicy::AddOrUpdate;
    auto result = registry.merge_remote(body, policy, &store);
    dirty = dirty || result.changed();
  }
  if (dirty && !registry.save()) return 2;

  ps::SyncOrchestrator::Config ocfg;
  ocfg.parser.batch_size = cli.batch_size > 0 ? static_cast<std::size_t>(cli.batch_size) : 2000;
  ocfg.provider_chunk_size = ocfg.parser.batch_size;
  if (cli.no_proxy) ocfg.parser.proxy_template.clear();
  else if (!cli.proxy.empty()) ocfg.parser.proxy_template = cli.proxy;
  ps::SyncOrchestrator orch(store, ocfg);

  std::vector<std::string> targets = cli.syncs;
  if (cli.sync_all) {
    for (const auto& r : registry.resources())
      if (r.active) targets.push_back(r.id);
  }

  if (!targets.empty()) {
    std::atomic<bool> finished{false};
    std::atomic<bool> fired{false};
    std::thread canceller;
    if (cli.cancel_after_ms > 0) {
      canceller = std::thread([&]{
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(cli.cancel_after_ms);
        while (!finished.load() && std::chrono::steady_clock::now() < deadline)
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        if (finished.load()) return;
        fired = true;
        std::cout << "[sync] cancelling after " << cli.cancel_after_ms << " ms\n";
        orch.cancel_all();
      });
    }

    ps::SyncOrchestrator::Observer obs;
    obs.on_status_update = [](const std::string& id, const ps::Stats& s) {
      std::cout << "[sync] " << id << " " << format_stats(s) << "\n";
    };

    int failures = 0;
    for (const auto& id : targets) {
      ps::Resource* r = registry.find(id);
      if (!r) { std::cerr << "[sync] unknown resource: " << id << "\n"; ++failures; continue; }
      if (fired.load()) {
        r->status = ps::SyncStatus::Cancelled;
        continue;
      }
      auto status = orch.sync(*r, obs);
      std::cout << "[sync] " << r->name << " -> " << ps::status_name(status)
                << " (" << format_stats(r->stats) << ")\n";
      if (status == ps::SyncStatus::Error) ++failures;
    }

    finished = true;
    if (canceller.joinable()) canceller.join();
    if (!registry.save()) return 2;
    if (failures && !cli.serve) return 3;
  }

  for (const auto& id : cli.dumps) {
    auto data = store.get_all(id);
    if (!data) { std::cerr << "[store] no data for " << id << "\n"; continue; }
    std::cout << ps::ItemJson::dataset_to_json(*data) << "\n";
  }

  if (cli.list) print_list(registry);

  if (cli.serve) {
    registry.load_cached(store);
    ps::ControlServer::Config ccfg;
    ccfg.port = cli.port;
    ps::ControlServer server(registry, orch, ccfg);
    int rc = server.run();
    if (rc != 0) {
      std::cerr << "Server failed to start on port " << cli.port << "\n";
      return rc;
    }
  }
  return 0;
}
