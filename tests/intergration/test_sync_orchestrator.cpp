#include "playsync/cancel_token.hpp"
#include "playsync/chunk_store.hpp"
#include "playsync/errors.hpp"
#include "playsync/fetcher.hpp"
#include "playsync/sync_orchestrator.hpp"
#include "playsync/url_utils.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <set>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

// In-memory bodies. When `stall_calls` > 0, that many fetches serve `stall_after`
// bytes and then wait for cancellation. Urls in `fail_after` drop the
// connection after that many bytes.
class ScriptedFetcher : public ps::Fetcher {
public:
  std::map<std::string, std::string> bodies;
  std::map<std::string, std::size_t> fail_after;
  std::atomic<int> stall_calls{0};
  std::size_t stall_after = 0;
  std::atomic<int> calls{0};
  std::size_t block = 256;

  void fetch(const std::string& url, const ps::CancelToken& token,
             const BlockCallback& on_block) override {
    ++calls;
    std::string body;
    std::size_t limit;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = bodies.find(url);
      if (it == bodies.end()) throw ps::NetworkError("HTTP 404");
      body = it->second;
      auto f = fail_after.find(url);
      limit = f == fail_after.end() ? body.size() : f->second;
    }
    const bool stall = stall_calls.fetch_sub(1) > 0;
    for (std::size_t off = 0; off < body.size(); off += block) {
      token.throw_if_cancelled();
      if (stall && off >= stall_after) {
        while (!token.cancelled()) std::this_thread::sleep_for(1ms);
        token.throw_if_cancelled();
      }
      if (off >= limit) throw ps::NetworkError("connection reset");
      on_block(std::string_view(body).substr(off, block));
    }
  }

private:
  std::mutex mu_;
};

class FakeProvider : public ps::ProviderSource {
public:
  explicit FakeProvider(bool fail) : fail_(fail) {}
  ps::ProviderResult fetch_all(const ps::CancelToken& token) override {
    token.throw_if_cancelled();
    if (fail_) throw ps::NetworkError("provider unreachable");
    ps::ProviderResult r;
    const char* names[] = {"c1", "c2", "m1", "m2", "s1"};
    const ps::Category cats[] = {ps::Category::Channels, ps::Category::Channels, ps::Category::Movies,
                                 ps::Category::Movies, ps::Category::Series};
    for (int i = 0; i < 5; ++i) {
      ps::PlaylistItem it;
      it.title = names[i];
      it.url = std::string("http://p/") + names[i];
      it.category = cats[i];
      it.group = "P";
      r.stats.add(it.category);
      r.data.add(std::move(it));
    }
    return r;
  }
private:
  bool fail_;
};

static std::string synth(std::size_t n, const char* tag) {
  std::ostringstream o;
  o << "#EXTM3U\n";
  for (std::size_t i = 0; i < n; ++i)
    o << "#EXTINF:-1 group-title=\"G\"," << tag << " " << i << "\nhttp://h/live/" << tag << i << ".ts\n";
  return o.str();
}

static bool wait_for(const std::function<bool()>& cond, std::chrono::milliseconds limit = 5000ms) {
  const auto end = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < end) {
    if (cond()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return cond();
}

int main(){
  const fs::path db = fs::temp_directory_path() / "ps_test_sync.db";
  fs::remove(db); fs::remove(db.string() + "-wal"); fs::remove(db.string() + "-shm");

  std::ifstream in("tests/data/sample.m3u8", std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  const std::string fixture = ss.str();
  if (fixture.empty()) { std::cerr << "[ERR] missing tests/data/sample.m3u8\n"; return 2; }

  ps::ChunkStore::Config scfg;
  scfg.path = db.string();
  ps::ChunkStore store(scfg);

  auto fetcher = std::make_shared<ScriptedFetcher>();
  fetcher->bodies["http://src/list.m3u8"] = fixture;
  fetcher->bodies["http://src/big.m3u8"] = synth(4500, "big");
  fetcher->bodies["http://src/slow.m3u8"] = synth(3000, "slow");

  ps::SyncOrchestrator::Config ocfg;
  ocfg.parser.proxy_template = "http://proxy/?u={url}";
  ocfg.parser.batch_size = 500;
  ocfg.provider_chunk_size = 2;
  bool provider_fails = false;
  ps::SyncOrchestrator orch(store, ocfg, fetcher, [&](const ps::ProviderCredentials&) {
    return std::unique_ptr<ps::ProviderSource>(new FakeProvider(provider_fails));
  });

  // success path
  ps::Resource res;
  res.id = "R1";
  res.name = "Sample";
  res.url = "http://src/list.m3u8";
  {
    int updates = 0, renders = 0;
    ps::SyncOrchestrator::Observer obs;
    obs.on_status_update = [&](const std::string& id, const ps::Stats&) { if (id == "R1") ++updates; };
    obs.on_render = [&] { ++renders; };
    auto st = orch.sync(res, obs);
    check(st == ps::SyncStatus::Synced && res.status == ps::SyncStatus::Synced, "m3u sync reaches synced");
    check(res.stats == ps::Stats{3, 2, 1} && res.data && res.data->item_count() == 6, "stats and dataset loaded");
    check(res.last_synced_ms.has_value() && !res.loading && !res.cancel_token && !res.progress,
          "transient state cleared");
    check(store.chunk_count(ps::temp_owner_id("R1")) == 0 && store.chunk_count("R1") == 1, "committed under real id");
    check(updates >= 2 && renders >= 2, "observers notified at start and end");
    auto report = orch.last_report("R1");
    check(report && report->items == 6 && report->chunks == 1 && report->outcome == "synced", "sync report recorded");
  }

  // chunking follows the batch size
  {
    ps::Resource big;
    big.id = "BIG";
    big.url = "http://src/big.m3u8";
    check(orch.sync(big) == ps::SyncStatus::Synced && store.chunk_count("BIG") == 9 &&
          big.stats.channels == 4500, "4500 items stored as nine chunks of 500");
  }

  const auto before = store.get_all("R1");

  // error path keeps committed data
  {
    res.url = "http://src/missing.m3u8";
    auto st = orch.sync(res);
    check(st == ps::SyncStatus::Error && res.status == ps::SyncStatus::Error, "unreachable source ends in error");
    auto after = store.get_all("R1");
    check(before && after && before->flatten() == after->flatten(), "error leaves prior data untouched");
    check(store.chunk_count(ps::temp_owner_id("R1")) == 0 && !res.loading && !res.cancel_token, "error cleans up");
  }

  // cancel mid-sync
  {
    res.url = "http://src/slow.m3u8";
    fetcher->stall_calls = 1;
    fetcher->stall_after = 60 * 1024;
    ps::SyncStatus st = ps::SyncStatus::Pending;
    std::thread t([&] { st = orch.sync(res); });
    const bool staged = wait_for([&] { return store.chunk_count(ps::temp_owner_id("R1")) > 0; });
    check(staged, "partial data staged under temp owner");
    check(orch.is_syncing("R1") && orch.cancel_sync("R1"), "cancel signalled");
    t.join();
    check(st == ps::SyncStatus::Cancelled && res.status == ps::SyncStatus::Cancelled, "cancelled status");
    check(store.chunk_count(ps::temp_owner_id("R1")) == 0, "no temp chunks after cancel");
    auto after = store.get_all("R1");
    check(before && after && before->flatten() == after->flatten(), "cancel leaves prior data untouched");
    check(!orch.is_syncing("R1") && !orch.cancel_sync("R1"), "nothing in flight afterwards");
  }

  // a second request supersedes the first
  {
    res.url = "http://src/slow.m3u8";
    fetcher->stall_calls = 1;
    fetcher->stall_after = 60 * 1024;
    ps::SyncStatus first = ps::SyncStatus::Pending;
    std::thread t([&] { first = orch.sync(res); });
    wait_for([&] { return store.chunk_count(ps::temp_owner_id("R1")) > 0; });
    auto second = orch.sync(res);
    t.join();
    check(first == ps::SyncStatus::Cancelled, "first flow observed cancellation");
    check(second == ps::SyncStatus::Synced && res.status == ps::SyncStatus::Synced, "second flow committed");
    check(store.chunk_count(ps::temp_owner_id("R1")) == 0, "no temp chunks after both settle");
    check(res.stats.channels == 3000 && res.data && res.data->item_count() == 3000, "second flow's data visible");
  }

  // direct fetch dies after two staged batches; the proxy copy replaces them
  {
    const std::string url = "http://src/flaky.m3u8";
    const std::string body = synth(1800, "flaky");
    fetcher->bodies[url] = body;
    fetcher->fail_after[url] = 70 * 1024;
    fetcher->bodies[ps::make_proxy_url(ocfg.parser.proxy_template, url)] = body;

    ps::Resource flaky;
    flaky.id = "FLAKY";
    flaky.url = url;
    const int calls_before = fetcher->calls;
    check(orch.sync(flaky) == ps::SyncStatus::Synced && fetcher->calls - calls_before == 2,
          "proxy retry after partial direct download commits");
    auto items = store.get_items("FLAKY");
    std::set<std::string> urls;
    if (items) for (const auto& it : *items) urls.insert(it.url);
    check(items && items->size() == 1800 && urls.size() == 1800 && flaky.stats.channels == 1800,
          "no items duplicated across the retry");
    check(items && items->front().title == "flaky 0" && items->back().title == "flaky 1799",
          "encounter order kept");
    check(store.chunk_ids("FLAKY") == std::vector<std::int64_t>{0, 1, 2, 3}, "chunk ids restart at zero");
    auto report = orch.last_report("FLAKY");
    check(report && report->items == 1800 && report->chunks == 4, "report counts only the retry");
  }

  // provider path
  {
    ps::Resource prov;
    prov.id = "P1";
    prov.type = ps::ResourceType::Provider;
    prov.credentials = ps::ProviderCredentials{"h", "u", "p"};
    check(orch.sync(prov) == ps::SyncStatus::Synced && prov.stats == ps::Stats{2, 2, 1} &&
          store.chunk_count("P1") == 3, "provider items chunked by provider_chunk_size");
    auto items = store.get_items("P1");
    check(items && items->size() == 5 && (*items)[2].title == "m1" && (*items)[2].category == ps::Category::Movies,
          "provider items keep their category");

    provider_fails = true;
    check(orch.sync(prov) == ps::SyncStatus::Error && store.chunk_count("P1") == 3, "provider failure keeps data");

    ps::Resource nocreds;
    nocreds.id = "P2";
    nocreds.type = ps::ResourceType::Provider;
    check(orch.sync(nocreds) == ps::SyncStatus::Error, "provider without credentials fails");
  }

  fs::remove(db); fs::remove(db.string() + "-wal"); fs::remove(db.string() + "-shm");
  return failures ? 1 : 0;
}
