#include "playsync/chunk_store.hpp"
#include "playsync/resource_registry.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static ps::PlaylistItem item(std::string title, ps::Category c) {
  ps::PlaylistItem it;
  it.title = title;
  it.url = "http://h/" + title;
  it.group = "G";
  it.category = c;
  return it;
}

int main(){
  const fs::path dir = fs::temp_directory_path() / "ps_test_registry";
  fs::remove_all(dir);

  ps::ChunkStore::Config scfg;
  scfg.path = ":memory:";
  ps::ChunkStore store(scfg);

  ps::ResourceRegistry::Config cfg;
  cfg.path = (dir / "nested" / "resources.json").string();

  std::string m3u_id, prov_id;
  {
    ps::ResourceRegistry reg(cfg);
    check(reg.load() && reg.size() == 0, "missing file loads as empty");

    auto& a = reg.add("Home \"List\"", "http://h/list.m3u8");
    a.stats = ps::Stats{5, 2, 1};
    a.last_synced_ms = 1700000000123;
    m3u_id = a.id;
    auto& p = reg.add_provider("Provider", {"tv.example:8080", "user", "p@ss"});
    prov_id = p.id;
    check(!m3u_id.empty() && m3u_id != prov_id, "ids assigned and distinct");
    check(reg.set_active(prov_id, false), "deactivate provider");
    check(reg.save(), "save writes file");
    check(fs::exists(cfg.path) && !fs::exists(cfg.path + ".tmp"), "temp file renamed into place");
  }

  // reload resets transient state
  {
    ps::ResourceRegistry reg(cfg);
    check(reg.load() && reg.size() == 2, "reload finds both resources");
    const auto* a = reg.find(m3u_id);
    const auto* p = reg.find(prov_id);
    check(a && a->name == "Home \"List\"" && a->url == "http://h/list.m3u8" &&
          a->type == ps::ResourceType::M3u && a->stats == ps::Stats{5, 2, 1} &&
          a->last_synced_ms && *a->last_synced_ms == 1700000000123, "m3u descriptor round-trips");
    check(a && a->status == ps::SyncStatus::Queued && !a->loading && !a->cancel_token,
          "active resource comes back queued");
    check(p && p->type == ps::ResourceType::Provider && p->credentials &&
          p->credentials->password == "p@ss" && !p->active && p->status == ps::SyncStatus::Disabled,
          "provider descriptor round-trips disabled");
  }

  // cached data, aggregate, update, remove
  {
    ps::ResourceRegistry reg(cfg);
    reg.load();
    store.put(m3u_id, 0, ps::ItemBatch{item("one", ps::Category::Channels), item("two", ps::Category::Movies)});
    check(reg.load_cached(store) == 1, "one cache hit");
    auto* a = reg.find(m3u_id);
    check(a && a->status == ps::SyncStatus::Synced && a->data && a->data->item_count() == 2,
          "cached dataset loaded");

    reg.set_active(prov_id, true);
    auto& b = reg.add("Other", "http://o/list.m3u8");
    b.data = ps::Dataset{};
    b.data->add(item("three", ps::Category::Channels));
    auto agg = reg.aggregate();
    const auto* g = agg.at(ps::Category::Channels).find("G");
    check(agg.item_count() == 3 && g && g->items.size() == 2 && g->items[0].source == "Home \"List\""
          && g->items[1].source == "Other", "aggregate tags items with their resource");

    check(reg.update(m3u_id, "Renamed", "http://h/list.m3u8", ps::ResourceType::M3u, std::nullopt, &store)
          && a->name == "Renamed" && a->data && store.get_all(m3u_id), "rename keeps data");
    check(reg.update(m3u_id, "Renamed", "http://h/other.m3u8", ps::ResourceType::M3u, std::nullopt, &store)
          && !a->data && a->stats == ps::Stats{} && !a->last_synced_ms
          && a->status == ps::SyncStatus::Pending && !store.get_all(m3u_id), "source change resets");

    store.put(b.id, 0, ps::ItemBatch{item("x", ps::Category::Series)});
    const std::string bid = b.id;
    check(reg.remove(bid, &store) && !reg.find(bid) && !store.get_all(bid), "remove drops descriptor and chunks");
    check(!reg.remove("missing"), "remove unknown id");
  }

  // remote merge policies
  {
    ps::ResourceRegistry reg(cfg);
    reg.load();
    reg.add("Local Only", "http://local/only.m3u8");
    const std::string remote = R"([
      {"id":")" + m3u_id + R"(","name":"Home","url":"http://h/moved.m3u8","type":"m3u"},
      {"name":"Cloud","url":"http://cloud/list.m3u8","active":false,"stats":{"channels":9}},
      {"id":12345,"name":"Xt","url":"","type":"xtream",
       "credentials":{"host":"x.example","username":"u","password":"p"}}
    ])";

    auto r1 = reg.merge_remote(remote, ps::MergePolicy::AddOrUpdate, &store);
    check(r1.added == 2 && r1.updated == 1 && r1.deleted_ids.empty(), "add-or-update never deletes");
    const auto* home = reg.find(m3u_id);
    check(home && home->url == "http://h/moved.m3u8" && home->status == ps::SyncStatus::Pending,
          "changed source marked pending");
    const auto* xt = reg.find("12345");
    check(xt && xt->type == ps::ResourceType::Provider && xt->credentials && xt->credentials->host == "x.example",
          "numeric id and credentials accepted");
    bool cloud_ok = false;
    for (const auto& r : reg.resources())
      if (r.name == "Cloud") cloud_ok = r.active && r.stats == ps::Stats{} && r.status == ps::SyncStatus::Pending;
    check(cloud_ok, "new remote entries start active and empty");

    auto r2 = reg.merge_remote(remote, ps::MergePolicy::AddOrUpdate, &store);
    check(!r2.changed(), "merging the same list again is a no-op");

    auto r3 = reg.merge_remote(remote, ps::MergePolicy::Mirror, &store);
    check(r3.deleted_ids.size() == 2 && reg.size() == 3, "mirror deletes unlisted local entries");
    check(!reg.find(prov_id), "unlisted provider deleted");

    auto bad = reg.merge_remote("{not an array", ps::MergePolicy::Mirror, &store);
    check(!bad.changed() && reg.size() == 3 && !reg.last_error().empty(), "malformed remote list ignored");
  }

  // ids in the staging namespace are replaced
  {
    std::vector<ps::Resource> parsed;
    const bool ok = ps::ResourceRegistry::parse(
        R"([{"id":"temp_abc","name":"Shadow","url":"http://s/list.m3u8"},{"id":"abc","name":"Real","url":"http://r/list.m3u8"}])",
        parsed);
    check(ok && parsed.size() == 2 && !parsed[0].id.empty() && !ps::is_temp_owner_id(parsed[0].id) &&
          parsed[1].id == "abc", "staging-prefixed id reassigned");
    check(ps::is_temp_owner_id(ps::temp_owner_id("abc")) && !ps::is_temp_owner_id("abc"),
          "temp owner ids recognised");
  }

  fs::remove_all(dir);
  return failures ? 1 : 0;
}
