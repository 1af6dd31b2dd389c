#include "playsync/chunk_store.hpp"
#include "playsync/item_json.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static ps::PlaylistItem item(std::string title, std::string group, ps::Category c) {
  ps::PlaylistItem it;
  it.title = title;
  it.url = "http://h/" + title;
  it.group = std::move(group);
  it.category = c;
  return it;
}

int main(){
  // item payload codec
  {
    ps::PlaylistItem it = item("Quote \"and\" \\slash\n", "G\t1", ps::Category::Series);
    it.logo = "http://l/\xE2\x9C\x93.png";
    it.id = "42";
    it.epg_id = "epg.1";
    it.rating = 7.5;
    ps::ItemBatch in{it, item("plain", "Uncategorized", ps::Category::Channels)};
    ps::ItemBatch out;
    std::string err;
    bool ok = ps::ItemJson::from_json(ps::ItemJson::to_json(in), out, &err);
    check(ok && out == in, "chunk payload decodes to the same items " + err);

    ps::ItemBatch bad;
    check(!ps::ItemJson::from_json(R"([{"title":"no url"}])", bad) &&
          !ps::ItemJson::from_json("not json", bad), "malformed payloads rejected");
  }

  const fs::path db = fs::temp_directory_path() / "ps_test_chunk_store.db";
  fs::remove(db);
  fs::remove(db.string() + "-wal");
  fs::remove(db.string() + "-shm");

  ps::ChunkStore::Config cfg;
  cfg.path = db.string();
  {
    ps::ChunkStore store(cfg);
    check(store.is_open(), "store opened");

    check(!store.get_all("R"), "unknown owner reads as absent");
    check(store.delete_all("R"), "delete on unknown owner is a no-op");

    // chunks written out of order are read back by chunk id
    ps::ItemBatch c0{item("a", "News", ps::Category::Channels), item("m1", "Action", ps::Category::Movies)};
    ps::ItemBatch c1{item("b", "News", ps::Category::Channels), item("c", "Sports", ps::Category::Channels)};
    ps::ItemBatch c2{item("s1", "Drama", ps::Category::Series)};
    check(store.put("R", 1, c1) && store.put("R", 0, c0) && store.put("R", 2, c2), "puts succeed");
    check(store.chunk_count("R") == 3, "three chunks stored");

    auto items = store.get_items("R");
    check(items && items->size() == 5 && (*items)[0].title == "a" && (*items)[2].title == "b",
          "raw items ordered by chunk id");

    auto ds = store.get_all("R");
    check(ds.has_value(), "get_all finds data");
    if (ds) {
      const auto& ch = ds->at(ps::Category::Channels);
      const auto* news = ch.find("News");
      check(ch.groups().size() == 2 && ch.groups()[0].name == "News" && news && news->items.size() == 2
            && news->items[0].title == "a" && news->items[1].title == "b",
            "grouped by category then group, chunk order kept");
      check(ds->stats() == ps::Stats{3, 1, 1}, "no loss or duplication");
    }

    // put is an upsert
    check(store.put("R", 2, ps::ItemBatch{item("s2", "Drama", ps::Category::Series)}), "overwrite chunk");
    auto again = store.get_items("R");
    check(again && again->size() == 5 && again->back().title == "s2", "upsert replaced chunk 2");

    // move temp -> real
    const std::string temp = ps::temp_owner_id("R");
    check(temp == "temp_R", "temp owner id");
    check(store.put(temp, 0, c2), "stage under temp");
    auto staged = store.get_all(temp);
    check(store.get_all("R")->item_count() == 5, "temp and real owners are independent");

    check(store.put("Q", 0, c0), "second owner");
    check(store.move("Q", "Z"), "move to empty owner");
    check(!store.get_all("Q") && store.get_all("Z") && store.get_all("Z")->item_count() == 2,
          "move leaves nothing under source");

    check(store.replace(temp, "R"), "replace commits temp");
    auto committed = store.get_all("R");
    check(committed && staged && committed->flatten() == staged->flatten(),
          "target holds exactly what temp held");
    check(!store.get_all(temp) && store.chunk_count(temp) == 0, "temp empty after replace");

    check(store.delete_all("R") && !store.get_all("R"), "delete_all removes chunks");
    check(store.move("nothing", "R") && !store.get_all("R"), "moving an empty owner is a no-op");
  }

  // durable across reopen
  {
    ps::ChunkStore store(cfg);
    check(store.get_all("Z") && store.get_all("Z")->item_count() == 2, "data survives reopen");
    check(store.clear() && !store.get_all("Z"), "clear wipes everything");
  }

  fs::remove(db);
  fs::remove(db.string() + "-wal");
  fs::remove(db.string() + "-shm");
  return failures ? 1 : 0;
}
