#include "playsync/resource_registry.hpp"
#include "playsync/chunk_store.hpp"
#include "playsync/item_json.hpp"
#include "playsync/text_utils.hpp"
#include "playsync/url_utils.hpp"
#include <simdjson.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace ps {

namespace {

std::string make_id(std::string_view name, std::string_view source) {
  static std::atomic<std::uint64_t> counter{0};
  std::string seed;
  seed.append(name).push_back('\n');
  seed.append(source).push_back('\n');
  seed += std::to_string(now_epoch_ms());
  seed.push_back('\n');
  seed += std::to_string(counter.fetch_add(1));
  return hex_hash_prefix(seed, 16);
}

// Strings as-is; numbers and booleans by their JSON text (ids are often numeric).
std::string scalar_text(simdjson::ondemand::value& v) {
  if (v.type().value() == simdjson::ondemand::json_type::string)
    return std::string(v.get_string().value());
  return std::string(trim(v.raw_json_token()));
}

std::uint64_t read_count(simdjson::ondemand::value& v) {
  double d = v.get_double().value();
  return (std::isfinite(d) && d > 0) ? static_cast<std::uint64_t>(d) : 0;
}

Stats read_stats(simdjson::ondemand::object obj) {
  Stats s;
  for (auto field : obj) {
    std::string_view key = field.unescaped_key().value();
    simdjson::ondemand::value v = field.value();
    if (v.type().value() != simdjson::ondemand::json_type::number) continue;
    if (auto c = parse_category(key)) s.at(*c) = read_count(v);
  }
  return s;
}

ProviderCredentials read_credentials(simdjson::ondemand::object obj) {
  ProviderCredentials c;
  for (auto field : obj) {
    std::string_view key = field.unescaped_key().value();
    simdjson::ondemand::value v = field.value();
    if (v.type().value() == simdjson::ondemand::json_type::null) continue;
    if (key == "host") c.host = scalar_text(v);
    else if (key == "username") c.username = scalar_text(v);
    else if (key == "password") c.password = scalar_text(v);
  }
  return c;
}

void write_stats(std::ostringstream& o, const Stats& s) {
  o << "{\"channels\":" << s.channels << ",\"movies\":" << s.movies
    << ",\"series\":" << s.series << '}';
}

bool same_entry(const Resource& a, const Resource& b) {
  return a.id == b.id || (a.url == b.url && a.name == b.name);
}

}

ResourceRegistry::ResourceRegistry() : ResourceRegistry(Config{}) {}
ResourceRegistry::ResourceRegistry(Config cfg) : cfg_(std::move(cfg)) {}

bool ResourceRegistry::parse(std::string_view json, std::vector<Resource>& out, std::string* err) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);
  try {
    auto doc = parser.iterate(padded);
    simdjson::ondemand::array arr = doc.get_array();
    for (auto elem : arr) {
      simdjson::ondemand::object obj = elem.get_object();
      Resource r;
      std::optional<ResourceType> type;
      for (auto field : obj) {
        std::string_view key = field.unescaped_key().value();
        simdjson::ondemand::value v = field.value();
        if (v.type().value() == simdjson::ondemand::json_type::null) continue;

        if (key == "id") r.id = scalar_text(v);
        else if (key == "name") r.name = scalar_text(v);
        else if (key == "url") r.url = scalar_text(v);
        else if (key == "active") r.active = v.get_bool().value();
        else if (key == "type") type = parse_type(v.get_string().value());
        else if (key == "stats") r.stats = read_stats(v.get_object().value());
        else if (key == "lastSynced") {
          double d = v.get_double().value();
          if (std::isfinite(d)) r.last_synced_ms = static_cast<std::int64_t>(d);
        }
        else if (key == "credentials") r.credentials = read_credentials(v.get_object().value());
      }
      r.type = type ? *type : (r.credentials ? ResourceType::Provider : ResourceType::M3u);
      if (is_temp_owner_id(r.id)) {
        std::cerr << "[registry] id '" << r.id << "' is reserved for staging, assigning a new one\n";
        r.id.clear();
      }
      if (r.id.empty()) r.id = make_id(r.name, r.url);
      out.push_back(std::move(r));
    }
    return true;
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = e.what();
    return false;
  }
}

bool ResourceRegistry::load() {
  items_.clear();
  err_.clear();

  std::error_code ec;
  if (!std::filesystem::exists(cfg_.path, ec)) return true;

  std::ifstream in(cfg_.path, std::ios::binary);
  if (!in) {
    err_ = "cannot open " + cfg_.path;
    std::cerr << "[registry] " << err_ << "\n";
    return false;
  }
  std::ostringstream ss; ss << in.rdbuf();

  std::vector<Resource> parsed;
  if (!parse(ss.str(), parsed, &err_)) {
    std::cerr << "[registry] " << cfg_.path << ": " << err_ << "\n";
    return false;
  }
  for (auto& r : parsed) {
    r.status = r.active ? SyncStatus::Queued : SyncStatus::Disabled;
    r.loading = false;
    r.cancel_token.reset();
    r.progress.reset();
    items_.push_back(std::move(r));
  }
  return true;
}

bool ResourceRegistry::save() {
  const std::filesystem::path target(cfg_.path);
  if (!ensure_parent_dirs(target)) {
    err_ = "cannot create directory for " + cfg_.path;
    std::cerr << "[registry] " << err_ << "\n";
    return false;
  }
  std::filesystem::path tmp = target;
  tmp += ".tmp";

  {
    const std::string body = to_json();
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      err_ = "cannot write " + tmp.string();
      std::cerr << "[registry] " << err_ << "\n";
      return false;
    }
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out) {
      err_ = "short write to " + tmp.string();
      std::cerr << "[registry] " << err_ << "\n";
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    err_ = "rename " + tmp.string() + ": " + ec.message();
    std::cerr << "[registry] " << err_ << "\n";
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

std::string ResourceRegistry::new_id(std::string_view name, std::string_view source) const {
  std::string id = make_id(name, source);
  while (find(id)) id = make_id(name, source);
  return id;
}

Resource& ResourceRegistry::add(std::string name, std::string url) {
  Resource r;
  r.id = new_id(name, url);
  r.name = std::move(name);
  r.url = std::move(url);
  r.type = ResourceType::M3u;
  items_.push_back(std::move(r));
  return items_.back();
}

Resource& ResourceRegistry::add_provider(std::string name, ProviderCredentials creds) {
  Resource r;
  r.id = new_id(name, creds.host + "|" + creds.username);
  r.name = std::move(name);
  r.url = creds.host;
  r.type = ResourceType::Provider;
  r.credentials = std::move(creds);
  items_.push_back(std::move(r));
  return items_.back();
}

bool ResourceRegistry::remove(const std::string& id, ChunkStore* store) {
  auto it = std::find_if(items_.begin(), items_.end(),
                         [&](const Resource& r) { return r.id == id; });
  if (it == items_.end()) return false;
  if (it->cancel_token) it->cancel_token->cancel();
  if (store && !store->delete_all(id))
    std::cerr << "[registry] chunks of " << id << " not deleted: " << store->last_error() << "\n";
  items_.erase(it);
  return true;
}

bool ResourceRegistry::set_active(const std::string& id, bool active) {
  Resource* r = find(id);
  if (!r) return false;
  r->active = active;
  if (!r->loading) {
    if (!active) r->status = SyncStatus::Disabled;
    else if (r->status == SyncStatus::Disabled) r->status = r->data ? SyncStatus::Synced : SyncStatus::Pending;
  }
  return true;
}

bool ResourceRegistry::update(const std::string& id, std::string name, std::string url,
                              ResourceType type, std::optional<ProviderCredentials> creds,
                              ChunkStore* store) {
  Resource* r = find(id);
  if (!r) return false;

  const bool source_changed = r->url != url || r->type != type ||
                              (creds && (!r->credentials || *r->credentials != *creds));
  r->name = std::move(name);
  r->type = type;
  if (creds) r->credentials = std::move(creds);

  if (source_changed) {
    r->url = std::move(url);
    r->data.reset();
    r->stats = Stats{};
    r->last_synced_ms.reset();
    r->status = SyncStatus::Pending;
    if (store && !store->delete_all(id))
      std::cerr << "[registry] chunks of " << id << " not deleted: " << store->last_error() << "\n";
  }
  return true;
}

Resource* ResourceRegistry::find(const std::string& id) {
  for (auto& r : items_) if (r.id == id) return &r;
  return nullptr;
}

const Resource* ResourceRegistry::find(const std::string& id) const {
  for (const auto& r : items_) if (r.id == id) return &r;
  return nullptr;
}

std::size_t ResourceRegistry::load_cached(ChunkStore& store) {
  std::size_t hits = 0;
  for (auto& r : items_) {
    if (!r.active || r.data || r.loading) continue;
    auto data = store.get_all(r.id);
    if (data) {
      r.data = std::move(*data);
      r.status = SyncStatus::Synced;
      ++hits;
    } else {
      r.status = SyncStatus::Pending;
    }
  }
  return hits;
}

Dataset ResourceRegistry::aggregate() const {
  Dataset out;
  for (const auto& r : items_) {
    if (!r.active || !r.data) continue;
    for (auto c : kAllCategories) {
      for (const auto& g : r.data->at(c).groups()) {
        for (const auto& item : g.items) {
          PlaylistItem copy = item;
          copy.source = r.name;
          out.add(std::move(copy));
        }
      }
    }
  }
  return out;
}

MergeResult ResourceRegistry::merge_remote(std::string_view json, MergePolicy policy,
                                           ChunkStore* store) {
  MergeResult result;
  std::vector<Resource> remote;
  if (!parse(json, remote, &err_)) {
    std::cerr << "[registry] remote list rejected: " << err_ << "\n";
    return result;
  }

  if (policy == MergePolicy::Mirror) {
    for (auto it = items_.begin(); it != items_.end();) {
      const bool listed = std::any_of(remote.begin(), remote.end(),
                                      [&](const Resource& rem) { return same_entry(*it, rem); });
      if (listed) { ++it; continue; }
      if (it->cancel_token) it->cancel_token->cancel();
      if (store && !store->delete_all(it->id))
        std::cerr << "[registry] chunks of " << it->id << " not deleted: " << store->last_error() << "\n";
      result.deleted_ids.push_back(it->id);
      it = items_.erase(it);
    }
  }

  for (auto& rem : remote) {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&](const Resource& l) { return same_entry(l, rem); });
    if (it == items_.end()) {
      if (find(rem.id)) rem.id = new_id(rem.name, rem.url);
      rem.active = true;
      rem.status = SyncStatus::Pending;
      rem.stats = Stats{};
      rem.last_synced_ms.reset();
      items_.push_back(std::move(rem));
      ++result.added;
    } else if (it->url != rem.url || it->credentials != rem.credentials) {
      it->url = rem.url;
      it->credentials = rem.credentials;
      it->type = rem.type;
      if (!it->loading) it->status = SyncStatus::Pending;
      ++result.updated;
    }
  }

  if (result.changed()) {
    std::cout << "[registry] remote merge: +" << result.added << " ~" << result.updated
              << " -" << result.deleted_ids.size() << "\n";
  }
  return result;
}

std::string ResourceRegistry::descriptor_json(const Resource& r, bool with_status) {
  std::ostringstream o;
  o << "{\"id\":"; write_json_string(o, r.id);
  o << ",\"name\":"; write_json_string(o, r.name);
  o << ",\"url\":"; write_json_string(o, r.url);
  o << ",\"active\":" << (r.active ? "true" : "false");
  o << ",\"stats\":"; write_stats(o, r.stats);
  o << ",\"lastSynced\":";
  if (r.last_synced_ms) o << *r.last_synced_ms; else o << "null";
  o << ",\"type\":\"" << type_name(r.type) << '"';
  o << ",\"credentials\":";
  if (r.credentials) {
    o << "{\"host\":"; write_json_string(o, r.credentials->host);
    o << ",\"username\":"; write_json_string(o, r.credentials->username);
    o << ",\"password\":"; write_json_string(o, r.credentials->password);
    o << '}';
  } else {
    o << "null";
  }
  if (with_status) {
    o << ",\"status\":\"" << status_name(r.status) << '"';
    o << ",\"loading\":" << (r.loading ? "true" : "false");
    if (r.progress) { o << ",\"progress\":"; write_stats(o, *r.progress); }
  }
  o << '}';
  return o.str();
}

std::string ResourceRegistry::to_json() const {
  std::ostringstream o;
  o << "[";
  bool first = true;
  for (const auto& r : items_) {
    o << (first ? "\n  " : ",\n  ") << descriptor_json(r, false);
    first = false;
  }
  o << (first ? "]\n" : "\n]\n");
  return o.str();
}

}
