#include "playsync/provider_client.hpp"
#include "playsync/cancel_token.hpp"
#include "playsync/errors.hpp"
#include "playsync/fetcher.hpp"
#include "playsync/text_utils.hpp"
#include "playsync/url_utils.hpp"
#include <fast_float/fast_float.h>
#include <simdjson.h>
#include <iostream>
#include <optional>

namespace ps {

namespace {

// Scalar members of one JSON object, as text. Nested values and nulls are skipped.
using Fields = std::unordered_map<std::string, std::string>;

std::string field(const Fields& f, const char* key) {
  auto it = f.find(key);
  return it == f.end() ? std::string() : it->second;
}

std::optional<std::string> opt_field(const Fields& f, const char* key) {
  auto it = f.find(key);
  if (it == f.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

std::optional<double> parse_number(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

// Calls fn(fields) for every object of a top-level JSON array. A non-array
// document is an empty list.
template <typename Fn>
bool for_each_entry(const std::string& body, Fn&& fn, std::string& err) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(body);
  try {
    auto doc = parser.iterate(padded);
    if (doc.type().value() != simdjson::ondemand::json_type::array) return true;
    for (auto elem : doc.get_array()) {
      if (elem.type().value() != simdjson::ondemand::json_type::object) continue;
      Fields f;
      for (auto kv : elem.get_object()) {
        std::string key(kv.unescaped_key().value());
        simdjson::ondemand::value v = kv.value();
        switch (v.type().value()) {
          case simdjson::ondemand::json_type::string: {
            std::string_view s = v.get_string().value();
            f[key] = sanitize_utf8(s);
            break;
          }
          case simdjson::ondemand::json_type::number: {
            std::string_view tok = v.raw_json_token();
            f[key] = std::string(trim(tok));
            break;
          }
          case simdjson::ondemand::json_type::boolean:
            f[key] = bool(v.get_bool()) ? "true" : "false";
            break;
          default:
            break;
        }
      }
      fn(f);
    }
    return true;
  } catch (const std::exception& e) {
    err = e.what();
    return false;
  }
}

}

XtreamClient::XtreamClient(ProviderCredentials creds, Fetcher& fetcher)
  : creds_(std::move(creds)), fetcher_(fetcher) {
  base_ = std::string(trim(creds_.host));
  while (!base_.empty() && base_.back() == '/') base_.pop_back();
  if (base_.find("://") == std::string::npos) base_ = "http://" + base_;
}

std::string XtreamClient::api_url(std::string_view action) const {
  std::string url = base_ + "/player_api.php?username=" + percent_encode(creds_.username) +
                    "&password=" + percent_encode(creds_.password);
  if (!action.empty()) url += "&action=" + std::string(action);
  return url;
}

std::string XtreamClient::get(std::string_view action, const CancelToken& token) {
  return fetcher_.get(api_url(action), token);
}

bool XtreamClient::authenticate(const CancelToken& token, std::string* err) {
  std::string body;
  try {
    body = get("", token);
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    return false;
  }

  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(body);
  try {
    auto doc = parser.iterate(padded);
    auto auth = doc["user_info"]["auth"];
    bool ok = false;
    if (auth.type().value() == simdjson::ondemand::json_type::number) ok = auth.get_int64().value() == 1;
    else if (auth.type().value() == simdjson::ondemand::json_type::string) ok = auth.get_string().value() == "1";
    if (!ok && err) *err = "authentication failed";
    return ok;
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    return false;
  }
}

XtreamClient::CategoryMap XtreamClient::fetch_categories(std::string_view action,
                                                         const CancelToken& token) {
  CategoryMap map;
  try {
    const std::string body = get(action, token);
    std::string err;
    if (!for_each_entry(body, [&](const Fields& f) {
          map[field(f, "category_id")] = field(f, "category_name");
        }, err)) {
      std::cerr << "[provider] " << action << ": " << err << "\n";
    }
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[provider] " << action << " failed: " << e.what() << "\n";
  }
  return map;
}

static std::string category_of(const std::unordered_map<std::string, std::string>& cats,
                               const std::string& id) {
  auto it = cats.find(id);
  return (it == cats.end() || it->second.empty()) ? std::string("Uncategorized") : it->second;
}

bool XtreamClient::fetch_live(const CategoryMap& cats, ProviderResult& out,
                              const CancelToken& token) {
  try {
    const std::string body = get("get_live_streams", token);
    std::string err;
    const bool ok = for_each_entry(body, [&](const Fields& f) {
      PlaylistItem it;
      it.title = field(f, "name");
      it.logo = opt_field(f, "stream_icon");
      it.group = category_of(cats, field(f, "category_id"));
      it.id = opt_field(f, "stream_id");
      it.epg_id = opt_field(f, "epg_channel_id");
      it.url = base_ + "/live/" + creds_.username + "/" + creds_.password + "/" + field(f, "stream_id") + ".ts";
      it.category = Category::Channels;
      out.stats.add(it.category);
      out.data.add(std::move(it));
    }, err);
    if (!ok) std::cerr << "[provider] live streams: " << err << "\n";
    return ok;
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[provider] live streams failed: " << e.what() << "\n";
    return false;
  }
}

bool XtreamClient::fetch_vod(const CategoryMap& cats, ProviderResult& out,
                             const CancelToken& token) {
  try {
    const std::string body = get("get_vod_streams", token);
    std::string err;
    const bool ok = for_each_entry(body, [&](const Fields& f) {
      PlaylistItem it;
      it.title = field(f, "name");
      it.logo = opt_field(f, "stream_icon");
      it.group = category_of(cats, field(f, "category_id"));
      it.id = opt_field(f, "stream_id");
      it.rating = parse_number(field(f, "rating"));
      std::string ext = field(f, "container_extension");
      if (ext.empty()) ext = "mp4";
      it.url = base_ + "/movie/" + creds_.username + "/" + creds_.password + "/" + field(f, "stream_id") + "." + ext;
      it.category = Category::Movies;
      out.stats.add(it.category);
      out.data.add(std::move(it));
    }, err);
    if (!ok) std::cerr << "[provider] vod streams: " << err << "\n";
    return ok;
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[provider] vod streams failed: " << e.what() << "\n";
    return false;
  }
}

bool XtreamClient::fetch_series(const CategoryMap& cats, ProviderResult& out,
                                const CancelToken& token) {
  try {
    const std::string body = get("get_series", token);
    std::string err;
    const bool ok = for_each_entry(body, [&](const Fields& f) {
      PlaylistItem it;
      it.title = field(f, "name");
      it.logo = opt_field(f, "cover");
      it.group = category_of(cats, field(f, "category_id"));
      it.id = opt_field(f, "series_id");
      it.rating = parse_number(field(f, "rating"));
      // Series have no stream url; point at their episode listing.
      it.url = api_url("get_series_info") + "&series_id=" + percent_encode(field(f, "series_id"));
      it.category = Category::Series;
      out.stats.add(it.category);
      out.data.add(std::move(it));
    }, err);
    if (!ok) std::cerr << "[provider] series: " << err << "\n";
    return ok;
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception& e) {
    std::cerr << "[provider] series failed: " << e.what() << "\n";
    return false;
  }
}

ProviderResult XtreamClient::fetch_all(const CancelToken& token) {
  ProviderResult out;

  const CategoryMap live_cats = fetch_categories("get_live_categories", token);
  const CategoryMap vod_cats = fetch_categories("get_vod_categories", token);
  const CategoryMap series_cats = fetch_categories("get_series_categories", token);

  const bool live_ok = fetch_live(live_cats, out, token);
  const bool vod_ok = fetch_vod(vod_cats, out, token);
  const bool series_ok = fetch_series(series_cats, out, token);

  token.throw_if_cancelled();
  if (!live_ok && !vod_ok && !series_ok) {
    throw NetworkError("provider " + base_ + ": no section could be fetched");
  }
  return out;
}

}
