#include "playsync/item_json.hpp"
#include <simdjson.h>
#include <cmath>
#include <iomanip>

namespace ps {

void write_json_string(std::ostringstream& o, std::string_view s) {
  static const char* hex = "0123456789abcdef";
  o << '"';
  for (char ch : s) {
    const auto c = static_cast<unsigned char>(ch);
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (c < 0x20) o << "\\u00" << hex[c >> 4] << hex[c & 0xF];
        else o << ch;
        break;
    }
  }
  o << '"';
}

static void opt_field(std::ostringstream& o, const char* key, const std::optional<std::string>& v) {
  if (!v) return;
  o << ",\"" << key << "\":";
  write_json_string(o, *v);
}

void ItemJson::write_item(std::ostringstream& o, const PlaylistItem& it, bool with_source) {
  o << "{\"title\":"; write_json_string(o, it.title);
  o << ",\"url\":";   write_json_string(o, it.url);
  opt_field(o, "logo", it.logo);
  o << ",\"group\":"; write_json_string(o, it.group);
  o << ",\"category\":\"" << category_name(it.category) << '"';
  opt_field(o, "id", it.id);
  opt_field(o, "epg_id", it.epg_id);
  if (it.rating && std::isfinite(*it.rating)) {
    o << ",\"rating\":" << std::setprecision(15) << *it.rating;
  }
  if (with_source && !it.source.empty()) {
    o << ",\"source\":"; write_json_string(o, it.source);
  }
  o << '}';
}

std::string ItemJson::to_json(const ItemBatch& items) {
  std::ostringstream o;
  o << '[';
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) o << ',';
    write_item(o, items[i]);
  }
  o << ']';
  return o.str();
}

bool ItemJson::from_json(std::string_view json, ItemBatch& out, std::string* err) {
  thread_local simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  try {
    auto doc = parser.iterate(padded);
    simdjson::ondemand::array arr = doc.get_array();
    for (auto elem : arr) {
      simdjson::ondemand::object obj = elem.get_object();
      PlaylistItem it;
      bool has_url = false;
      for (auto field : obj) {
        std::string_view key = field.unescaped_key().value();
        simdjson::ondemand::value v = field.value();
        if (v.type().value() == simdjson::ondemand::json_type::null) continue;

        if (key == "rating") { it.rating = v.get_double().value(); continue; }

        std::string_view s = v.get_string().value();
        if (key == "title") it.title = std::string(s);
        else if (key == "url") { it.url = std::string(s); has_url = true; }
        else if (key == "logo") it.logo = std::string(s);
        else if (key == "group") it.group = std::string(s);
        else if (key == "category") {
          auto c = parse_category(s);
          it.category = c ? *c : Category::Channels;
        }
        else if (key == "id") it.id = std::string(s);
        else if (key == "epg_id") it.epg_id = std::string(s);
      }
      if (!has_url) {
        if (err) *err = "item without url";
        return false;
      }
      if (it.group.empty()) it.group = "Uncategorized";
      out.push_back(std::move(it));
    }
    return true;
  } catch (const std::exception& e) {
    if (err) *err = e.what();
    return false;
  }
}

std::string ItemJson::dataset_to_json(const Dataset& data) {
  std::ostringstream o;
  o << '{';
  bool first_cat = true;
  for (auto c : kAllCategories) {
    if (!first_cat) o << ',';
    first_cat = false;
    o << '"' << category_name(c) << "\":{";
    bool first_group = true;
    for (const auto& g : data.at(c).groups()) {
      if (!first_group) o << ',';
      first_group = false;
      write_json_string(o, g.name);
      o << ":[";
      for (size_t i = 0; i < g.items.size(); ++i) {
        if (i) o << ',';
        write_item(o, g.items[i], /*with_source=*/true);
      }
      o << ']';
    }
    o << '}';
  }
  o << '}';
  return o.str();
}

}
