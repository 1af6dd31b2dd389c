#pragma once
#include "playsync/playlist_item.hpp"
#include <sstream>
#include <string>
#include <string_view>

namespace ps {

// JSON string literal (quotes included) with full escaping.
void write_json_string(std::ostringstream& o, std::string_view s);

// Chunk payload codec: a JSON array of
// {title,url,logo?,group,category,id?,epg_id?,rating?}.
class ItemJson {
public:
  static std::string to_json(const ItemBatch& items);
  static void write_item(std::ostringstream& o, const PlaylistItem& item, bool with_source = false);

  // Appends decoded items to `out`. False (and `err` set) on malformed input;
  // `out` may then hold a prefix of the items.
  static bool from_json(std::string_view json, ItemBatch& out, std::string* err = nullptr);

  // {"channels":{"<group>":[...]},"movies":{...},"series":{...}}
  static std::string dataset_to_json(const Dataset& data);
};

}
