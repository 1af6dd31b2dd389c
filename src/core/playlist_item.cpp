#include "playsync/playlist_item.hpp"

namespace ps {

std::string_view category_name(Category c) noexcept {
  switch (c) {
    case Category::Movies: return "movies";
    case Category::Series: return "series";
    case Category::Channels: break;
  }
  return "channels";
}

std::optional<Category> parse_category(std::string_view name) noexcept {
  for (auto c : kAllCategories) if (category_name(c) == name) return c;
  return std::nullopt;
}

bool operator==(const PlaylistItem& a, const PlaylistItem& b) {
  return a.title == b.title && a.url == b.url && a.logo == b.logo &&
         a.group == b.group && a.category == b.category && a.id == b.id &&
         a.epg_id == b.epg_id && a.rating == b.rating;
}

std::uint64_t& Stats::at(Category c) noexcept {
  switch (c) {
    case Category::Movies: return movies;
    case Category::Series: return series;
    case Category::Channels: break;
  }
  return channels;
}

std::uint64_t Stats::at(Category c) const noexcept {
  return const_cast<Stats*>(this)->at(c);
}

Group& CategoryGroups::group(const std::string& name) {
  auto it = index_.find(name);
  if (it != index_.end()) return groups_[it->second];
  index_.emplace(name, groups_.size());
  groups_.push_back(Group{name, {}});
  return groups_.back();
}

const Group* CategoryGroups::find(std::string_view name) const {
  auto it = index_.find(std::string(name));
  return it == index_.end() ? nullptr : &groups_[it->second];
}

std::size_t CategoryGroups::item_count() const noexcept {
  std::size_t n = 0;
  for (const auto& g : groups_) n += g.items.size();
  return n;
}

void Dataset::add(PlaylistItem item) {
  const std::string group = item.group.empty() ? std::string("Uncategorized") : item.group;
  at(item.category).group(group).items.push_back(std::move(item));
}

std::size_t Dataset::item_count() const noexcept {
  std::size_t n = 0;
  for (const auto& c : cats_) n += c.item_count();
  return n;
}

Stats Dataset::stats() const noexcept {
  Stats s;
  for (auto c : kAllCategories) s.at(c) = at(c).item_count();
  return s;
}

std::vector<PlaylistItem> Dataset::flatten() const {
  std::vector<PlaylistItem> out;
  out.reserve(item_count());
  for (const auto& c : cats_)
    for (const auto& g : c.groups())
      out.insert(out.end(), g.items.begin(), g.items.end());
  return out;
}

}
