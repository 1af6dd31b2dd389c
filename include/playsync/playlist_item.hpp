#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ps {

enum class Category { Channels = 0, Movies = 1, Series = 2 };

inline constexpr std::size_t kCategoryCount = 3;
inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
  Category::Channels, Category::Movies, Category::Series};

std::string_view category_name(Category c) noexcept;
std::optional<Category> parse_category(std::string_view name) noexcept;

struct PlaylistItem {
  std::string title;
  std::string url;
  std::optional<std::string> logo;
  std::string group = "Uncategorized";
  Category category = Category::Channels;
  std::optional<std::string> id;

  // Provider-only extras.
  std::optional<std::string> epg_id;
  std::optional<double> rating;

  // Transient: name of the resource the item came from (aggregated views only).
  std::string source;
};

bool operator==(const PlaylistItem& a, const PlaylistItem& b);
inline bool operator!=(const PlaylistItem& a, const PlaylistItem& b) { return !(a == b); }

struct Stats {
  std::uint64_t channels = 0;
  std::uint64_t movies = 0;
  std::uint64_t series = 0;

  void add(Category c) noexcept { ++at(c); }
  std::uint64_t& at(Category c) noexcept;
  std::uint64_t at(Category c) const noexcept;
  std::uint64_t total() const noexcept { return channels + movies + series; }
};

inline bool operator==(const Stats& a, const Stats& b) {
  return a.channels == b.channels && a.movies == b.movies && a.series == b.series;
}
inline bool operator!=(const Stats& a, const Stats& b) { return !(a == b); }

struct Group {
  std::string name;
  std::vector<PlaylistItem> items;
};

// Groups of one category in first-encounter order.
class CategoryGroups {
public:
  Group& group(const std::string& name);
  const Group* find(std::string_view name) const;

  const std::vector<Group>& groups() const noexcept { return groups_; }
  std::size_t item_count() const noexcept;
  bool empty() const noexcept { return groups_.empty(); }

private:
  std::vector<Group> groups_;
  std::unordered_map<std::string, std::size_t> index_;
};

// category -> group -> ordered items
class Dataset {
public:
  void add(PlaylistItem item);

  CategoryGroups& at(Category c) noexcept { return cats_[static_cast<std::size_t>(c)]; }
  const CategoryGroups& at(Category c) const noexcept { return cats_[static_cast<std::size_t>(c)]; }

  std::size_t item_count() const noexcept;
  bool empty() const noexcept { return item_count() == 0; }
  Stats stats() const noexcept;

  // All items, category by category, group by group.
  std::vector<PlaylistItem> flatten() const;

private:
  std::array<CategoryGroups, kCategoryCount> cats_;
};

using ItemBatch = std::vector<PlaylistItem>;

}
