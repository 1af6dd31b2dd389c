#pragma once
#include "playsync/playlist_item.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ps {

// Attributes pulled from one #EXTINF line.
struct Metadata {
  std::string title;                 // after the last comma, trimmed
  std::string group;                 // group-title, "Uncategorized" if absent/empty
  std::optional<std::string> logo;   // tvg-logo
  std::optional<std::string> id;     // tvg-id
};

Metadata extract_metadata(std::string_view line);

// movies ("/movie/", "/movies/") > series ("/series/") > channels.
Category categorize(std::string_view url);

// Per-line state machine: #EXTINF merges into a pending item, other '#'
// directives are ignored, any other non-blank line is the URL completing
// the pending item.
class M3uFsm {
public:
  using ItemCallback = std::function<void(PlaylistItem&&)>;

  M3uFsm();
  ~M3uFsm();
  M3uFsm(const M3uFsm&) = delete;
  M3uFsm& operator=(const M3uFsm&) = delete;

  // Returns true when the line completed an item.
  bool feed(std::string_view line, const ItemCallback& on_item);
  void reset();

  bool has_pending() const noexcept;
  std::uint64_t items() const noexcept { return items_; }
  std::uint64_t dropped() const noexcept { return dropped_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t items_{0};
  std::uint64_t dropped_{0};
};

}
