#include "playsync/m3u_fsm.hpp"
#include "playsync/text_utils.hpp"
#include <string_view>

namespace ps {

static constexpr std::string_view kExtInf = "#EXTINF:";

static bool is_key_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
}

Metadata extract_metadata(std::string_view line) {
  Metadata md;

  // No comma: the whole line is the title.
  const std::size_t comma = line.rfind(',');
  md.title = std::string(trim(comma == std::string_view::npos ? line : line.substr(comma + 1)));

  // key="value" pairs anywhere on the line; later keys win.
  const std::size_t n = line.size();
  std::size_t i = 0;
  while (i < n) {
    if (!is_key_char(line[i])) { ++i; continue; }
    std::size_t key_end = i;
    while (key_end < n && is_key_char(line[key_end])) ++key_end;

    if (key_end + 1 < n && line[key_end] == '=' && line[key_end + 1] == '"') {
      const std::size_t vstart = key_end + 2;
      const std::size_t vend = line.find('"', vstart);
      if (vend != std::string_view::npos) {
        const std::string key = to_lower(line.substr(i, key_end - i));
        std::string value(line.substr(vstart, vend - vstart));
        if (key == "tvg-logo") md.logo = std::move(value);
        else if (key == "group-title") md.group = std::move(value);
        else if (key == "tvg-id") md.id = std::move(value);
        i = vend + 1;
        continue;
      }
    }
    i = key_end;
  }

  if (md.group.empty()) md.group = "Uncategorized";
  return md;
}

Category categorize(std::string_view url) {
  const std::string u = to_lower(url);
  if (u.find("/movie/") != std::string::npos || u.find("/movies/") != std::string::npos)
    return Category::Movies;
  if (u.find("/series/") != std::string::npos) return Category::Series;
  return Category::Channels;
}

struct M3uFsm::Impl {
  std::optional<PlaylistItem> pending;

  void merge(Metadata md) {
    if (!pending) pending.emplace();
    pending->title = std::move(md.title);
    pending->group = std::move(md.group);
    if (md.logo) pending->logo = std::move(md.logo);
    if (md.id) pending->id = std::move(md.id);
  }
};

M3uFsm::M3uFsm() : p_(new Impl) {}
M3uFsm::~M3uFsm() { delete p_; }

bool M3uFsm::feed(std::string_view raw, const ItemCallback& on_item) {
  std::string_view line = trim(raw);
  if (line.empty()) return false;

  std::string clean;
  if (!is_valid_utf8(line)) {
    clean = sanitize_utf8(line);
    line = clean;
  }

  if (starts_with(line, kExtInf)) {
    p_->merge(extract_metadata(line));
    return false;
  }
  if (line.front() == '#') return false;

  // URL line
  if (!p_->pending || p_->pending->title.empty()) {
    p_->pending.reset();
    ++dropped_;
    return false;
  }

  PlaylistItem item = std::move(*p_->pending);
  p_->pending.reset();
  item.url = std::string(line);
  item.category = categorize(item.url);
  ++items_;
  on_item(std::move(item));
  return true;
}

void M3uFsm::reset() {
  p_->pending.reset();
  items_ = dropped_ = 0;
}

bool M3uFsm::has_pending() const noexcept { return p_->pending.has_value(); }

}
