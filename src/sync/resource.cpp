#include "playsync/resource.hpp"
#include <chrono>

namespace ps {

std::string_view type_name(ResourceType t) noexcept {
  return t == ResourceType::Provider ? "xtream" : "m3u";
}

std::optional<ResourceType> parse_type(std::string_view s) noexcept {
  if (s == "m3u") return ResourceType::M3u;
  if (s == "xtream" || s == "provider") return ResourceType::Provider;
  return std::nullopt;
}

std::string_view status_name(SyncStatus s) noexcept {
  switch (s) {
    case SyncStatus::Pending:   return "pending";
    case SyncStatus::Queued:    return "queued";
    case SyncStatus::Disabled:  return "disabled";
    case SyncStatus::Syncing:   return "syncing";
    case SyncStatus::Synced:    return "synced";
    case SyncStatus::Error:     return "error";
    case SyncStatus::Cancelled: return "cancelled";
  }
  return "pending";
}

std::int64_t now_epoch_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}
