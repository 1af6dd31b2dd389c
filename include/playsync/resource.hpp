#pragma once
#include "playsync/cancel_token.hpp"
#include "playsync/playlist_item.hpp"
#include "playsync/provider_client.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ps {

enum class ResourceType { M3u, Provider };

enum class SyncStatus { Pending, Queued, Disabled, Syncing, Synced, Error, Cancelled };

std::string_view type_name(ResourceType t) noexcept;
std::optional<ResourceType> parse_type(std::string_view s) noexcept;
std::string_view status_name(SyncStatus s) noexcept;

struct Resource {
  // Persisted descriptor
  std::string id;
  std::string name;
  ResourceType type = ResourceType::M3u;
  std::string url;                                  // m3u source
  std::optional<ProviderCredentials> credentials;   // provider source
  bool active = true;
  Stats stats;
  std::optional<std::int64_t> last_synced_ms;       // epoch millis

  // Transient
  SyncStatus status = SyncStatus::Pending;
  bool loading = false;
  CancelTokenPtr cancel_token;                      // set only while syncing
  std::optional<Stats> progress;                    // running stats while syncing
  std::optional<Dataset> data;                      // committed dataset, in memory
};

std::int64_t now_epoch_ms();

}
