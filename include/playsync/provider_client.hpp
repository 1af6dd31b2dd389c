#pragma once
#include "playsync/playlist_item.hpp"
#include <string>
#include <string_view>
#include <unordered_map>

namespace ps {

class CancelToken;
class Fetcher;

struct ProviderCredentials {
  std::string host;
  std::string username;
  std::string password;
};

inline bool operator==(const ProviderCredentials& a, const ProviderCredentials& b) {
  return a.host == b.host && a.username == b.username && a.password == b.password;
}
inline bool operator!=(const ProviderCredentials& a, const ProviderCredentials& b) { return !(a == b); }

struct ProviderResult {
  Dataset data;   // items already carry their category
  Stats stats;
};

// Structured playlist source. The core treats it purely as a data source.
class ProviderSource {
public:
  virtual ~ProviderSource() = default;

  // Throws NetworkError when nothing could be fetched, CancelledError when
  // `token` fires.
  virtual ProviderResult fetch_all(const CancelToken& token) = 0;
};

// Xtream Codes style player_api.php client.
class XtreamClient : public ProviderSource {
public:
  XtreamClient(ProviderCredentials creds, Fetcher& fetcher);

  // user_info.auth == 1
  bool authenticate(const CancelToken& token, std::string* err = nullptr);

  ProviderResult fetch_all(const CancelToken& token) override;

  std::string api_url(std::string_view action) const;
  const std::string& base_url() const noexcept { return base_; }

private:
  using CategoryMap = std::unordered_map<std::string, std::string>;

  std::string get(std::string_view action, const CancelToken& token);
  CategoryMap fetch_categories(std::string_view action, const CancelToken& token);

  // Returns false when the section could not be fetched or decoded.
  bool fetch_live(const CategoryMap& cats, ProviderResult& out, const CancelToken& token);
  bool fetch_vod(const CategoryMap& cats, ProviderResult& out, const CancelToken& token);
  bool fetch_series(const CategoryMap& cats, ProviderResult& out, const CancelToken& token);

  ProviderCredentials creds_;
  std::string base_;
  Fetcher& fetcher_;
};

}
