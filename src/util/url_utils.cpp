#include "playsync/url_utils.hpp"
#include "playsync/text_utils.hpp"
#include <functional>
#include <iomanip>
#include <sstream>
#if defined(PS_USE_OPENSSL)
  #include <openssl/sha.h>
#endif

namespace ps {

bool split_url(std::string_view url, UrlParts& out) {
  const std::size_t sep = url.find("://");
  if (sep == std::string_view::npos) return false;
  const std::string scheme = to_lower(url.substr(0, sep));
  if (scheme != "http" && scheme != "https") return false;

  const std::size_t host_start = sep + 3;
  std::size_t path_start = url.find_first_of("/?#", host_start);
  if (path_start == std::string_view::npos) path_start = url.size();
  if (path_start == host_start) return false; // empty host

  out.scheme = scheme;
  out.origin = scheme + "://" + std::string(url.substr(host_start, path_start - host_start));

  std::string rest(url.substr(path_start));
  const std::size_t frag = rest.find('#');
  if (frag != std::string::npos) rest.resize(frag);
  if (rest.empty() || rest.front() != '/') rest.insert(rest.begin(), '/');
  out.path_and_query = std::move(rest);
  return true;
}

bool is_local_source(std::string_view url) {
  if (starts_with(to_lower(url.substr(0, 7)), "file://")) return true;
  return url.find("://") == std::string_view::npos;
}

std::string local_path_of(std::string_view url) {
  if (starts_with(to_lower(url.substr(0, 7)), "file://")) return std::string(url.substr(7));
  return std::string(url);
}

std::string percent_encode(std::string_view s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
        c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0xF]);
    }
  }
  return out;
}

std::string make_proxy_url(std::string_view tmpl, std::string_view url) {
  std::string out(tmpl);
  const std::string enc = percent_encode(url);
  const std::size_t pos = out.find("{url}");
  if (pos == std::string::npos) return out + enc;
  out.replace(pos, 5, enc);
  return out;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string hex_hash_prefix(std::string_view data, int len) {
#ifdef PS_USE_OPENSSL
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
  std::ostringstream o;
  for (int i = 0; i < (len+1)/2 && i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  auto s = o.str();
  if ((int)s.size() > len) s.resize(len);
  return s;
#else
  // Fallback (non-crypto)
  size_t h = std::hash<std::string_view>{}(data);
  std::ostringstream o; o << std::hex << std::setw(16) << std::setfill('0') << h;
  auto s = o.str(); if ((int)s.size() > len) s.resize(len); return s;
#endif
}

}
