#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace ps {

struct UrlParts {
  std::string scheme;          // "http" | "https"
  std::string origin;          // scheme://host[:port]
  std::string path_and_query;  // "/..." (at least "/")
};

// Split an absolute http(s) url; false for anything else.
bool split_url(std::string_view url, UrlParts& out);

// file:// urls and scheme-less paths.
bool is_local_source(std::string_view url);
std::string local_path_of(std::string_view url);

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percent_encode(std::string_view s);

// Replace "{url}" in tmpl with the encoded url (appended when absent).
std::string make_proxy_url(std::string_view tmpl, std::string_view url);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Stable short hex id, SHA-256 based when built with OpenSSL.
std::string hex_hash_prefix(std::string_view data, int len);

}
