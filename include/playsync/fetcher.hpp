#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace ps {

class CancelToken;

// Byte source for playlist and provider downloads.
class Fetcher {
public:
  using BlockCallback = std::function<void(std::string_view)>;

  virtual ~Fetcher() = default;

  // Streams the body of `url` into on_block. Throws NetworkError on any
  // transport/status failure and CancelledError once `token` is cancelled.
  // Exceptions thrown by on_block propagate unchanged.
  virtual void fetch(const std::string& url, const CancelToken& token,
                     const BlockCallback& on_block) = 0;

  // Whole body as a string.
  std::string get(const std::string& url, const CancelToken& token);
};

// cpp-httplib client for http(s) urls; file:// urls and plain paths are read
// from disk through ChunkReader.
class HttpFetcher : public Fetcher {
public:
  struct Config {
    int connect_timeout_sec = 30;
    int read_timeout_sec    = 300;   // bounded per-read timeout
    bool follow_redirects   = true;
    std::string user_agent  = "playsync/1.0";
    int total_timeout_sec   = 300;   // whole request; 0 = unbounded
  };

  HttpFetcher();
  explicit HttpFetcher(Config cfg);

  void fetch(const std::string& url, const CancelToken& token,
             const BlockCallback& on_block) override;

  const Config& config() const noexcept { return cfg_; }

private:
  void fetch_local(const std::string& path, const CancelToken& token,
                   const BlockCallback& on_block);

  Config cfg_;
};

}
