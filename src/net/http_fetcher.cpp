#include "playsync/fetcher.hpp"
#include "playsync/cancel_token.hpp"
#include "playsync/chunk_reader.hpp"
#include "playsync/errors.hpp"
#include "playsync/url_utils.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>

namespace ps {

namespace {

// Stops the client once the whole request has run for `sec` seconds, even
// while a read is blocked.
class RequestDeadline {
public:
  RequestDeadline(int sec, httplib::Client& cli) {
    if (sec <= 0) return;
    watchdog_ = std::thread([this, sec, &cli] {
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_for(lk, std::chrono::seconds(sec), [this] { return done_; })) return;
      expired_ = true;
      cli.stop();
    });
  }
  ~RequestDeadline() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      done_ = true;
    }
    cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();
  }
  RequestDeadline(const RequestDeadline&) = delete;
  RequestDeadline& operator=(const RequestDeadline&) = delete;

  bool expired() const noexcept { return expired_.load(); }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool done_ = false;
  std::atomic<bool> expired_{false};
  std::thread watchdog_;
};

}

std::string Fetcher::get(const std::string& url, const CancelToken& token) {
  std::string body;
  fetch(url, token, [&](std::string_view block) { body.append(block); });
  return body;
}

HttpFetcher::HttpFetcher() : HttpFetcher(Config{}) {}
HttpFetcher::HttpFetcher(Config cfg) : cfg_(std::move(cfg)) {}

void HttpFetcher::fetch_local(const std::string& path, const CancelToken& token,
                              const BlockCallback& on_block) {
  token.throw_if_cancelled();
  ChunkReader reader(path);
  std::exception_ptr sink_error;
  const bool ok = reader.for_each_block([&](std::string_view block) {
    if (token.cancelled()) return false;
    try {
      on_block(block);
    } catch (...) {
      sink_error = std::current_exception();
      return false;
    }
    return true;
  });
  if (sink_error) std::rethrow_exception(sink_error);
  token.throw_if_cancelled();
  if (!ok) {
    throw NetworkError("cannot read " + path + " (errno " + std::to_string(reader.last_error()) + ")");
  }
}

void HttpFetcher::fetch(const std::string& url, const CancelToken& token,
                        const BlockCallback& on_block) {
  if (is_local_source(url)) { fetch_local(local_path_of(url), token, on_block); return; }

  UrlParts parts;
  if (!split_url(url, parts)) throw NetworkError("unsupported url: " + url);
  token.throw_if_cancelled();

  httplib::Client cli(parts.origin);
  if (!cli.is_valid()) throw NetworkError("cannot create client for " + parts.origin);
  cli.set_connection_timeout(cfg_.connect_timeout_sec, 0);
  cli.set_read_timeout(cfg_.read_timeout_sec, 0);
  cli.set_follow_location(cfg_.follow_redirects);

  // Aborts a blocked connect/read as soon as the token fires.
  CancelSubscription abort_on_cancel(token, [&cli] { cli.stop(); });
  RequestDeadline deadline(cfg_.total_timeout_sec, cli);

  httplib::Headers headers = {{"User-Agent", cfg_.user_agent}};
  int status = 0;
  std::exception_ptr sink_error;

  auto res = cli.Get(
      parts.path_and_query, headers,
      [&](const httplib::Response& r) {
        status = r.status;
        return !deadline.expired() && r.status >= 200 && r.status < 300;
      },
      [&](const char* data, size_t len) {
        if (token.cancelled() || deadline.expired()) return false;
        try {
          on_block(std::string_view(data, len));
        } catch (...) {
          sink_error = std::current_exception();
          return false;
        }
        return true;
      });

  if (sink_error) std::rethrow_exception(sink_error);
  token.throw_if_cancelled();
  if (deadline.expired()) {
    throw NetworkError("timeout after " + std::to_string(cfg_.total_timeout_sec) + " s from " + parts.origin);
  }
  if (status != 0 && (status < 200 || status >= 300)) {
    throw NetworkError("HTTP " + std::to_string(status) + " from " + parts.origin);
  }
  if (!res) {
    throw NetworkError(std::string("request failed: ") + httplib::to_string(res.error()));
  }
}

}
