#include "playsync/cancel_token.hpp"
#include "playsync/errors.hpp"
#include "playsync/fetcher.hpp"
#include "playsync/stream_parser.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static std::string read_all(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

int main(){
  const std::string fixture = read_all("tests/data/sample.m3u8");
  if (fixture.empty()) { std::cerr << "[ERR] missing tests/data/sample.m3u8\n"; return 2; }

  httplib::Server svr;
  std::atomic<bool> release_slow{false};
  std::string origin;

  svr.Get("/list.m3u8", [&](const httplib::Request& req, httplib::Response& res) {
    if (req.get_header_value("User-Agent") != "playsync-test") { res.status = 400; return; }
    res.set_content(fixture, "audio/x-mpegurl");
  });
  svr.Get("/moved.m3u8", [&](const httplib::Request&, httplib::Response& res) {
    res.set_redirect("/list.m3u8");
  });
  svr.Get("/proxy", [&](const httplib::Request& req, httplib::Response& res) {
    // only the blocked playlist is reachable through the proxy
    if (req.get_param_value("url") != origin + "/blocked.m3u8") { res.status = 502; return; }
    res.set_content(fixture, "audio/x-mpegurl");
  });
  svr.Get("/slow.m3u8", [&](const httplib::Request&, httplib::Response& res) {
    res.set_chunked_content_provider("audio/x-mpegurl", [&](size_t, httplib::DataSink& sink) {
      if (release_slow) { sink.done(); return true; }
      const std::string line = "#EXTINF:-1,Slow\nhttp://h/live/slow.ts\n";
      if (!sink.write(line.data(), line.size())) return false;
      std::this_thread::sleep_for(20ms);
      return true;
    });
  });

  const int port = svr.bind_to_any_port("127.0.0.1");
  if (port <= 0) { std::cerr << "[ERR] cannot bind loopback port\n"; return 2; }
  origin = "http://127.0.0.1:" + std::to_string(port);
  std::thread server([&] { svr.listen_after_bind(); });
  for (int i = 0; i < 500 && !svr.is_running(); ++i) std::this_thread::sleep_for(2ms);

  ps::HttpFetcher::Config fcfg;
  fcfg.connect_timeout_sec = 5;
  fcfg.read_timeout_sec = 10;
  fcfg.user_agent = "playsync-test";
  ps::HttpFetcher fetcher(fcfg);

  // streamed http body
  {
    ps::CancelToken token;
    std::size_t blocks = 0;
    std::string body;
    fetcher.fetch(origin + "/list.m3u8", token, [&](std::string_view b) { ++blocks; body.append(b); });
    check(body == fixture && blocks >= 1, "http body delivered intact");
    check(fetcher.get(origin + "/moved.m3u8", token) == fixture, "redirect followed");
  }

  // status errors
  {
    ps::CancelToken token;
    bool network = false;
    std::string what;
    try {
      fetcher.get(origin + "/missing.m3u8", token);
    } catch (const ps::NetworkError& e) {
      network = true;
      what = e.what();
    }
    check(network && what.find("404") != std::string::npos, "404 raises NetworkError");

    network = false;
    try {
      fetcher.get("ftp://example.org/list.m3u8", token);
    } catch (const ps::NetworkError&) {
      network = true;
    }
    check(network, "unsupported scheme rejected");
  }

  // local files go through the chunk reader
  {
    ps::CancelToken token;
    check(fetcher.get("tests/data/sample.m3u8", token) == fixture, "plain path read from disk");
    bool network = false;
    try {
      fetcher.get("tests/data/does-not-exist.m3u8", token);
    } catch (const ps::NetworkError&) {
      network = true;
    }
    check(network, "missing local file raises NetworkError");
  }

  // parser falls back to the proxy when the direct url fails
  {
    ps::StreamParser::Config pcfg;
    pcfg.proxy_template = origin + "/proxy?url={url}";
    ps::StreamParser parser(pcfg);
    ps::ItemBatch items;
    ps::StreamParser::Callbacks cb;
    cb.on_batch = [&](ps::ItemBatch&& b) { for (auto& i : b) items.push_back(std::move(i)); };
    ps::CancelToken token;
    auto st = parser.parse_from_url(origin + "/blocked.m3u8", fetcher, cb, token);
    check(st == ps::Stats{3, 2, 1} && items.size() == 6, "proxy route served the playlist");
  }

  // cancellation aborts a body that never ends
  {
    ps::CancelToken token;
    std::size_t bytes = 0;
    std::thread canceller([&] {
      std::this_thread::sleep_for(200ms);
      token.cancel();
    });
    const auto t0 = std::chrono::steady_clock::now();
    bool cancelled = false;
    try {
      fetcher.fetch(origin + "/slow.m3u8", token, [&](std::string_view b) { bytes += b.size(); });
    } catch (const ps::CancelledError&) {
      cancelled = true;
    }
    const auto took = std::chrono::steady_clock::now() - t0;
    canceller.join();
    check(cancelled && bytes > 0, "cancel raises CancelledError after partial data");
    check(took < 5s, "cancel does not wait for the read timeout");
  }

  // a body that keeps trickling is bounded by the whole-request limit
  {
    ps::HttpFetcher::Config tcfg = fcfg;
    tcfg.total_timeout_sec = 1;
    ps::HttpFetcher bounded(tcfg);
    ps::CancelToken token;
    std::size_t bytes = 0;
    std::string what;
    const auto t0 = std::chrono::steady_clock::now();
    try {
      bounded.fetch(origin + "/slow.m3u8", token, [&](std::string_view b) { bytes += b.size(); });
    } catch (const ps::NetworkError& e) {
      what = e.what();
    }
    const auto took = std::chrono::steady_clock::now() - t0;
    check(what.find("timeout") != std::string::npos && bytes > 0, "trickling body times out as NetworkError");
    check(took >= 900ms && took < 5s, "timeout honours the configured limit");
    check(bounded.get(origin + "/list.m3u8", token) == fixture, "fast body unaffected by the limit");
  }

  release_slow = true;
  svr.stop();
  server.join();
  return failures ? 1 : 0;
}
