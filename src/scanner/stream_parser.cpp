#include "playsync/stream_parser.hpp"
#include "playsync/cancel_token.hpp"
#include "playsync/errors.hpp"
#include "playsync/fetcher.hpp"
#include "playsync/m3u_fsm.hpp"
#include "playsync/url_utils.hpp"
#include <iostream>
#include <optional>
#include <utility>

namespace ps {

using clk = std::chrono::steady_clock;

struct StreamParser::Impl {
  Config cfg;
  Callbacks cb;
  const CancelToken* token{nullptr};

  LineSplitter splitter;
  M3uFsm fsm;
  ItemBatch batch;
  Stats stats;
  std::uint64_t batches{0};
  std::optional<clk::time_point> last_progress;

  explicit Impl(Config c) : cfg(std::move(c)), splitter(cfg.lines) {
    if (cfg.batch_size == 0) cfg.batch_size = 1;
  }

  void check_cancel() const {
    if (token) token->throw_if_cancelled();
  }

  void begin(Callbacks c, const CancelToken* t) {
    cb = std::move(c);
    token = t;
    splitter.reset();
    fsm.reset();
    batch.clear();
    batch.reserve(cfg.batch_size);
    stats = Stats{};
    batches = 0;
    last_progress.reset();
  }

  void flush() {
    if (batch.empty()) return;
    check_cancel();
    ItemBatch out;
    out.swap(batch);
    ++batches;
    if (cb.on_batch) cb.on_batch(std::move(out));
    batch.reserve(cfg.batch_size);
  }

  void on_line(std::string_view line) {
    fsm.feed(line, [this](PlaylistItem&& item) {
      stats.add(item.category);
      batch.push_back(std::move(item));
      if (batch.size() >= cfg.batch_size) flush();
    });
  }

  void maybe_progress() {
    if (!cb.on_progress) return;
    const auto now = clk::now();
    if (last_progress && now - *last_progress < cfg.progress_interval) return;
    last_progress = now;
    cb.on_progress(stats);
  }

  void feed(std::string_view bytes) {
    check_cancel();
    splitter.feed(bytes, [this](std::string_view line) { on_line(line); });
    maybe_progress();
  }

  Stats finish() {
    check_cancel();
    splitter.finish([this](std::string_view line) { on_line(line); });
    flush();
    if (cb.on_progress) cb.on_progress(stats);
    if (splitter.lines_dropped() > 0) {
      std::cerr << "[parser] dropped " << splitter.lines_dropped() << " oversize line(s)\n";
    }
    return stats;
  }

  Stats run_fetch(const std::string& url, Fetcher& fetcher, const Callbacks& c,
                  const CancelToken& t) {
    begin(c, &t);
    fetcher.fetch(url, t, [this](std::string_view block) { feed(block); });
    return finish();
  }
};

StreamParser::StreamParser() : StreamParser(Config{}) {}
StreamParser::StreamParser(Config cfg) : p_(new Impl(std::move(cfg))) {}
StreamParser::~StreamParser() { delete p_; }

void StreamParser::begin(Callbacks cb, const CancelToken* token) { p_->begin(std::move(cb), token); }
void StreamParser::feed(std::string_view bytes) { p_->feed(bytes); }
Stats StreamParser::finish() { return p_->finish(); }

Stats StreamParser::parse_text(std::string_view text, Callbacks cb, const CancelToken* token) {
  p_->begin(std::move(cb), token);
  p_->feed(text);
  return p_->finish();
}

Stats StreamParser::parse_from_url(const std::string& url, Fetcher& fetcher, Callbacks cb,
                                   const CancelToken& token) {
  try {
    return p_->run_fetch(url, fetcher, cb, token);
  } catch (const NetworkError& e) {
    token.throw_if_cancelled();
    if (p_->cfg.proxy_template.empty()) throw;
    std::cerr << "[fetch] direct fetch failed (" << e.what() << "), trying proxy\n";
  }

  if (p_->batches > 0 && cb.on_reset) cb.on_reset();

  const std::string proxy_url = make_proxy_url(p_->cfg.proxy_template, url);
  try {
    return p_->run_fetch(proxy_url, fetcher, cb, token);
  } catch (const NetworkError& e) {
    token.throw_if_cancelled();
    std::cerr << "[fetch] proxy fetch failed: " << e.what() << "\n";
    throw NetworkError(std::string("direct and proxy fetch failed: ") + e.what());
  }
}

const Stats& StreamParser::stats() const noexcept { return p_->stats; }
std::uint64_t StreamParser::batches_emitted() const noexcept { return p_->batches; }
std::uint64_t StreamParser::bytes_fed() const noexcept { return p_->splitter.bytes_fed(); }
const StreamParser::Config& StreamParser::config() const noexcept { return p_->cfg; }

}
