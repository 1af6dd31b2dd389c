#pragma once
#include "playsync/chunk_reader.hpp"
#include "playsync/playlist_item.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ps {

class CancelToken;
class Fetcher;

// Decodes M3U8 text into classified item batches plus running Stats.
// Memory stays O(batch_size): on_batch must finish before parsing resumes.
class StreamParser {
public:
  struct Config {
    std::size_t batch_size = 2000;
    std::chrono::milliseconds progress_interval{100};
    // "{url}" is replaced by the percent-encoded source url; empty disables fallback.
    std::string proxy_template = "https://api.allorigins.win/raw?url={url}";
    LineSplitter::Config lines;
  };

  struct Callbacks {
    std::function<void(const Stats&)> on_progress;  // throttled, plus once at end
    std::function<void(ItemBatch&&)>  on_batch;     // blocking sink
    std::function<void()>             on_reset;     // discard output so far (before proxy retry)
  };

  StreamParser();
  explicit StreamParser(Config cfg);
  ~StreamParser();
  StreamParser(const StreamParser&) = delete;
  StreamParser& operator=(const StreamParser&) = delete;

  // Incremental use: begin(), feed() per received block, finish().
  void  begin(Callbacks cb, const CancelToken* token = nullptr);
  void  feed(std::string_view bytes);
  Stats finish();

  // Whole-text input; same line handling as feed().
  Stats parse_text(std::string_view text, Callbacks cb, const CancelToken* token = nullptr);

  // Direct fetch, then exactly one proxy attempt when it raises NetworkError.
  // Sink exceptions and cancellation propagate without a retry.
  Stats parse_from_url(const std::string& url, Fetcher& fetcher, Callbacks cb,
                       const CancelToken& token);

  const Stats& stats() const noexcept;
  std::uint64_t batches_emitted() const noexcept;
  std::uint64_t bytes_fed() const noexcept;
  const Config& config() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
