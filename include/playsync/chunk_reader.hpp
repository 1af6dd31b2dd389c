#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ps {

// Push-style line splitter: bytes arrive in arbitrary blocks, complete lines
// come out. A partial trailing line is carried to the next feed().
class LineSplitter {
public:
  struct Config {
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        strip_bom        = true;            // drop UTF-8 BOM at stream start
  };

  using LineCallback = std::function<void(std::string_view)>;

  LineSplitter() = default;
  explicit LineSplitter(Config cfg) : cfg_(cfg) {}

  void feed(std::string_view block, const LineCallback& on_line);
  void finish(const LineCallback& on_line);

  // Drop carry and start over as if at stream start.
  void reset() noexcept;

  std::uint64_t bytes_fed() const noexcept { return bytes_; }
  std::uint64_t lines_dropped() const noexcept { return dropped_; }

private:
  void emit(std::string_view line, const LineCallback& on_line);

  Config cfg_;
  std::string carry_;
  bool skipping_oversize_{false}; // drop until next newline
  bool at_start_{true};
  std::uint64_t bytes_{0};
  std::uint64_t dropped_{0};
};

// Reads a local file in fixed-size blocks.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024; // 512 KiB
  };

  // Return false to stop reading early.
  using BlockCallback = std::function<bool(std::string_view)>;

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // False on open/read error or early stop.
  bool for_each_block(const BlockCallback& cb);

  // Convenience: blocks through a LineSplitter.
  bool for_each_line(const LineSplitter::LineCallback& cb);

  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
