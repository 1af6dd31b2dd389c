#include "playsync/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <vector>

namespace ps {

static constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

void LineSplitter::emit(std::string_view out, const LineCallback& on_line) {
  if (at_start_) {
    at_start_ = false;
    if (cfg_.strip_bom && out.substr(0, kUtf8Bom.size()) == kUtf8Bom) out.remove_prefix(kUtf8Bom.size());
  }
  if (cfg_.strip_cr && !out.empty() && out.back() == '\r') out.remove_suffix(1);
  on_line(out);
}

void LineSplitter::feed(std::string_view block, const LineCallback& on_line) {
  bytes_ += block.size();
  std::size_t start = 0;
  while (start <= block.size()) {
    std::size_t pos = block.find('\n', start);
    const bool hit_nl = (pos != std::string_view::npos);
    std::string_view slice = hit_nl ? block.substr(start, pos - start)
                                    : block.substr(start);

    if (skipping_oversize_) {
      if (!hit_nl) break;
      skipping_oversize_ = false;
      start = pos + 1;
      continue;
    }

    if (!hit_nl) {
      // unfinished line: keep it unless it blows the guard
      if (carry_.size() + slice.size() > cfg_.max_record_bytes) {
        carry_.clear();
        skipping_oversize_ = true;
        ++dropped_;
      } else {
        carry_.append(slice);
      }
      break;
    }

    if (!carry_.empty()) {
      if (carry_.size() + slice.size() > cfg_.max_record_bytes) {
        ++dropped_;
      } else {
        carry_.append(slice);
        emit(carry_, on_line);
      }
      carry_.clear();
    } else if (slice.size() > cfg_.max_record_bytes) {
      ++dropped_;
    } else {
      emit(slice, on_line);
    }
    start = pos + 1;
  }
}

void LineSplitter::finish(const LineCallback& on_line) {
  if (!carry_.empty() && !skipping_oversize_) emit(carry_, on_line);
  carry_.clear();
  skipping_oversize_ = false;
}

void LineSplitter::reset() noexcept {
  carry_.clear();
  skipping_oversize_ = false;
  at_start_ = true;
  bytes_ = 0;
  dropped_ = 0;
}

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};

  bool for_each_block(const BlockCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }

    std::vector<char> buf(cfg.chunk_bytes, 0);
    while (true) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; std::fclose(f); return false; }
      if (n == 0) break;
      bytes += n;
      if (!cb(std::string_view(buf.data(), n))) { std::fclose(f); return false; }
    }

    std::fclose(f);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_block(const BlockCallback& cb) { return p_->for_each_block(cb); }

bool ChunkReader::for_each_line(const LineSplitter::LineCallback& cb) {
  LineSplitter splitter;
  const bool ok = p_->for_each_block([&](std::string_view block) {
    splitter.feed(block, cb);
    return true;
  });
  if (ok) splitter.finish(cb);
  return ok;
}

int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
