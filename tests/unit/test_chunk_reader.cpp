#include "playsync/chunk_reader.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool ok, const std::string& what) {
  std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
  if (!ok) ++failures;
}

static std::vector<std::string> split_blocks(const std::vector<std::string>& blocks,
                                             ps::LineSplitter::Config cfg = {}) {
  ps::LineSplitter sp(cfg);
  std::vector<std::string> lines;
  auto on_line = [&](std::string_view s){ lines.emplace_back(s); };
  for (const auto& b : blocks) sp.feed(b, on_line);
  sp.finish(on_line);
  return lines;
}

int main(){
  // carry across block boundaries
  {
    auto lines = split_blocks({"#EXTINF:-1,Ti", "tle\nhttp://a/", "1.ts\n#EXT", "M3U"});
    check(lines.size() == 3 && lines[0] == "#EXTINF:-1,Title" && lines[1] == "http://a/1.ts"
          && lines[2] == "#EXTM3U", "partial line carried across feeds");
  }

  // CRLF and BOM
  {
    auto lines = split_blocks({"\xEF\xBB\xBF#EXTM3U\r\n#EXTINF:-1,A\r", "\nhttp://a\r\n"});
    check(lines.size() == 3 && lines[0] == "#EXTM3U" && lines[1] == "#EXTINF:-1,A"
          && lines[2] == "http://a", "BOM stripped and CR removed");
  }

  // a BOM split over two blocks is still recognised
  {
    auto lines = split_blocks({"\xEF\xBB", "\xBFx\n"});
    check(lines.size() == 1 && lines[0] == "x", "split BOM stripped");
  }

  // oversize guard drops the long line only
  {
    ps::LineSplitter::Config cfg;
    cfg.max_record_bytes = 8;
    ps::LineSplitter sp(cfg);
    std::vector<std::string> lines;
    auto on_line = [&](std::string_view s){ lines.emplace_back(s); };
    sp.feed("short\nthis-is-way-too-", on_line);
    sp.feed("long-for-the-guard\nok\n", on_line);
    sp.finish(on_line);
    check(lines.size() == 2 && lines[0] == "short" && lines[1] == "ok"
          && sp.lines_dropped() == 1, "oversize line dropped");
  }

  // file reader
  const fs::path f = "tests/data/sample.m3u8";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  ps::ChunkReader::Config rcfg;
  rcfg.chunk_bytes = 64; // force many blocks
  ps::ChunkReader r(f.string(), rcfg);
  uint64_t lines = 0;
  bool ok = r.for_each_line([&](std::string_view){ ++lines; });
  check(ok, "chunk_reader read whole file");
  check(lines == 17, "chunk_reader lines=" + std::to_string(lines));
  check(r.bytes_read() == fs::file_size(f), "bytes_read matches file size");

  ps::ChunkReader missing("tests/data/does-not-exist.m3u8");
  check(!missing.for_each_block([](std::string_view){ return true; }) && missing.last_error() != 0,
        "missing file reported");

  return failures ? 1 : 0;
}
