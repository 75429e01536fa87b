#pragma once
#include <string>
#include <string_view>

#include <zlib.h>

#include <zipnum/chunker.hpp>
#include <zipnum/defaults.hpp>

namespace zipnum {

// Каждый чанк -> один самостоятельный gzip member (заголовок + deflate + трейлер).
// Такой кусок можно вырезать по offset/length и распаковать отдельно.
class ChunkCompressor {
public:
  explicit ChunkCompressor(int level = kDefaultCompressLevel);
  ~ChunkCompressor();
  ChunkCompressor(const ChunkCompressor&) = delete;
  ChunkCompressor& operator=(const ChunkCompressor&) = delete;

  std::string compress(const Chunk& chunk);
  std::string compress(std::string_view data);

  int level() const noexcept { return level_; }

private:
  int level_;
  z_stream zs_{};
};

// Распаковка одного или нескольких подряд идущих gzip members
std::string gunzip(std::string_view data);

} // namespace zipnum
