#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <zipnum/line_reader.hpp>

namespace zipnum {

struct Chunk {
  uint64_t index = 0;              // порядковый номер чанка, с 0
  std::vector<std::string> lines;  // строки с терминаторами

  size_t raw_bytes() const noexcept;
};

// Группирует строки в чанки по chunk_size. В памяти не более одного чанка.
class ChunkAssembler {
public:
  ChunkAssembler(LineReader& reader, size_t chunk_size);

  // false, когда вход исчерпан и хвост уже выдан
  bool next(Chunk& out);

  uint64_t chunks_emitted() const noexcept { return next_index_; }

private:
  LineReader& reader_;
  size_t chunk_size_;
  uint64_t next_index_ = 0;
  bool eof_ = false;
};

} // namespace zipnum
