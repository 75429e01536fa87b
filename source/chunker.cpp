#include <zipnum/chunker.hpp>

#include <stdexcept>

namespace zipnum {

size_t Chunk::raw_bytes() const noexcept {
  size_t n = 0;
  for (const auto& l : lines)
    n += l.size();
  return n;
}

ChunkAssembler::ChunkAssembler(LineReader& reader, size_t chunk_size)
    : reader_(reader), chunk_size_(chunk_size) {
  if (chunk_size_ == 0)
    throw std::invalid_argument("chunk size must be a positive integer");
}

bool ChunkAssembler::next(Chunk& out) {
  out.lines.clear();
  if (eof_)
    return false;

  std::string line;
  while (out.lines.size() < chunk_size_) {
    if (!reader_.next(line)) {
      eof_ = true;
      break;
    }
    out.lines.push_back(std::move(line));
  }
  if (out.lines.empty())
    return false;

  out.index = next_index_++;
  return true;
}

} // namespace zipnum
