#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <zipnum/defaults.hpp>

namespace zipnum {

// Где лёг сжатый чанк
struct ChunkLocation {
  uint64_t offset = 0;     // размер шарда до записи
  uint64_t length = 0;     // точная длина gzip member
  uint32_t shard_no = 0;   // 1-based
  std::string shard_name;  // имя шарда без расширения
  bool rotated = false;    // после записи открыт следующий шард
};

// Пишет сжатые чанки в текущий шард; после записи, если размер шарда
// >= порога, закрывает его и открывает следующий (<base>-NN<suffix>).
// В каждый момент открыт ровно один файл шарда.
class ShardWriter {
public:
  ShardWriter(std::filesystem::path dir, std::string base,
              uint64_t threshold_bytes = kNoRollover,
              std::string suffix = kDefaultShardSuffix);
  ~ShardWriter();
  ShardWriter(const ShardWriter&) = delete;
  ShardWriter& operator=(const ShardWriter&) = delete;

  ChunkLocation append(std::string_view member);

  // Закрывает текущий шард; единственный шард переименовывается в
  // <base><suffix>. Повторный вызов возвращает тот же список.
  const std::vector<std::filesystem::path>& finish();

  uint32_t shard_count() const noexcept { return static_cast<uint32_t>(paths_.size()); }
  uint64_t current_offset() const noexcept { return offset_; }
  uint64_t bytes_written() const noexcept { return total_bytes_; }

  std::string numbered_name(uint32_t index) const;  // "<base>-NN" (index с 0)

private:
  void open_shard(uint32_t index);
  void close_shard();

  std::filesystem::path dir_;
  std::string base_;
  std::string suffix_;
  uint64_t threshold_;

  int fd_ = -1;
  uint32_t index_ = 0;      // текущий шард, с 0
  uint64_t offset_ = 0;
  uint64_t total_bytes_ = 0;
  std::string cur_name_;
  std::vector<std::filesystem::path> paths_;
  bool finished_ = false;
};

} // namespace zipnum
