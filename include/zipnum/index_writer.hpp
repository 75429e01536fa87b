#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <zipnum/defaults.hpp>

namespace zipnum {

struct IndexRecord {
  std::string key;
  std::string shard_name;
  uint64_t offset = 0;
  uint64_t length = 0;
  uint32_t shard_no = 0; // 1-based
};

// "key\tshard\toffset\tlength\tshard_no\n"
std::string format_index_record(const IndexRecord& r);

// .idx пишется потоком: записи копятся пачкой до batch_size и уходят
// одним write(). Файл открывается один раз на весь прогон.
class IndexWriter {
public:
  explicit IndexWriter(std::filesystem::path path,
                       size_t batch_size = kDefaultIndexBatch);
  ~IndexWriter();
  IndexWriter(const IndexWriter&) = delete;
  IndexWriter& operator=(const IndexWriter&) = delete;

  void add(const IndexRecord& r);
  void flush();
  void close(); // flush + close

  uint64_t records_written() const noexcept { return written_; }
  size_t pending() const noexcept { return pending_; }

private:
  std::filesystem::path path_;
  size_t batch_size_;
  int fd_ = -1;
  std::string buf_;
  size_t pending_ = 0;
  uint64_t written_ = 0;
};

} // namespace zipnum
