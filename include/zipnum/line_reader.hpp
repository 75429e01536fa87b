#pragma once
#include <cstdint>
#include <cstdio>
#include <string>

#include <zlib.h>

namespace zipnum {

// Источник строк: "-" = stdin, "*.gz" через zlib, остальное как есть.
// Строка возвращается вместе с исходным терминатором.
class LineReader {
public:
  static LineReader open(const std::string& path);

  LineReader() = default;
  ~LineReader();
  LineReader(LineReader&&) noexcept;
  LineReader& operator=(LineReader&&) noexcept;
  LineReader(const LineReader&) = delete;
  LineReader& operator=(const LineReader&) = delete;

  // false на EOF; ошибки чтения -> std::runtime_error
  bool next(std::string& line);

  void close();

  uint64_t lines_read() const noexcept { return lines_; }
  uint64_t bytes_read() const noexcept { return bytes_; }

private:
  bool next_plain(std::string& line);
  bool next_gz(std::string& line);

  std::string path_;
  std::FILE* fp_ = nullptr;
  bool owns_fp_ = false;
  gzFile gz_ = nullptr;
  std::string gz_buf_;  // распакованный хвост после последнего '\n'
  size_t gz_pos_ = 0;
  bool gz_eof_ = false;
  char* buf_ = nullptr; // буфер getline(3)
  size_t buf_cap_ = 0;

  uint64_t lines_ = 0;
  uint64_t bytes_ = 0;
};

bool is_stdin_marker(const std::string& path);
bool has_gzip_suffix(const std::string& path);

} // namespace zipnum
