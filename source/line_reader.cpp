#include <zipnum/line_reader.hpp>
#include <zipnum/util.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <sys/types.h>
#include <utility>

namespace fs = std::filesystem;

namespace zipnum {

static constexpr size_t kGzBufSize = 1 << 16;

bool is_stdin_marker(const std::string& path) { return path == "-"; }

bool has_gzip_suffix(const std::string& path) {
  return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

LineReader LineReader::open(const std::string& path) {
  LineReader r;
  r.path_ = path;

  if (is_stdin_marker(path)) {
    r.fp_ = stdin;
    r.owns_fp_ = false;
    spdlog::info("input: <stdin>");
    return r;
  }

  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    throw std::runtime_error("input not found or not a regular file: " + path);

  if (has_gzip_suffix(path)) {
    r.gz_ = ::gzopen(path.c_str(), "rb");
    if (!r.gz_)
      throw std::runtime_error("gzopen: " + path + ": " + errno_text(errno));
    ::gzbuffer(r.gz_, static_cast<unsigned>(kGzBufSize));
    spdlog::info("input: {} (gzip)", path);
  } else {
    r.fp_ = std::fopen(path.c_str(), "rb");
    if (!r.fp_)
      throw std::runtime_error("open: " + path + ": " + errno_text(errno));
    r.owns_fp_ = true;
    spdlog::info("input: {}", path);
  }
  return r;
}

LineReader::~LineReader() { close(); }

LineReader::LineReader(LineReader&& o) noexcept
    : path_(std::move(o.path_)), fp_(o.fp_), owns_fp_(o.owns_fp_),
      gz_(o.gz_), gz_buf_(std::move(o.gz_buf_)), gz_pos_(o.gz_pos_),
      gz_eof_(o.gz_eof_), buf_(o.buf_), buf_cap_(o.buf_cap_), lines_(o.lines_),
      bytes_(o.bytes_) {
  o.fp_ = nullptr;
  o.owns_fp_ = false;
  o.gz_ = nullptr;
  o.buf_ = nullptr;
  o.buf_cap_ = 0;
}

LineReader& LineReader::operator=(LineReader&& o) noexcept {
  if (this != &o) {
    close();
    path_ = std::move(o.path_);
    fp_ = o.fp_;           o.fp_ = nullptr;
    owns_fp_ = o.owns_fp_; o.owns_fp_ = false;
    gz_ = o.gz_;           o.gz_ = nullptr;
    gz_buf_ = std::move(o.gz_buf_);
    gz_pos_ = o.gz_pos_;
    gz_eof_ = o.gz_eof_;
    buf_ = o.buf_;         o.buf_ = nullptr;
    buf_cap_ = o.buf_cap_; o.buf_cap_ = 0;
    lines_ = o.lines_;
    bytes_ = o.bytes_;
  }
  return *this;
}

void LineReader::close() {
  if (gz_) {
    ::gzclose(gz_);
    gz_ = nullptr;
  }
  gz_buf_.clear();
  gz_pos_ = 0;
  if (fp_ && owns_fp_)
    std::fclose(fp_);
  fp_ = nullptr;
  owns_fp_ = false;
  std::free(buf_);
  buf_ = nullptr;
  buf_cap_ = 0;
}

bool LineReader::next(std::string& line) {
  line.clear();
  bool ok = false;
  if (gz_)
    ok = next_gz(line);
  else if (fp_)
    ok = next_plain(line);
  if (ok) {
    ++lines_;
    bytes_ += line.size();
  }
  return ok;
}

bool LineReader::next_plain(std::string& line) {
  errno = 0;
  ssize_t n = ::getline(&buf_, &buf_cap_, fp_);
  if (n < 0) {
    if (std::ferror(fp_))
      throw std::runtime_error("read: " + path_ + ": " + errno_text(errno));
    return false;
  }
  line.assign(buf_, static_cast<size_t>(n));
  return true;
}

bool LineReader::next_gz(std::string& line) {
  // gzread + свой разбор по '\n': строки с NUL не обрезаются
  while (true) {
    if (gz_pos_ < gz_buf_.size()) {
      const size_t nl = gz_buf_.find('\n', gz_pos_);
      if (nl != std::string::npos) {
        line.append(gz_buf_, gz_pos_, nl + 1 - gz_pos_);
        gz_pos_ = nl + 1;
        return true;
      }
      line.append(gz_buf_, gz_pos_, std::string::npos);
    }
    gz_buf_.clear();
    gz_pos_ = 0;
    if (gz_eof_)
      return !line.empty();

    gz_buf_.resize(kGzBufSize);
    int got = ::gzread(gz_, gz_buf_.data(), static_cast<unsigned>(gz_buf_.size()));
    if (got < 0) {
      int err = Z_OK;
      const char* msg = ::gzerror(gz_, &err);
      throw std::runtime_error("gzip read: " + path_ + ": " + msg);
    }
    gz_buf_.resize(static_cast<size_t>(got));
    if (got == 0) {
      int err = Z_OK;
      const char* msg = ::gzerror(gz_, &err);
      if (err != Z_OK && err != Z_STREAM_END)
        throw std::runtime_error("gzip read: " + path_ + ": " + msg);
      gz_eof_ = true;
    }
  }
}

} // namespace zipnum
