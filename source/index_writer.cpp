#include <zipnum/index_writer.hpp>
#include <zipnum/util.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace fs = std::filesystem;

namespace zipnum {

std::string format_index_record(const IndexRecord& r) {
  return fmt::format("{}\t{}\t{}\t{}\t{}\n", r.key, r.shard_name, r.offset,
                     r.length, r.shard_no);
}

IndexWriter::IndexWriter(fs::path path, size_t batch_size)
    : path_(std::move(path)), batch_size_(batch_size ? batch_size : 1) {
  fd_ = ::open(path_.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd_ < 0)
    throw std::runtime_error("index open: " + path_.string() + ": " +
                             errno_text(errno));
}

IndexWriter::~IndexWriter() {
  if (fd_ >= 0) {
    if (pending_ > 0)
      spdlog::warn("index {} closed with {} unflushed records", path_.string(),
                   pending_);
    ::close(fd_);
  }
}

void IndexWriter::add(const IndexRecord& r) {
  if (fd_ < 0)
    throw std::logic_error("IndexWriter::add after close()");
  buf_ += format_index_record(r);
  if (++pending_ >= batch_size_)
    flush();
}

void IndexWriter::flush() {
  if (pending_ == 0)
    return;
  write_all(fd_, buf_, path_.string());
  written_ += pending_;
  spdlog::trace("index flush: {} records ({} total)", pending_, written_);
  buf_.clear();
  pending_ = 0;
}

void IndexWriter::close() {
  if (fd_ < 0)
    return;
  flush();
  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0)
    throw std::runtime_error("index close: " + path_.string() + ": " +
                             errno_text(errno));
}

} // namespace zipnum
