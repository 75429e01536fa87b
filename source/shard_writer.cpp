#include <zipnum/shard_writer.hpp>
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

ShardWriter::ShardWriter(fs::path dir, std::string base,
                         uint64_t threshold_bytes, std::string suffix)
    : dir_(std::move(dir)), base_(std::move(base)), suffix_(std::move(suffix)),
      threshold_(threshold_bytes) {
  if (base_.empty())
    throw std::invalid_argument("shard base name is empty");
  if (threshold_ == 0)
    throw std::invalid_argument("shard threshold must be positive");

  // первый шард открываем сразу, даже если вход окажется пустым
  open_shard(0);
}

ShardWriter::~ShardWriter() {
  if (fd_ >= 0)
    ::close(fd_);
}

std::string ShardWriter::numbered_name(uint32_t index) const {
  return fmt::format("{}-{:02d}", base_, index + 1);
}

void ShardWriter::open_shard(uint32_t index) {
  index_ = index;
  cur_name_ = numbered_name(index);
  fs::path p = dir_ / (cur_name_ + suffix_);

  fd_ = ::open(p.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd_ < 0)
    throw std::runtime_error("shard open: " + p.string() + ": " + errno_text(errno));

  paths_.push_back(std::move(p));
  offset_ = 0;
  spdlog::info("shard open: {}", paths_.back().string());
}

void ShardWriter::close_shard() {
  if (fd_ < 0)
    return;
  int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0)
    throw std::runtime_error("shard close: " + paths_.back().string() + ": " +
                             errno_text(errno));
}

ChunkLocation ShardWriter::append(std::string_view member) {
  if (fd_ < 0)
    throw std::logic_error("ShardWriter::append after finish()");

  ChunkLocation loc;
  loc.offset = offset_;
  loc.length = member.size();
  loc.shard_no = index_ + 1;
  loc.shard_name = cur_name_;

  write_all(fd_, member, paths_.back().string());
  offset_ += member.size();
  total_bytes_ += member.size();

  // мягкий порог: проверяем после записи, чанк не режем
  if (threshold_ != kNoRollover && offset_ >= threshold_) {
    spdlog::debug("shard {} reached {} bytes (threshold {}), rotating",
                  cur_name_, offset_, threshold_);
    close_shard();
    open_shard(index_ + 1);
    loc.rotated = true;
  }
  return loc;
}

const std::vector<fs::path>& ShardWriter::finish() {
  if (finished_)
    return paths_;
  close_shard();
  finished_ = true;

  if (paths_.size() == 1) {
    fs::path single = dir_ / (base_ + suffix_);
    if (paths_[0] != single) {
      std::error_code ec;
      fs::rename(paths_[0], single, ec);
      if (ec)
        throw std::runtime_error("rename " + paths_[0].string() + " -> " +
                                 single.string() + ": " + ec.message());
      spdlog::debug("single shard renamed to {}", single.string());
      paths_[0] = std::move(single);
    }
  }
  return paths_;
}

} // namespace zipnum
