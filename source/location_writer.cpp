#include <zipnum/location_writer.hpp>
#include <zipnum/util.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace zipnum {

void write_location_file(const fs::path& path, const std::vector<fs::path>& shards,
                         const std::string& suffix) {
  std::string out;
  for (const auto& p : shards) {
    const std::string base = p.filename().string();
    out += strip_suffix(base, suffix);
    out += '\t';
    out += base;
    out += '\n';
  }

  int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0644);
  if (fd < 0)
    throw std::runtime_error("loc open: " + path.string() + ": " + errno_text(errno));
  try {
    write_all(fd, out, path.string());
  } catch (...) {
    ::close(fd);
    throw;
  }
  if (::close(fd) != 0)
    throw std::runtime_error("loc close: " + path.string() + ": " + errno_text(errno));
  spdlog::debug("loc written: {} ({} shards)", path.string(), shards.size());
}

} // namespace zipnum
