#include <zipnum/util.hpp>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace zipnum {

void ensure_dir(const fs::path& p) {
  std::error_code ec;
  if (fs::is_directory(p, ec))
    return;
  fs::create_directories(p, ec);
  if (ec)
    throw std::runtime_error("mkdir: " + p.string() + ": " + ec.message());
}

std::string errno_text(int err) { return std::strerror(err); }

std::string strip_suffix(std::string s, std::string_view suffix) {
  if (!suffix.empty() && s.size() >= suffix.size() &&
      s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0)
    s.resize(s.size() - suffix.size());
  return s;
}

void write_all(int fd, std::string_view data, const std::string& what_path) {
  const char* p = data.data();
  size_t left = data.size();
  while (left > 0) {
    ssize_t w = ::write(fd, p, left);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("write: " + what_path + ": " + errno_text(errno));
    }
    p += w;
    left -= static_cast<size_t>(w);
  }
}

std::optional<uint64_t> parse_uint(std::string_view s) {
  if (s.empty())
    return std::nullopt;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return std::nullopt;
  return v;
}

} // namespace zipnum
