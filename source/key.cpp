#include <zipnum/key.hpp>

#include <cstdint>

namespace zipnum {

static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

static bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// длина корректной последовательности, начинающейся с s[i], либо
// -(длина максимального валидного префикса) если она оборвана/битая
static int utf8_seq(std::string_view s, size_t i) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80)
    return 1;

  int need = 0;
  unsigned char lo = 0x80, hi = 0xBF; // допустимый диапазон второго байта
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    need = 1;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    need = 2;
    if (b0 == 0xE0) lo = 0xA0;
    if (b0 == 0xED) hi = 0x9F;
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    need = 3;
    if (b0 == 0xF0) lo = 0x90;
    if (b0 == 0xF4) hi = 0x8F;
  } else {
    return -1;
  }

  int got = 1;
  for (int k = 1; k <= need; ++k) {
    if (i + k >= s.size())
      return -got;
    const auto c = static_cast<unsigned char>(s[i + k]);
    if (k == 1 ? (c < lo || c > hi) : !is_cont(c))
      return -got;
    ++got;
  }
  return got;
}

std::string sanitize_utf8(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    int n = utf8_seq(bytes, i);
    if (n > 0) {
      out.append(bytes.data() + i, static_cast<size_t>(n));
      i += static_cast<size_t>(n);
    } else {
      out.append(kReplacement);
      i += static_cast<size_t>(-n);
    }
  }
  return out;
}

// пробельные символы в смысле Python str.isspace()
static bool is_space(uint32_t cp) {
  return cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F) ||
         cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
         cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// s - валидный UTF-8 (после sanitize_utf8)
static uint32_t decode_at(std::string_view s, size_t i, size_t len) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (len == 1)
    return b0;
  uint32_t cp = b0 & (0x7F >> len);
  for (size_t k = 1; k < len; ++k)
    cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  return cp;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty()) {
    const size_t len = static_cast<size_t>(utf8_seq(s, 0));
    if (!is_space(decode_at(s, 0, len)))
      break;
    s.remove_prefix(len);
  }
  while (!s.empty()) {
    size_t start = s.size() - 1;
    while (start > 0 && is_cont(static_cast<unsigned char>(s[start])))
      --start;
    if (!is_space(decode_at(s, start, s.size() - start)))
      break;
    s.remove_suffix(s.size() - start);
  }
  return s;
}

std::string extract_key(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
    line.remove_suffix(1);

  const std::string text = sanitize_utf8(line);
  std::string_view v = text;
  if (auto pos = v.find('{'); pos != std::string_view::npos)
    v = v.substr(0, pos);
  return std::string(trim(v));
}

} // namespace zipnum
