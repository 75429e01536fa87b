#include <zipnum/compressor.hpp>

#include <cstring>
#include <stdexcept>
#include <string>

namespace zipnum {

static constexpr int kGzipWindowBits = 16 + MAX_WBITS;
static constexpr size_t kOutStep = 64 * 1024;

static std::string zerr(const char* what, int rc, const z_stream& zs) {
  std::string s = what;
  s += " failed (rc=" + std::to_string(rc) + ")";
  if (zs.msg)
    s += std::string(": ") + zs.msg;
  return s;
}

ChunkCompressor::ChunkCompressor(int level) : level_(level) {
  if (level_ < kMinCompressLevel || level_ > kMaxCompressLevel)
    throw std::invalid_argument("compression level must be in 1..9, got " +
                                std::to_string(level_));
  std::memset(&zs_, 0, sizeof(zs_));
  int rc = ::deflateInit2(&zs_, level_, Z_DEFLATED, kGzipWindowBits, 8,
                          Z_DEFAULT_STRATEGY);
  if (rc != Z_OK)
    throw std::runtime_error(zerr("deflateInit2", rc, zs_));
}

ChunkCompressor::~ChunkCompressor() { ::deflateEnd(&zs_); }

std::string ChunkCompressor::compress(const Chunk& chunk) {
  std::string joined;
  joined.reserve(chunk.raw_bytes());
  for (const auto& l : chunk.lines)
    joined += l;
  return compress(joined);
}

std::string ChunkCompressor::compress(std::string_view data) {
  // весь чанк одним вызовом deflate(Z_FINISH); deflateBound обычно хватает
  std::string out(::deflateBound(&zs_, static_cast<uLong>(data.size())), '\0');
  zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs_.avail_in = static_cast<uInt>(data.size());

  size_t used = 0;
  while (true) {
    zs_.next_out = reinterpret_cast<Bytef*>(out.data() + used);
    zs_.avail_out = static_cast<uInt>(out.size() - used);
    int rc = ::deflate(&zs_, Z_FINISH);
    used = out.size() - zs_.avail_out;
    if (rc == Z_STREAM_END)
      break;
    if (rc != Z_OK && rc != Z_BUF_ERROR)
      throw std::runtime_error(zerr("deflate(Z_FINISH)", rc, zs_));
    out.resize(out.size() + kOutStep);
  }
  out.resize(used);

  int rc = ::deflateReset(&zs_);
  if (rc != Z_OK)
    throw std::runtime_error(zerr("deflateReset", rc, zs_));
  return out;
}

std::string gunzip(std::string_view data) {
  std::string out;
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  int rc = ::inflateInit2(&zs, kGzipWindowBits);
  if (rc != Z_OK)
    throw std::runtime_error(zerr("inflateInit2", rc, zs));

  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());

  // несколько members подряд: после Z_STREAM_END делаем inflateReset
  while (true) {
    const size_t used = out.size();
    out.resize(used + kOutStep);
    zs.next_out = reinterpret_cast<Bytef*>(out.data() + used);
    zs.avail_out = static_cast<uInt>(kOutStep);
    rc = ::inflate(&zs, Z_NO_FLUSH);
    out.resize(used + (kOutStep - zs.avail_out));

    if (rc == Z_STREAM_END) {
      if (zs.avail_in == 0)
        break;
      rc = ::inflateReset(&zs);
      if (rc != Z_OK)
        break;
      continue;
    }
    if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
      rc = Z_DATA_ERROR; // оборванный поток
      break;
    }
    if (rc != Z_OK)
      break;
  }

  if (rc != Z_STREAM_END && rc != Z_OK) {
    std::string msg = zerr("inflate", rc, zs);
    ::inflateEnd(&zs);
    throw std::runtime_error(msg);
  }
  ::inflateEnd(&zs);
  return out;
}

} // namespace zipnum
