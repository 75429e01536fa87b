#include <zipnum/builder.hpp>
#include <zipnum/chunker.hpp>
#include <zipnum/compressor.hpp>
#include <zipnum/index_writer.hpp>
#include <zipnum/key.hpp>
#include <zipnum/line_reader.hpp>
#include <zipnum/location_writer.hpp>
#include <zipnum/shard_writer.hpp>
#include <zipnum/util.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

namespace zipnum {

std::string default_base_name(const fs::path& output_dir) {
  std::error_code ec;
  fs::path abs = fs::absolute(output_dir, ec);
  if (ec)
    abs = output_dir;
  // "out/" -> "out"
  std::string name = abs.lexically_normal().filename().string();
  if (name.empty())
    name = abs.lexically_normal().parent_path().filename().string();
  if (name.empty() || name == "." || name == "..")
    return "zipnum-output";
  return name;
}

BuildResult build_zipnum(const Config& cfg) {
  if (auto err = validate_config(cfg); !err.empty())
    throw std::invalid_argument(err);

  const fs::path out_dir(cfg.output_dir);
  ensure_dir(out_dir);

  BuildResult res;
  res.base = cfg.base.empty() ? default_base_name(out_dir) : cfg.base;
  res.index_path = out_dir / (cfg.idx_file.empty() ? res.base + ".idx" : cfg.idx_file);
  res.loc_path = out_dir / (cfg.loc_file.empty() ? res.base + ".loc" : cfg.loc_file);

  const uint64_t threshold = shard_threshold_bytes(cfg);
  if (threshold == kNoRollover)
    spdlog::info("base={} chunk_size={} level={} single shard", res.base,
                 cfg.chunk_size, cfg.compress_level);
  else
    spdlog::info("base={} chunk_size={} level={} shard_size={}MB", res.base,
                 cfg.chunk_size, cfg.compress_level, cfg.shard_size_mb);

  auto t_start = std::chrono::steady_clock::now();

  LineReader reader = LineReader::open(cfg.input);
  ChunkAssembler chunks(reader, cfg.chunk_size);
  ChunkCompressor compressor(cfg.compress_level);
  ShardWriter shards(out_dir, res.base, threshold, cfg.shard_suffix);
  IndexWriter index(res.index_path, cfg.index_batch);

  Chunk chunk;
  while (chunks.next(chunk)) {
    const std::string member = compressor.compress(chunk);
    ChunkLocation loc = shards.append(member);

    // ключ чанка = ключ его первой строки
    index.add(IndexRecord{extract_key(chunk.lines.front()), loc.shard_name,
                          loc.offset, loc.length, loc.shard_no});

    if (loc.rotated) {
      index.flush();
      spdlog::debug("rotated after chunk {}: {} shard(s) so far", chunk.index,
                    shards.shard_count());
    }
  }

  index.close();
  reader.close();
  res.lines = reader.lines_read();
  res.raw_bytes = reader.bytes_read();
  res.chunks = chunks.chunks_emitted();
  res.compressed_bytes = shards.bytes_written();

  if (res.lines == 0)
    spdlog::warn("input {} is empty; writing an empty shard", cfg.input);

  res.shards = shards.finish();
  write_location_file(res.loc_path, res.shards, cfg.shard_suffix);

  using seconds_f = std::chrono::duration<double>;
  const double dt = seconds_f(std::chrono::steady_clock::now() - t_start).count();
  spdlog::info("lines={} chunks={} shards={} raw={}B gz={}B in {:.2f}s", res.lines,
               res.chunks, res.shards.size(), res.raw_bytes, res.compressed_bytes, dt);
  return res;
}

} // namespace zipnum
