#include <zipnum/config.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace zipnum {

static constexpr uint64_t kMiB = 1024ull * 1024ull;

std::string validate_config(const Config& cfg) {
  if (cfg.input.empty())
    return "input is required (-i PATH or -i -)";
  if (cfg.output_dir.empty())
    return "output directory is required (-o DIR)";
  if (cfg.chunk_size == 0)
    return "chunk size must be a positive integer";
  if (cfg.compress_level < kMinCompressLevel || cfg.compress_level > kMaxCompressLevel)
    return "compress level must be in 1..9";
  if (!cfg.single_shard) {
    if (cfg.shard_size_mb == 0)
      return "shard size must be at least 1 MB";
    if (cfg.shard_size_mb > std::numeric_limits<uint64_t>::max() / kMiB)
      return "shard size is too large";
  }
  if (cfg.shard_suffix.empty())
    return "shard suffix is empty";
  if (spdlog::level::from_str(cfg.log_level) == spdlog::level::off &&
      cfg.log_level != "off")
    return "unknown log level: " + cfg.log_level;
  return {};
}

uint64_t shard_threshold_bytes(const Config& cfg) {
  if (cfg.single_shard)
    return kNoRollover;
  return cfg.shard_size_mb * kMiB;
}

} // namespace zipnum
