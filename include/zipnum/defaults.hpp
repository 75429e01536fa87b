#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>

namespace zipnum {

inline constexpr int kMinCompressLevel = 1;
inline constexpr int kMaxCompressLevel = 9;
inline constexpr int kDefaultCompressLevel = 6;

inline constexpr uint64_t kNoRollover = std::numeric_limits<uint64_t>::max();
inline constexpr const char* kDefaultShardSuffix = ".cdx.gz";

inline constexpr size_t kDefaultIndexBatch = 100;

} // namespace zipnum
