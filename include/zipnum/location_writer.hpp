#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace zipnum {

// .loc: "<shard_name>\t<shard_basename>\n" на каждый шард, по порядку.
// Пишется целиком после finish(), когда имена шардов окончательные.
void write_location_file(const std::filesystem::path& path,
                         const std::vector<std::filesystem::path>& shards,
                         const std::string& suffix);

} // namespace zipnum
