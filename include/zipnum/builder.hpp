#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <zipnum/config.hpp>

namespace zipnum {

struct BuildResult {
  std::vector<std::filesystem::path> shards;
  std::filesystem::path index_path;
  std::filesystem::path loc_path;
  std::string base;

  uint64_t lines = 0;
  uint64_t chunks = 0;
  uint64_t raw_bytes = 0;
  uint64_t compressed_bytes = 0;
};

// Имя по умолчанию: basename абсолютного пути каталога вывода
std::string default_base_name(const std::filesystem::path& output_dir);

// Один проход: вход -> чанки -> gzip members -> шарды + .idx, затем .loc.
// Ошибки конфигурации: std::invalid_argument; ввод-вывод: std::runtime_error.
BuildResult build_zipnum(const Config& cfg);

} // namespace zipnum
