#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include <zipnum/defaults.hpp>

namespace zipnum {

struct Config {
  std::string input;                  // путь или "-"
  std::string output_dir;
  uint64_t    shard_size_mb = 100;
  bool        single_shard = false;
  size_t      chunk_size = 3000;      // строк на чанк
  int         compress_level = kDefaultCompressLevel;
  std::string base;                   // пусто -> имя каталога вывода
  std::string idx_file;               // пусто -> <base>.idx
  std::string loc_file;               // пусто -> <base>.loc
  std::string shard_suffix = kDefaultShardSuffix;
  size_t      index_batch = kDefaultIndexBatch;
  std::string log_level = "info";
};

// пустая строка = конфиг валиден
std::string validate_config(const Config& cfg);

uint64_t shard_threshold_bytes(const Config& cfg);

} // namespace zipnum
