#pragma once
#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// чистый временный каталог: <tmp>/zipnum_<prefix><pid>_<n>
fs::path mktmp(const char* prefix);

void write_file(const fs::path& p, const std::string& data);
std::string read_file(const fs::path& p);
void write_gz_file(const fs::path& p, const std::string& data);

std::vector<std::string> split(const std::string& s, char sep);
std::vector<std::string> read_lines(const fs::path& p);

// n строк вида "com,example)/page00042 20240101000000 {"url": ...}\n"
std::string make_cdxj(size_t n, size_t payload = 16);
