#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace zipnum {

void ensure_dir(const std::filesystem::path& p);

// пишет всё или бросает std::runtime_error (what = "<what>: <path>: <strerror>")
void write_all(int fd, std::string_view data, const std::string& what_path);

// строгий разбор целого без знака: вся строка должна быть числом
std::optional<uint64_t> parse_uint(std::string_view s);

std::string errno_text(int err);

// "a-01.cdx.gz", ".cdx.gz" -> "a-01"; без суффикса строка не меняется
std::string strip_suffix(std::string s, std::string_view suffix);

} // namespace zipnum
