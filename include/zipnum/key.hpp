#pragma once
#include <string>
#include <string_view>

namespace zipnum {

// Ключ индекса для строки CDX/CDXJ.
// Байты декодируются как UTF-8 (битые последовательности -> U+FFFD),
// хвостовые \r/\n срезаются. Если есть '{', ключ = всё до первой '{'
// без пробелов по краям, иначе вся строка без пробелов по краям.
std::string extract_key(std::string_view line);

// UTF-8 с заменой невалидных последовательностей на U+FFFD
std::string sanitize_utf8(std::string_view bytes);

} // namespace zipnum
