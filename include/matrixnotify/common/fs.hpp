#pragma once

#include "matrixnotify/common/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace matrixnotify::common {

[[nodiscard]] std::string trim(const std::string &input);
/// Unicode White_Space code points, including U+00A0 and U+3000.
[[nodiscard]] bool is_unicode_space(std::uint32_t cp);
/// True when the UTF-8 text is empty or only Unicode whitespace.
[[nodiscard]] bool is_blank(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string replace_all(std::string value, const std::string &from,
                                      const std::string &to);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

} // namespace matrixnotify::common
