#include "matrixnotify/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace matrixnotify::common {

namespace {

// Malformed sequences yield the lead byte as a code point and advance by one.
std::uint32_t decode_utf8_codepoint(const std::string &input, std::size_t &index) {
  const unsigned char lead = static_cast<unsigned char>(input[index]);
  std::size_t extra = 0;
  std::uint32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    ++index;
    return lead;
  }

  if (index + extra >= input.size()) {
    ++index;
    return lead;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      ++index;
      return lead;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
  }
  index += extra + 1;
  return value;
}

} // namespace

bool is_unicode_space(const std::uint32_t cp) {
  return (cp >= 0x09U && cp <= 0x0DU) || (cp >= 0x1CU && cp <= 0x20U) || cp == 0x85U ||
         cp == 0xA0U || cp == 0x1680U || (cp >= 0x2000U && cp <= 0x200AU) || cp == 0x2028U ||
         cp == 0x2029U || cp == 0x202FU || cp == 0x205FU || cp == 0x3000U;
}

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool is_blank(const std::string &input) {
  std::size_t index = 0;
  while (index < input.size()) {
    if (!is_unicode_space(decode_utf8_codepoint(input, index))) {
      return false;
    }
  }
  return true;
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string replace_all(std::string value, const std::string &from, const std::string &to) {
  if (from.empty()) {
    return value;
  }
  std::size_t pos = 0;
  while ((pos = value.find(from, pos)) != std::string::npos) {
    value.replace(pos, from.size(), to);
    pos += to.size();
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

} // namespace matrixnotify::common
