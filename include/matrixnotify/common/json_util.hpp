#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace matrixnotify::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Serialize ordered string pairs as a flat JSON object.
[[nodiscard]] std::string
json_object(const std::vector<std::pair<std::string, std::string>> &fields);

} // namespace matrixnotify::common
