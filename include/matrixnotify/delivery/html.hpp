#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace matrixnotify::delivery::html {

enum class HtmlTag {
  H1,
  H2,
  H3,
  H4,
  Paragraph,
  Code,
  Bold,
  Italic,
};

/// Element name: h1..h4, p, code, strong, em.
[[nodiscard]] std::string_view tag_name(HtmlTag tag);
[[nodiscard]] std::optional<HtmlTag> parse_html_tag(const std::string &name);

/// Wraps `content` in the tag. Code becomes `<pre><code>...</code></pre>`.
[[nodiscard]] std::string format(HtmlTag tag, const std::string &content);

[[nodiscard]] std::string replace_new_lines(const std::string &content);
[[nodiscard]] std::string replace_spaces(const std::string &content);
[[nodiscard]] std::string replace_spaces_and_new_lines(const std::string &content);

/// Plain-text fallback for an HTML message: drops every `<...>` run on a single
/// line (shortest match), then every byte outside ASCII. Not an HTML parser;
/// a `>` inside an attribute value or a tag spanning lines is not handled.
[[nodiscard]] std::string strip_html_tags_and_non_ascii(const std::string &html_message);

} // namespace matrixnotify::delivery::html
