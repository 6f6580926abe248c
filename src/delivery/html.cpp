#include "matrixnotify/delivery/html.hpp"

#include "matrixnotify/common/fs.hpp"

namespace matrixnotify::delivery::html {

namespace {

std::string strip_tags(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      const std::size_t close = text.find_first_of(">\n", i + 1);
      if (close != std::string::npos && text[close] == '>') {
        i = close + 1;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string strip_non_ascii(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    if (static_cast<unsigned char>(ch) < 0x80) {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace

std::string_view tag_name(const HtmlTag tag) {
  switch (tag) {
  case HtmlTag::H1:
    return "h1";
  case HtmlTag::H2:
    return "h2";
  case HtmlTag::H3:
    return "h3";
  case HtmlTag::H4:
    return "h4";
  case HtmlTag::Paragraph:
    return "p";
  case HtmlTag::Code:
    return "code";
  case HtmlTag::Bold:
    return "strong";
  case HtmlTag::Italic:
    return "em";
  }
  return "";
}

std::optional<HtmlTag> parse_html_tag(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  for (const HtmlTag tag : {HtmlTag::H1, HtmlTag::H2, HtmlTag::H3, HtmlTag::H4,
                            HtmlTag::Paragraph, HtmlTag::Code, HtmlTag::Bold, HtmlTag::Italic}) {
    if (normalized == tag_name(tag)) {
      return tag;
    }
  }
  return std::nullopt;
}

std::string format(const HtmlTag tag, const std::string &content) {
  const std::string name(tag_name(tag));
  if (tag == HtmlTag::Code) {
    return "<pre><code>" + content + "</code></pre>";
  }
  return "<" + name + ">" + content + "</" + name + ">";
}

std::string replace_new_lines(const std::string &content) {
  return common::replace_all(content, "\n", "<br>");
}

std::string replace_spaces(const std::string &content) {
  return common::replace_all(content, " ", "&nbsp;");
}

std::string replace_spaces_and_new_lines(const std::string &content) {
  return replace_new_lines(replace_spaces(content));
}

std::string strip_html_tags_and_non_ascii(const std::string &html_message) {
  return strip_non_ascii(strip_tags(html_message));
}

} // namespace matrixnotify::delivery::html
