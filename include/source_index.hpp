#pragma once

#include <source_range.hpp>

#include <string_view>
#include <optional>
#include <iosfwd>
#include <string>

namespace nibasm
{

struct line_info
{
  std::string_view line;
  std::size_t line_number;
  std::size_t column;
};

/// Owns the text of one source unit. Every other component refers to the text
/// through spans that are resolved here.
class source_index
{
public:
  static constexpr std::size_t tab_width = 4;

  source_index(std::string module, std::string text);

  static std::optional<source_index> from_file(std::string_view path);
  static source_index from_stream(std::string module, std::istream& is);

  std::string_view module() const
  { return module_name; }

  std::string_view text() const
  { return content; }

  std::size_t size() const
  { return content.size(); }

  std::optional<std::string_view> get_span(span s) const;

  // line containing the start of `s`, 1-based line number and rendered column
  std::optional<line_info> get_span_line(span s) const;
private:
  std::string module_name;
  std::string content;
};

// columns taken by `text` when printed: tabs count as tab_width, UTF-8 characters as one
std::size_t display_width(std::string_view text);

std::string expand_tabs(std::string_view line);

}

