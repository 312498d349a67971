#include <source_index.hpp>

#include <algorithm>
#include <iterator>
#include <fstream>
#include <sstream>

namespace nibasm
{

source_index::source_index(std::string module, std::string text)
  : module_name(std::move(module)), content(std::move(text))
{  }

std::optional<source_index> source_index::from_file(std::string_view path)
{
  std::ifstream file(std::string(path), std::ios::in | std::ios::binary);
  if(!file)
    return std::nullopt;

  auto src = from_stream(std::string(path), file);
  if(file.bad())
    return std::nullopt;
  return src;
}

source_index source_index::from_stream(std::string module, std::istream& is)
{
  std::stringstream ss;
  ss << is.rdbuf();

  return source_index(std::move(module), ss.str());
}

std::optional<std::string_view> source_index::get_span(span s) const
{
  if(static_cast<std::size_t>(s.offset) + s.length > content.size())
    return std::nullopt;

  return std::string_view(content).substr(s.offset, s.length);
}

std::optional<line_info> source_index::get_span_line(span s) const
{
  if(s.offset > content.size())
    return std::nullopt;

  std::string_view text = content;

  const auto before = text.substr(0, s.offset);
  const auto nl = before.rfind('\n');
  const std::size_t line_beg = (nl == std::string_view::npos ? 0 : nl + 1);

  std::size_t line_end = text.find('\n', s.offset);
  if(line_end == std::string_view::npos)
    line_end = text.size();

  auto line = text.substr(line_beg, line_end - line_beg);
  if(!line.empty() && line.back() == '\r')
    line.remove_suffix(1);

  const std::size_t line_number = 1 + static_cast<std::size_t>(std::count(before.begin(), before.end(), '\n'));

  const std::size_t column = 1 + display_width(text.substr(line_beg, s.offset - line_beg));

  return line_info { line, line_number, column };
}

std::size_t display_width(std::string_view text)
{
  std::size_t width = 0;
  for(auto ch : text)
  {
    const auto c = static_cast<unsigned char>(ch);
    if(c == '\t')
      width += source_index::tab_width;
    else if((c & 0xC0) != 0x80) // UTF-8 continuation bytes share the column of their lead byte
      ++width;
  }
  return width;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());

  for(auto ch : line)
  {
    if(ch == '\t')
      out.append(source_index::tab_width, ' ');
    else
      out.push_back(ch);
  }
  return out;
}

}

