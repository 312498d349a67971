#include <internal_error.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>

namespace mk_diag
{

static nlohmann::json make(diag_level level, const std::optional<nibasm::span>& range,
                           std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  if(range)
    j["span"] = *range;

  j["level"] = level;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json error(const std::optional<nibasm::span>& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{ return make(diag_level::error, range, hrc, message); }

nlohmann::json warn(const std::optional<nibasm::span>& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{ return make(diag_level::warn, range, hrc, message); }

nlohmann::json info(const std::optional<nibasm::span>& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{ return make(diag_level::info, range, hrc, message); }

}

namespace nibasm
{

static std::string_view text_of(const source_index& src, span s)
{
  auto text = src.get_span(s);
  if(!text)
    internal_error("diagnostic span lies outside of its source");
  return *text;
}

// newlines are not printable in a message
static std::string describe(const source_index& src, const token& tok)
{
  if(tok.kind == token_kind::Newline)
    return "end of line";
  return fmt::format("`{}`", text_of(src, tok.loc));
}

nlohmann::json to_diagnostic(const lex_error& err, const source_index& src)
{
  const auto text = text_of(src, err.tok.loc);

  if(err.tok.kind == token_kind::InvalidInteger)
    return diagnostic_db::lexer::invalid_integer(err.tok.loc, text);
  return diagnostic_db::lexer::invalid_token(err.tok.loc, text);
}

nlohmann::json to_diagnostic(const parse_error& err, const source_index& src)
{
  using namespace diagnostic_db::parser;

  if(err.kind == parse_error_kind::MissingToken)
    return missing_token(std::nullopt, kind_to_str(err.expected_token));

  if(!err.tok)
    internal_error("parse error without a token");
  const token& tok = *err.tok;

  switch(err.kind)
  {
  case parse_error_kind::UnexpectedToken:
    return unexpected_token(tok.loc, kind_to_str(err.expected_token), describe(src, tok));
  case parse_error_kind::InvalidInstruction:
    return invalid_instruction(tok.loc, text_of(src, tok.loc));
  case parse_error_kind::ExpectedInstructionBeforeLabel:
    return expected_instruction_before_label(tok.loc, text_of(src, tok.loc));
  case parse_error_kind::DuplicateLabel:
    return duplicate_label(tok.loc, text_of(src, tok.loc));
  case parse_error_kind::ExpectedInstruction:
    return expected_instruction(tok.loc, describe(src, tok));
  case parse_error_kind::ExpectedNoOperands:
    return expected_no_operands(tok.loc, describe(src, tok));
  case parse_error_kind::ExpectedOperandFoundEOF:
    return expected_operand_found_eof(tok.loc, text_of(src, tok.loc));
  case parse_error_kind::ExpectedOperand:
    return expected_operand(tok.loc, err.expected_operands, describe(src, tok));
  case parse_error_kind::ExpectedRegister:
    return expected_register(tok.loc, describe(src, tok));
  case parse_error_kind::IntegerOutOfRange:
    return integer_out_of_range(tok.loc, text_of(src, tok.loc));
  case parse_error_kind::MissingToken:
    break;
  }
  internal_error("unknown parse error");
}

nlohmann::json to_diagnostic(const generator_error& err, const source_index& src)
{
  using namespace diagnostic_db::generator;

  if(err.kind == generator_error_kind::MaximumInstructionsError)
    return maximum_instructions(std::nullopt, max_instruction_count);

  if(!err.loc)
    internal_error("generator error without a span");
  const span loc = *err.loc;

  switch(err.kind)
  {
  case generator_error_kind::SourceOrSinkRangeError:
    return source_or_sink_range(loc, text_of(src, loc));
  case generator_error_kind::DanglingLabelError:
    return dangling_label(loc, text_of(src, loc));
  case generator_error_kind::UndefinedLabelError:
    return undefined_label(loc, text_of(src, loc));
  case generator_error_kind::JumpDestinationRangeError:
    return jump_destination_range(loc, max_instruction_count - 1, text_of(src, loc));
  case generator_error_kind::MaximumInstructionsError:
    break;
  }
  internal_error("unknown generator error");
}


static std::string paint(bool colored, fmt::text_style style, std::string_view text)
{
  if(!colored)
    return std::string(text);
  return fmt::format(style, "{}", text);
}

std::string render(const nlohmann::json& diag, const source_index* src, bool colored)
{
  const auto level = diag["level"].get<diag_level>();
  const auto message = diag["message"].get<std::string>();

  fmt::text_style level_style = fmt::emphasis::bold | fg(fmt::color::red);
  if(level == diag_level::warn)
    level_style = fmt::emphasis::bold | fg(fmt::color::alice_blue);
  else if(level == diag_level::info)
    level_style = fmt::emphasis::bold | fg(fmt::color::gray);

  std::string out = paint(colored, level_style, nlohmann::json(level).get<std::string>() + ":");
  out += " ";
  out += paint(colored, fmt::emphasis::bold, message);
  out += "\n";

  if(!src || !diag.contains("span"))
    return out;

  const auto s = diag["span"].get<span>();
  const auto info = src->get_span_line(s);
  if(!info)
    return out;

  const auto line_number = std::to_string(info->line_number);
  const std::string padding(line_number.size(), ' ');

  out += fmt::format(" {} {} {}:{}:{}\n", padding, paint(colored, fg(fmt::color::sandy_brown), "-->"),
                     src->module(), info->line_number, info->column);
  out += fmt::format(" {} {} {}\n", paint(colored, fg(fmt::color::sandy_brown), line_number),
                     paint(colored, fg(fmt::color::sandy_brown), "|"), expand_tabs(info->line));

  // caret starts below the first character of the span
  std::string pointer(padding.size() + 3 + info->column, ' ');
  out += pointer;
  out += paint(colored, fmt::emphasis::bold | fg(fmt::color::red), std::string(std::max<std::size_t>(display_width(src->get_span(s).value_or("")), 1), '^'));
  out += "\n";

  return out;
}

nlohmann::json with_location(const nlohmann::json& diag, const source_index* src)
{
  nlohmann::json j = diag;
  if(!src || !diag.contains("span"))
    return j;

  if(auto info = src->get_span_line(diag["span"].get<span>()))
  {
    j["location"] = nlohmann::json{
      { "file", src->module() },
      { "line", info->line_number },
      { "column", info->column },
    };
  }
  return j;
}

}

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  data.push_back(msg);

  return *this;
}

void diagnostics_manager::print(std::FILE* file, const nibasm::source_index* src)
{
  for(auto& v : data)
  {
    if(v["level"].get<diag_level>() == diag_level::info && !print_info)
      continue;

    if(as_json)
      // invalid UTF-8 from the source must not abort the run
      fmt::print(file, "{}\n", nibasm::with_location(v, src).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    else
      fmt::print(file, "{}", nibasm::render(v, src, use_color));
  }
  data.clear();
}

int diagnostics_manager::error_code() const
{
  return err;
}

