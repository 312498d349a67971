#include <reader.hpp>

#include <cctype>

namespace nibasm
{

constexpr static bool is_digit(int c)
{ return '0' <= c && c <= '9'; }

static bool is_alpha(int c)
{ return c != EOF && std::isalpha(static_cast<unsigned char>(c)); }

static bool is_identifier_char(int c)
{ return is_alpha(c) || is_digit(c) || c == '_' || c == '-'; }

// 10xxxxxx
constexpr static bool is_utf8_continuation(int c)
{ return c != EOF && (c & 0xC0) == 0x80; }

base_reader::base_reader(const source_index& src)
  : src(src)
{  }

int base_reader::peekc() const
{
  if(pos >= src.size())
    return EOF;
  return static_cast<unsigned char>(src.text()[pos]);
}

int base_reader::getc()
{
  const int ch = peekc();
  if(ch != EOF)
    ++pos;
  return ch;
}


///// Tokenization

std::vector<token> tokenizer::read(const source_index& src)
{
  tokenizer t(src);

  std::vector<token> toks;
  while(auto tok = t.gett())
    toks.push_back(*tok);

  return toks;
}

std::optional<token> tokenizer::gett()
{
  int ch = peekc();
  while(ch == ' ' || ch == '\t' || ch == '\r')
  {
    ++pos;
    ch = peekc();
  }

  switch(ch)
  {
  case EOF:
    return std::nullopt;

  case '\n': return single_char(token_kind::Newline);
  case ',':  return single_char(token_kind::Comma);
  case ';':  return lex_comment();

  default:
    if(is_digit(ch))
      return lex_integer();
    if(is_alpha(ch))
      return lex_identifier();
    if(ch >= 0x80)
      return lex_multibyte();

    return single_char(token_kind::InvalidToken);
  }
}

token tokenizer::lex_comment()
{
  const std::size_t beg = pos;

  getc(); // ;
  while(peekc() != EOF && peekc() != '\n')
    getc();

  return token { token_kind::Comment, span(beg, pos - beg) };
}

token tokenizer::lex_integer()
{
  const std::size_t beg = pos;
  bool valid = true;

  getc();
  for(int ch = peekc(); is_digit(ch) || is_alpha(ch); ch = peekc())
  {
    // 12ab is not a number, keep it in one piece for the diagnostic
    if(!is_digit(ch))
      valid = false;
    getc();
  }

  return token { valid ? token_kind::Integer : token_kind::InvalidInteger, span(beg, pos - beg) };
}

token tokenizer::lex_identifier()
{
  const std::size_t beg = pos;
  token_kind kind = token_kind::Identifier;

  getc();
  while(is_identifier_char(peekc()))
    getc();

  if(peekc() == ':')
  {
    getc();
    kind = token_kind::Label;
  }
  return token { kind, span(beg, pos - beg) };
}

// never split a UTF-8 sequence, diagnostics quote the whole character
token tokenizer::lex_multibyte()
{
  const std::size_t beg = pos;

  getc();
  while(is_utf8_continuation(peekc()))
    getc();

  return token { token_kind::InvalidToken, span(beg, pos - beg) };
}

token tokenizer::single_char(token_kind kind)
{
  const std::size_t beg = pos;
  getc();

  return token { kind, span(beg, 1) };
}


std::variant<std::vector<token>, lex_error> filter_tokens(const std::vector<token>& tokens)
{
  std::vector<token> valid;
  valid.reserve(tokens.size());

  for(auto& tok : tokens)
  {
    if(is_error(tok.kind))
      return lex_error { tok };

    if(tok.kind != token_kind::Comment)
      valid.push_back(tok);
  }
  return valid;
}

}

