#pragma once

#include <operand_rules.hpp>
#include <source_index.hpp>
#include <program.hpp>
#include <token.hpp>

#include <optional>
#include <variant>
#include <cstdio>
#include <vector>
#include <string>

namespace nibasm
{

class base_reader
{
protected:
  explicit base_reader(const source_index& src);

  // EOF at the end of input
  int peekc() const;
  int getc();
protected:
  const source_index& src;

  std::size_t pos { 0 };
};

/// TOKENIZER

class tokenizer : base_reader
{
public:
  // never fails, malformed input becomes InvalidToken/InvalidInteger tokens
  static std::vector<token> read(const source_index& src);
private:
  explicit tokenizer(const source_index& src) : base_reader(src)
  {  }

  std::optional<token> gett();

  token lex_comment();
  token lex_integer();
  token lex_identifier();
  token lex_multibyte();
  token single_char(token_kind kind);
};

struct lex_error
{
  token tok;
};

// drops comments, the first invalid token is an error
std::variant<std::vector<token>, lex_error> filter_tokens(const std::vector<token>& tokens);

/// PARSER

enum class parse_error_kind : std::uint8_t
{
  UnexpectedToken,
  MissingToken,
  InvalidInstruction,
  ExpectedInstructionBeforeLabel,
  DuplicateLabel,
  ExpectedInstruction,
  ExpectedNoOperands,
  ExpectedOperandFoundEOF,
  ExpectedOperand,
  ExpectedRegister,
  IntegerOutOfRange,
};

std::string_view parse_error_kind_to_str(parse_error_kind kind);

struct parse_error
{
  parse_error_kind kind;

  // absent only for MissingToken
  std::optional<token> tok;

  // UnexpectedToken and MissingToken
  token_kind expected_token { token_kind::Newline };
  // ExpectedOperand
  std::string expected_operands;
};

class asm_reader
{
public:
  static std::variant<program, parse_error> read(const std::vector<token>& tokens, const source_index& src);
private:
  asm_reader(const std::vector<token>& tokens, const source_index& src)
    : tokens(tokens), src(src)
  {  }

  const token* peek() const;
  const token* next();
  bool is_peek(token_kind kind) const;

  std::string_view text_of(const token& tok) const;

  // "hard error"   -> end of input is an error
  std::optional<parse_error> expect(token_kind kind);
  // "soft error"   -> end of input is fine
  std::optional<parse_error> expect_or_eof(token_kind kind);
private:
  std::optional<parse_error> parse_line();
  std::optional<parse_error> parse_labeldef(const token& tok);
  std::variant<instruction, parse_error> parse_op();
  std::variant<operand, parse_error> parse_operand(const token& instruction_tok, const operand_set& rule);

private:
  const std::vector<token>& tokens;
  const source_index& src;
  std::size_t cur { 0 };

  program prog;

  // a label was defined and no instruction followed yet
  bool just_saw_label { false };
};

}

