#include <internal_error.hpp>
#include <reader.hpp>

#include <charconv>

namespace nibasm
{

std::string_view parse_error_kind_to_str(parse_error_kind kind)
{
  switch(kind)
  {
  case parse_error_kind::UnexpectedToken: return "UnexpectedToken";
  case parse_error_kind::MissingToken: return "MissingToken";
  case parse_error_kind::InvalidInstruction: return "InvalidInstruction";
  case parse_error_kind::ExpectedInstructionBeforeLabel: return "ExpectedInstructionBeforeLabel";
  case parse_error_kind::DuplicateLabel: return "DuplicateLabel";
  case parse_error_kind::ExpectedInstruction: return "ExpectedInstruction";
  case parse_error_kind::ExpectedNoOperands: return "ExpectedNoOperands";
  case parse_error_kind::ExpectedOperandFoundEOF: return "ExpectedOperandFoundEOF";
  case parse_error_kind::ExpectedOperand: return "ExpectedOperand";
  case parse_error_kind::ExpectedRegister: return "ExpectedRegister";
  case parse_error_kind::IntegerOutOfRange: return "IntegerOutOfRange";
  }
  return "Undefined";
}

static parse_error mk_error(parse_error_kind kind, const token& tok)
{
  return parse_error { kind, tok, token_kind::Newline, {} };
}

const token* asm_reader::peek() const
{
  return cur < tokens.size() ? &tokens[cur] : nullptr;
}

const token* asm_reader::next()
{
  if(cur >= tokens.size())
    return nullptr;
  return &tokens[cur++];
}

bool asm_reader::is_peek(token_kind kind) const
{
  auto* tok = peek();
  return tok && tok->kind == kind;
}

std::string_view asm_reader::text_of(const token& tok) const
{
  auto text = src.get_span(tok.loc);
  if(!text)
    internal_error("token span lies outside of its source");
  return *text;
}

std::optional<parse_error> asm_reader::expect(token_kind kind)
{
  auto* tok = next();
  if(!tok)
    return parse_error { parse_error_kind::MissingToken, std::nullopt, kind, {} };

  if(tok->kind != kind)
    return parse_error { parse_error_kind::UnexpectedToken, *tok, kind, {} };
  return std::nullopt;
}

std::optional<parse_error> asm_reader::expect_or_eof(token_kind kind)
{
  if(!peek())
    return std::nullopt;
  return expect(kind);
}


std::variant<program, parse_error> asm_reader::read(const std::vector<token>& tokens, const source_index& src)
{
  asm_reader r(tokens, src);

  while(r.peek())
  {
    if(auto err = r.parse_line())
      return *err;
  }
  return std::move(r.prog);
}

std::optional<parse_error> asm_reader::parse_line()
{
  const token tok = *peek();

  // blank line
  if(tok.kind == token_kind::Newline)
  {
    next();
    return std::nullopt;
  }

  bool should_parse_instruction = true;
  if(tok.kind == token_kind::Label)
  {
    if(just_saw_label)
      return mk_error(parse_error_kind::ExpectedInstructionBeforeLabel, tok);
    just_saw_label = true;

    if(auto err = parse_labeldef(tok))
      return err;
    next();

    // a label may stand on its own line
    should_parse_instruction = peek() && !is_peek(token_kind::Newline);
  }

  if(should_parse_instruction)
  {
    auto instr = parse_op();
    if(auto* err = std::get_if<parse_error>(&instr))
      return *err;

    prog.items.emplace_back(std::get<instruction>(instr));
    just_saw_label = false;
  }

  return expect_or_eof(token_kind::Newline);
}

std::optional<parse_error> asm_reader::parse_labeldef(const token& tok)
{
  auto name = text_of(tok);
  name.remove_suffix(1); // ':'

  auto& labels = prog.labels;
  if(auto id = labels.get_id_of(name))
  {
    if(labels.get_span_of(*id))
      return mk_error(parse_error_kind::DuplicateLabel, tok);

    // it was referenced before, now it is defined
    labels.set_span_of(*id, tok.loc);
    prog.items.emplace_back(label_item { *id });
    return std::nullopt;
  }

  auto id = labels.insert_unique(name, tok.loc);
  if(!id)
    return mk_error(parse_error_kind::DuplicateLabel, tok);

  prog.items.emplace_back(label_item { *id });
  return std::nullopt;
}

std::variant<instruction, parse_error> asm_reader::parse_op()
{
  auto* tokp = next();
  if(!tokp)
    internal_error("attempted to parse an instruction from an empty token stream");

  const token tok = *tokp;
  if(tok.kind != token_kind::Identifier)
    return mk_error(parse_error_kind::ExpectedInstruction, tok);

  const auto opc = lookup_opcode(text_of(tok));
  if(!opc)
    return mk_error(parse_error_kind::InvalidInstruction, tok);

  const auto& rules = rules_for(*opc);
  switch(rules.size())
  {
  case 0:
    {
      if(!peek() || is_peek(token_kind::Newline))
        return instruction(no_operand { *opc });
      return mk_error(parse_error_kind::ExpectedNoOperands, *next());
    }

  case 1:
    {
      auto op = parse_operand(tok, rules[0]);
      if(auto* err = std::get_if<parse_error>(&op))
        return *err;

      return instruction(single_operand { *opc, std::get<operand>(op) });
    }

  case 2:
    {
      auto first = parse_operand(tok, rules[0]);
      if(auto* err = std::get_if<parse_error>(&first))
        return *err;

      if(auto err = expect(token_kind::Comma))
        return *err;

      auto second = parse_operand(tok, rules[1]);
      if(auto* err = std::get_if<parse_error>(&second))
        return *err;

      return instruction(double_operand { *opc, std::get<operand>(first), std::get<operand>(second) });
    }

  default:
    internal_error("instructions with more than 2 operands are not supported");
  }
}

std::variant<operand, parse_error> asm_reader::parse_operand(const token& instruction_tok, const operand_set& rule)
{
  auto* tokp = next();
  if(!tokp)
    return mk_error(parse_error_kind::ExpectedOperandFoundEOF, instruction_tok);

  const token tok = *tokp;
  const bool wants_identifier = rule.accepts(operand_kind::Register) || rule.accepts(operand_kind::Label);

  if(tok.kind == token_kind::Identifier && wants_identifier)
  {
    const auto text = text_of(tok);

    if(rule.accepts(operand_kind::Register))
    {
      if(auto r = lookup_register(text))
        return operand(register_operand { *r, tok.loc });
    }

    // can't check a label until every line has been seen
    if(rule.accepts(operand_kind::Label))
      return operand(label_operand { prog.labels.get_or_insert_reference(text), tok.loc });

    return mk_error(parse_error_kind::ExpectedRegister, tok);
  }

  if(tok.kind == token_kind::Integer && rule.accepts(operand_kind::Integer))
  {
    const auto text = text_of(tok);

    std::int8_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if(ec != std::errc() || ptr != text.data() + text.size())
      return mk_error(parse_error_kind::IntegerOutOfRange, tok);

    return operand(integer_operand { value, tok.loc });
  }

  auto err = mk_error(parse_error_kind::ExpectedOperand, tok);
  err.expected_operands = rule.describe();
  return err;
}

}

