#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <source_index.hpp>
#include <label_table.hpp>
#include <reader.hpp>

using namespace nibasm;

static std::vector<token> lex(const source_index& src)
{
  return tokenizer::read(src);
}

static std::variant<program, parse_error> read(const source_index& src)
{
  auto filtered = filter_tokens(tokenizer::read(src));
  REQUIRE(std::holds_alternative<std::vector<token>>(filtered));

  return asm_reader::read(std::get<std::vector<token>>(filtered), src);
}

static parse_error read_error(const source_index& src)
{
  auto r = read(src);
  REQUIRE(std::holds_alternative<parse_error>(r));
  return std::get<parse_error>(r);
}

TEST_CASE( "Tokens are classified correctly", "[Tokenizer]" ) {

  SECTION( "instruction-with-operands" ) {
    source_index src("test.s", "add r1, r2");
    auto toks = lex(src);

    REQUIRE(toks.size() == 4);
    REQUIRE(toks[0].kind == token_kind::Identifier);
    REQUIRE(toks[0].loc == span(0, 3));
    REQUIRE(toks[1].kind == token_kind::Identifier);
    REQUIRE(toks[1].loc == span(4, 2));
    REQUIRE(toks[2].kind == token_kind::Comma);
    REQUIRE(toks[2].loc == span(6, 1));
    REQUIRE(toks[3].kind == token_kind::Identifier);
    REQUIRE(toks[3].loc == span(8, 2));
  }

  SECTION( "label-comment-newline" ) {
    source_index src("test.s", "loop: nop ; c\n");
    auto toks = lex(src);

    REQUIRE(toks.size() == 4);
    REQUIRE(toks[0].kind == token_kind::Label);
    REQUIRE(toks[0].loc == span(0, 5)); // colon is part of the label
    REQUIRE(toks[1].kind == token_kind::Identifier);
    REQUIRE(toks[2].kind == token_kind::Comment);
    REQUIRE(toks[2].loc == span(10, 3));
    REQUIRE(toks[3].kind == token_kind::Newline);
    REQUIRE(toks[3].loc == span(13, 1));
  }

  SECTION( "identifiers-with-underscore-and-dash" ) {
    source_index src("test.s", "a_b-c1 x");
    auto toks = lex(src);

    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].kind == token_kind::Identifier);
    REQUIRE(toks[0].loc == span(0, 6));
  }

  SECTION( "malformed-numbers-stay-in-one-piece" ) {
    source_index src("test.s", "12ab 42");
    auto toks = lex(src);

    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].kind == token_kind::InvalidInteger);
    REQUIRE(toks[0].loc == span(0, 4));
    REQUIRE(toks[1].kind == token_kind::Integer);
    REQUIRE(toks[1].loc == span(5, 2));
  }

  SECTION( "whitespace-is-skipped" ) {
    source_index src("test.s", " \t\r nop \r\n");
    auto toks = lex(src);

    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].kind == token_kind::Identifier);
    REQUIRE(toks[0].loc == span(4, 3));
    REQUIRE(toks[1].kind == token_kind::Newline);
  }

  SECTION( "unknown-characters" ) {
    source_index src("test.s", "$ #");
    auto toks = lex(src);

    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].kind == token_kind::InvalidToken);
    REQUIRE(toks[1].kind == token_kind::InvalidToken);
    REQUIRE(toks[1].loc == span(2, 1));
  }

  SECTION( "multibyte-characters-stay-in-one-piece" ) {
    source_index src("test.s", "nop\n\xC3\xA9\n\xE2\x82\xAC\xFF");
    auto toks = lex(src);

    REQUIRE(toks.size() == 6);
    REQUIRE(toks[2].kind == token_kind::InvalidToken);
    REQUIRE(toks[2].loc == span(4, 2));
    REQUIRE(toks[3].kind == token_kind::Newline);
    REQUIRE(toks[4].kind == token_kind::InvalidToken);
    REQUIRE(toks[4].loc == span(7, 3));
    REQUIRE(toks[5].kind == token_kind::InvalidToken);
    REQUIRE(toks[5].loc == span(10, 1));
  }

  SECTION( "empty-input" ) {
    source_index src("test.s", "");
    REQUIRE(lex(src).empty());
  }
}

TEST_CASE( "Token filtering", "[Tokenizer]" ) {

  SECTION( "comments-are-dropped" ) {
    source_index src("test.s", "nop ; hi\n");
    auto filtered = filter_tokens(lex(src));

    REQUIRE(std::holds_alternative<std::vector<token>>(filtered));
    auto& toks = std::get<std::vector<token>>(filtered);
    REQUIRE(toks.size() == 2);
    REQUIRE(toks[0].kind == token_kind::Identifier);
    REQUIRE(toks[1].kind == token_kind::Newline);
  }

  SECTION( "first-invalid-token-is-reported" ) {
    source_index src("test.s", "ldi r0, 12ab\n$");
    auto filtered = filter_tokens(lex(src));

    REQUIRE(std::holds_alternative<lex_error>(filtered));
    auto& err = std::get<lex_error>(filtered);
    REQUIRE(err.tok.kind == token_kind::InvalidInteger);
    REQUIRE(err.tok.loc == span(8, 4));
  }
}

TEST_CASE( "Label table", "[Labels]" ) {
  source_index src("test.s", "loop end");
  const auto loop = src.text().substr(0, 4);
  const auto end = src.text().substr(5, 3);

  label_table labels;

  SECTION( "definitions-are-unique" ) {
    auto id = labels.insert_unique(loop, span(0, 5));
    REQUIRE(id.has_value());
    REQUIRE(*id == 0);
    REQUIRE_FALSE(labels.insert_unique(loop, span(10, 5)).has_value());
    REQUIRE(labels.size() == 1);
  }

  SECTION( "forward-references-get-filled-in" ) {
    auto ref = labels.get_or_insert_reference(end);
    REQUIRE(labels.get_or_insert_reference(end) == ref);
    REQUIRE_FALSE(labels.get_span_of(ref).has_value());
    REQUIRE_FALSE(labels.get_value_of(ref).has_value());

    REQUIRE(labels.set_span_of(ref, span(5, 4)));
    REQUIRE(labels.set_value_of(ref, 3));
    REQUIRE(*labels.get_span_of(ref) == span(5, 4));
    REQUIRE(*labels.get_value_of(ref) == 3);
    REQUIRE(labels.name_of(ref) == "end");
  }

  SECTION( "ids-are-stable" ) {
    auto a = labels.get_or_insert_reference(loop);
    auto b = labels.get_or_insert_reference(end);
    REQUIRE(a != b);
    REQUIRE(labels.get_id_of(loop) == a);
    REQUIRE(labels.get_id_of(end) == b);
    REQUIRE_FALSE(labels.get_id_of("other").has_value());
  }

  SECTION( "unknown-ids" ) {
    REQUIRE_FALSE(labels.set_value_of(7, 1));
    REQUIRE_FALSE(labels.get_span_of(7).has_value());
  }
}

TEST_CASE( "Instructions are parsed correctly", "[Parser]" ) {

  SECTION( "register-register" ) {
    source_index src("test.s", "add r1, r2");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    auto& prog = std::get<program>(r);

    REQUIRE(prog.items.size() == 1);
    auto& instr = std::get<instruction>(prog.items[0]);
    REQUIRE(std::holds_alternative<double_operand>(instr));
    auto& dbl = std::get<double_operand>(instr);
    REQUIRE(dbl.opc == op_code::ADD);
    REQUIRE(std::get<register_operand>(dbl.first).value == reg::R1);
    REQUIRE(std::get<register_operand>(dbl.second).value == reg::R2);
    REQUIRE(std::get<register_operand>(dbl.second).loc == span(8, 2));
  }

  SECTION( "mnemonics-and-registers-ignore-case" ) {
    source_index src("test.s", "JZ R3, 5");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));

    auto& dbl = std::get<double_operand>(std::get<instruction>(std::get<program>(r).items[0]));
    REQUIRE(dbl.opc == op_code::JZ);
    REQUIRE(std::get<register_operand>(dbl.first).value == reg::R3);
    REQUIRE(std::get<integer_operand>(dbl.second).value == 5);
  }

  SECTION( "no-operand" ) {
    source_index src("test.s", "nop\n");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));

    auto& instr = std::get<instruction>(std::get<program>(r).items[0]);
    REQUIRE(std::holds_alternative<no_operand>(instr));
    REQUIRE(opcode_of(instr) == op_code::NOP);
  }

  SECTION( "single-register" ) {
    source_index src("test.s", "inv r15");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));

    auto& single = std::get<single_operand>(std::get<instruction>(std::get<program>(r).items[0]));
    REQUIRE(single.opc == op_code::INV);
    REQUIRE(std::get<register_operand>(single.op).value == reg::R15);
  }

  SECTION( "largest-immediate" ) {
    source_index src("test.s", "ldi r0, 127");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));

    auto& dbl = std::get<double_operand>(std::get<instruction>(std::get<program>(r).items[0]));
    REQUIRE(std::get<integer_operand>(dbl.second).value == 127);
  }

  SECTION( "register-names-are-labels-where-no-register-is-accepted" ) {
    source_index src("test.s", "j r1");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));

    auto& prog = std::get<program>(r);
    auto& single = std::get<single_operand>(std::get<instruction>(prog.items[0]));
    REQUIRE(std::holds_alternative<label_operand>(single.op));
    REQUIRE(prog.labels.name_of(std::get<label_operand>(single.op).value) == "r1");
  }

  SECTION( "blank-lines-and-comments" ) {
    source_index src("test.s", "\n; only a comment\n\nnop ; trailing\n\n");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    REQUIRE(std::get<program>(r).items.size() == 1);
  }
}

TEST_CASE( "Labels are parsed correctly", "[Parser]" ) {

  SECTION( "label-before-instruction" ) {
    source_index src("test.s", "target: nop");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    auto& prog = std::get<program>(r);

    REQUIRE(prog.items.size() == 2);
    REQUIRE(std::get<label_item>(prog.items[0]).id == 0);
    REQUIRE(std::holds_alternative<instruction>(prog.items[1]));
    REQUIRE(*prog.labels.get_span_of(0) == span(0, 7));
    REQUIRE(prog.labels.name_of(0) == "target");
  }

  SECTION( "label-on-its-own-line" ) {
    source_index src("test.s", "loop:\n\nnop");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    auto& prog = std::get<program>(r);

    REQUIRE(prog.items.size() == 2);
    REQUIRE(std::holds_alternative<label_item>(prog.items[0]));
    REQUIRE(std::holds_alternative<instruction>(prog.items[1]));
  }

  SECTION( "forward-reference" ) {
    source_index src("test.s", "j target\ntarget: nop");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    auto& prog = std::get<program>(r);

    REQUIRE(prog.items.size() == 3);
    auto& single = std::get<single_operand>(std::get<instruction>(prog.items[0]));
    auto ref = std::get<label_operand>(single.op);
    REQUIRE(ref.loc == span(2, 6));
    REQUIRE(std::get<label_item>(prog.items[1]).id == ref.value);
    REQUIRE(prog.labels.size() == 1);
    REQUIRE(*prog.labels.get_span_of(ref.value) == span(9, 7));
  }

  SECTION( "labels-are-case-sensitive" ) {
    source_index src("test.s", "Loop: nop\nj loop");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    REQUIRE(std::get<program>(r).labels.size() == 2);
  }

  SECTION( "item-listing" ) {
    source_index src("test.s", "loop: JLT R1, end\nj loop\nend: nop");
    auto r = read(src);
    REQUIRE(std::holds_alternative<program>(r));
    auto& prog = std::get<program>(r);

    REQUIRE(prog.to_string(prog.items[0]) == "loop:");
    REQUIRE(prog.to_string(prog.items[1]) == "  jlt r1, end");
    REQUIRE(prog.to_string(prog.items[2]) == "  j loop");
    REQUIRE(prog.to_string(prog.items[4]) == "  nop");
    REQUIRE(prog.instruction_count() == 3);
  }
}

TEST_CASE( "Parse errors", "[Parser]" ) {

  SECTION( "duplicate-label" ) {
    source_index src("test.s", "a: nop\na: nop");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::DuplicateLabel);
    REQUIRE(err.tok->loc == span(7, 2));
  }

  SECTION( "two-labels-without-instruction" ) {
    source_index src("test.s", "a:\n\nb: nop");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedInstructionBeforeLabel);
    REQUIRE(err.tok->loc == span(4, 2));
  }

  SECTION( "label-after-label-on-one-line" ) {
    source_index src("test.s", "a: b: nop");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedInstruction);
    REQUIRE(err.tok->loc == span(3, 2));
  }

  SECTION( "instruction-clears-the-pending-label" ) {
    source_index src("test.s", "a: nop\nb: nop\nc:\nnop");
    REQUIRE(std::holds_alternative<program>(read(src)));
  }

  SECTION( "invalid-instruction" ) {
    source_index src("test.s", "foo r1");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::InvalidInstruction);
    REQUIRE(err.tok->loc == span(0, 3));
  }

  SECTION( "expected-instruction" ) {
    source_index src("test.s", "5");
    REQUIRE(read_error(src).kind == parse_error_kind::ExpectedInstruction);
  }

  SECTION( "no-operands-expected" ) {
    source_index src("test.s", "nop r1");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedNoOperands);
    REQUIRE(err.tok->loc == span(4, 2));
  }

  SECTION( "missing-comma-at-end-of-file" ) {
    source_index src("test.s", "add r1");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::MissingToken);
    REQUIRE(err.expected_token == token_kind::Comma);
    REQUIRE_FALSE(err.tok.has_value());
  }

  SECTION( "missing-comma" ) {
    source_index src("test.s", "add r1 r2");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::UnexpectedToken);
    REQUIRE(err.expected_token == token_kind::Comma);
    REQUIRE(err.tok->loc == span(7, 2));
  }

  SECTION( "trailing-token" ) {
    source_index src("test.s", "add r1, r2 r3");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::UnexpectedToken);
    REQUIRE(err.expected_token == token_kind::Newline);
    REQUIRE(err.tok->loc == span(11, 2));
  }

  SECTION( "wrong-operand-kind" ) {
    source_index src("test.s", "add r1, 5");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedOperand);
    REQUIRE(err.expected_operands == "register");
  }

  SECTION( "wrong-jump-target-kind" ) {
    source_index src("test.s", "jz r0, ,");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedOperand);
    REQUIRE(err.expected_operands == "integer or label");
    REQUIRE(err.tok->loc == span(7, 1));
  }

  SECTION( "not-a-register" ) {
    source_index src("test.s", "add r1, r16");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedRegister);
    REQUIRE(err.tok->loc == span(8, 3));
  }

  SECTION( "operand-at-end-of-file" ) {
    source_index src("test.s", "nop\ninv");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedOperandFoundEOF);
    REQUIRE(err.tok->loc == span(4, 3));
  }

  SECTION( "operand-at-end-of-line" ) {
    source_index src("test.s", "inv\nnop");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::ExpectedOperand);
    REQUIRE(err.tok->kind == token_kind::Newline);
  }

  SECTION( "integer-out-of-range" ) {
    source_index src("test.s", "ldi r0, 200");
    auto err = read_error(src);
    REQUIRE(err.kind == parse_error_kind::IntegerOutOfRange);
    REQUIRE(err.tok->loc == span(8, 3));

    source_index just_over("test.s", "ldi r0, 128");
    REQUIRE(read_error(just_over).kind == parse_error_kind::IntegerOutOfRange);
  }
}

