#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace diagnostic_db
{

#define db_entry_arg(lv, name, txt) static const auto name = [](const std::optional<nibasm::span>& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, txt) static const auto name = [](const std::optional<nibasm::span>& range, auto t1, auto t2) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace args
{

db_entry_arg(error, unknown_arg, "Unknown command line argument \"{}\".");
db_entry_arg(error, emit_not_present, "Selected emit class \"{}\" is unknown!");
db_entry_arg(error, diagnostics_format_not_present, "Diagnostics format \"{}\" is unknown, expected \"text\" or \"json\".");
db_entry_arg(error, too_many_inputs, "Exactly one source file is assembled per invocation, got {}.");

}

namespace io
{

db_entry_arg(error, cannot_open_file, "Cannot read source file \"{}\".");
db_entry_arg(error, cannot_write_output, "Cannot write output file \"{}\".");
db_entry_arg2(info, wrote_image, "Wrote {}-byte instruction image to \"{}\".");

}

namespace lexer
{

db_entry_arg(error, invalid_token, "Invalid token found `{}`");
db_entry_arg(error, invalid_integer, "Invalid integer value `{}`");

}

namespace parser
{

db_entry_arg2(error, unexpected_token, "Expected `{}`, found {}");
db_entry_arg(error, missing_token, "Expected `{}`, found the end of file");
db_entry_arg(error, invalid_instruction, "`{}` is not a valid instruction");
db_entry_arg(error, expected_instruction_before_label, "Expected instruction after label, found second label `{}`");
db_entry_arg(error, duplicate_label, "Duplicate label `{}`");
db_entry_arg(error, expected_instruction, "Expected an instruction, found {}");
db_entry_arg(error, expected_no_operands, "Instruction takes no operands, found {}");
db_entry_arg(error, expected_operand_found_eof, "Expected instruction operand for `{}`, found end of file");
db_entry_arg2(error, expected_operand, "Expected instruction operand (one of {}), found {}");
db_entry_arg(error, expected_register, "Expected register for instruction operand, found {}");
db_entry_arg(error, integer_out_of_range, "Value `{}` is out of range for an 8-bit signed integer value");

}

namespace generator
{

db_entry_arg(error, dangling_label, "Dangling label `{}`");
db_entry_arg(error, source_or_sink_range, "Source or sink must be in the range of 0-15, found `{}`");
db_entry_arg2(error, jump_destination_range, "Jump destination must be in the range of 0-{}, found `{}`");
db_entry_arg(error, maximum_instructions, "Maximum number of instructions reached ({})");
db_entry_arg(error, undefined_label, "Label `{}` is undefined");

}

#undef db_entry_arg
#undef db_entry_arg2

}

