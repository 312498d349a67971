#pragma once

#include <program.hpp>

#include <optional>
#include <variant>
#include <cstdint>
#include <vector>

namespace nibasm
{
  enum class generator_error_kind : std::uint8_t
  {
    SourceOrSinkRangeError,
    DanglingLabelError,
    MaximumInstructionsError,
    UndefinedLabelError,
    JumpDestinationRangeError,
  };

  std::string_view generator_error_kind_to_str(generator_error_kind kind);

  struct generator_error
  {
    generator_error_kind kind;

    // absent only for MaximumInstructionsError
    std::optional<span> loc;
  };

  /// Turns the parsed items into machine code.
  ///
  /// Phase one lays out the program: every label gets the index of the
  /// instruction following it and the instruction count is checked against
  /// the instruction memory. Phase two encodes every instruction into two
  /// bytes, resolving label operands with the values from phase one.
  struct assembler
  {
    // the exact encoded bytes, two per instruction and no padding
    static std::variant<std::vector<std::uint8_t>, generator_error> generate(program& prog);

  private:
    explicit assembler(program& prog);

    std::optional<generator_error> phase_one();
    std::optional<generator_error> phase_two();

    std::optional<generator_error> encode(const single_operand& instr);
    std::optional<generator_error> encode(const double_operand& instr);

    std::variant<std::int8_t, generator_error> resolve(const label_operand& op) const;

    void generate_immediate(op_code opc, reg r, std::uint8_t value);
    void generate_double_register(op_code opc, reg first, reg second);
    bool generate_io(op_code opc, reg r, std::uint8_t source_or_sink);
  private:
    program& prog;
    std::vector<std::uint8_t> bytes;
  };
}

