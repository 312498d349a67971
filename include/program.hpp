#pragma once

#include <label_table.hpp>
#include <opcodes.hpp>

#include <variant>
#include <cstdio>
#include <vector>
#include <string>

namespace nibasm
{
  struct register_operand
  {
    reg value;
    span loc;
  };

  struct integer_operand
  {
    std::int8_t value;
    span loc;
  };

  struct label_operand
  {
    label_id value;
    span loc;
  };

  using operand = std::variant<register_operand, integer_operand, label_operand>;

  struct no_operand
  {
    op_code opc;
  };

  struct single_operand
  {
    op_code opc;
    operand op;
  };

  struct double_operand
  {
    op_code opc;
    operand first;
    operand second;
  };

  using instruction = std::variant<no_operand, single_operand, double_operand>;

  op_code opcode_of(const instruction& instr);

  struct label_item
  {
    label_id id;
  };

  using item = std::variant<label_item, instruction>;

  struct program
  {
    std::vector<item> items;
    label_table labels;

    std::size_t instruction_count() const;

    std::string to_string(const operand& op) const;
    std::string to_string(const item& it) const;

    void print(std::FILE* f) const;
  };

}

