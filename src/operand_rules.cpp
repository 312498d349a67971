#include <operand_rules.hpp>

#include <tsl/robin_map.h>

#include <algorithm>

namespace nibasm
{

namespace
{

const operand_set reg_only { { operand_kind::Register } };
const operand_set int_only { { operand_kind::Integer } };
const operand_set int_or_label { { operand_kind::Integer, operand_kind::Label } };

const auto operand_rules = tsl::robin_map<op_code, operand_rule>({
  { op_code::NOP, {} },
  { op_code::ADD, { reg_only, reg_only } },
  { op_code::LDI, { reg_only, int_only } },
  { op_code::SUB, { reg_only, reg_only } },
  { op_code::AND, { reg_only, reg_only } },
  { op_code::OR,  { reg_only, reg_only } },
  { op_code::INV, { reg_only } },
  { op_code::XOR, { reg_only, reg_only } },
  { op_code::SR,  { reg_only, reg_only } },
  { op_code::SL,  { reg_only, reg_only } },
  { op_code::IN,  { reg_only, int_only } },
  { op_code::OUT, { reg_only, int_only } },
  { op_code::JZ,  { reg_only, int_or_label } },
  { op_code::JLT, { reg_only, int_or_label } },
  { op_code::J,   { int_or_label } },
});

}

std::string_view operand_kind_to_str(operand_kind kind)
{
  switch(kind)
  {
  case operand_kind::Register: return "register";
  case operand_kind::Integer: return "integer";
  case operand_kind::Label: return "label";
  }
  return "undefined";
}

bool operand_set::accepts(operand_kind kind) const
{
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

std::string operand_set::describe() const
{
  std::string out;
  for(std::size_t i = 0; i < kinds.size(); ++i)
  {
    if(i != 0)
      out += (i + 1 == kinds.size() ? " or " : ", ");
    out += operand_kind_to_str(kinds[i]);
  }
  return out;
}

const operand_rule& rules_for(op_code opc)
{
  return operand_rules.at(opc);
}

}

