#pragma once

#include <opcodes.hpp>

#include <string>
#include <vector>

namespace nibasm
{

enum class operand_kind : std::uint8_t
{
  Register = 1,
  Integer  = 1 << 1,
  Label    = 1 << 2,
};

std::string_view operand_kind_to_str(operand_kind kind);

// set of operand kinds accepted at one operand position
struct operand_set
{
  std::vector<operand_kind> kinds;

  bool accepts(operand_kind kind) const;

  // "register", "integer or label"
  std::string describe() const;
};

using operand_rule = std::vector<operand_set>;

const operand_rule& rules_for(op_code opc);

}

