#include <program.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace nibasm
{

op_code opcode_of(const instruction& instr)
{
  return std::visit([](const auto& i) { return i.opc; }, instr);
}

std::size_t program::instruction_count() const
{
  return static_cast<std::size_t>(std::count_if(items.begin(), items.end(),
        [](const item& it) { return std::holds_alternative<instruction>(it); }));
}

std::string program::to_string(const operand& op) const
{
  if(auto* r = std::get_if<register_operand>(&op))
    return register_name(r->value);
  if(auto* i = std::get_if<integer_operand>(&op))
    return std::to_string(static_cast<int>(i->value));

  return std::string(labels.name_of(std::get<label_operand>(op).value));
}

std::string program::to_string(const item& it) const
{
  if(auto* lab = std::get_if<label_item>(&it))
    return fmt::format("{}:", labels.name_of(lab->id));

  const auto& instr = std::get<instruction>(it);
  const auto mnemonic = mnemonic_of(opcode_of(instr));

  if(auto* single = std::get_if<single_operand>(&instr))
    return fmt::format("  {} {}", mnemonic, to_string(single->op));
  if(auto* dbl = std::get_if<double_operand>(&instr))
    return fmt::format("  {} {}, {}", mnemonic, to_string(dbl->first), to_string(dbl->second));

  return fmt::format("  {}", mnemonic);
}

void program::print(std::FILE* f) const
{
  for(auto& it : items)
    fmt::print(f, "{}\n", to_string(it));
}

}

