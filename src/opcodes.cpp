#include <opcodes.hpp>

#include <tsl/robin_map.h>

#include <algorithm>
#include <cctype>

using namespace std::literals::string_view_literals;

namespace nibasm
{

static const auto keyword_map = tsl::robin_map<std::string_view, op_code>({
  { "nop"sv, op_code::NOP },
  { "add"sv, op_code::ADD },
  { "ldi"sv, op_code::LDI },
  { "sub"sv, op_code::SUB },
  { "and"sv, op_code::AND },
  { "or"sv,  op_code::OR },
  { "inv"sv, op_code::INV },
  { "xor"sv, op_code::XOR },
  { "sr"sv,  op_code::SR },
  { "sl"sv,  op_code::SL },
  { "in"sv,  op_code::IN },
  { "out"sv, op_code::OUT },
  { "jz"sv,  op_code::JZ },
  { "jlt"sv, op_code::JLT },
  { "j"sv,   op_code::J },
});

static const auto register_map = tsl::robin_map<std::string_view, reg>({
  { "r0"sv,  reg::R0 },  { "r1"sv,  reg::R1 },  { "r2"sv,  reg::R2 },  { "r3"sv,  reg::R3 },
  { "r4"sv,  reg::R4 },  { "r5"sv,  reg::R5 },  { "r6"sv,  reg::R6 },  { "r7"sv,  reg::R7 },
  { "r8"sv,  reg::R8 },  { "r9"sv,  reg::R9 },  { "r10"sv, reg::R10 }, { "r11"sv, reg::R11 },
  { "r12"sv, reg::R12 }, { "r13"sv, reg::R13 }, { "r14"sv, reg::R14 }, { "r15"sv, reg::R15 },
});

std::string to_lower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<op_code> lookup_opcode(std::string_view mnemonic)
{
  const auto lowered = to_lower(mnemonic);

  if(auto it = keyword_map.find(std::string_view(lowered)); it != keyword_map.end())
    return it->second;
  return std::nullopt;
}

std::optional<reg> lookup_register(std::string_view name)
{
  const auto lowered = to_lower(name);

  if(auto it = register_map.find(std::string_view(lowered)); it != register_map.end())
    return it->second;
  return std::nullopt;
}

std::string_view mnemonic_of(op_code opc)
{
  for(const auto& [name, code] : keyword_map)
  {
    if(code == opc)
      return name;
  }
  return "???";
}

std::string register_name(reg r)
{
  return "r" + std::to_string(register_to_nibble(r));
}

}

