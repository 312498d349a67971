#pragma once

#include <string_view>
#include <optional>
#include <cstdint>
#include <string>

namespace nibasm
{

// Values are the machine encodings, 4 is reserved.
enum class op_code : std::uint8_t
{
  NOP = 0,
  ADD = 1,
  LDI = 2,
  SUB = 3,
  AND = 5,
  OR  = 6,
  INV = 7,
  XOR = 8,
  SR  = 9,
  SL  = 10,
  IN  = 11,
  OUT = 12,
  JZ  = 13,
  JLT = 14,
  J   = 15,
};

enum class reg : std::uint8_t
{
  R0, R1, R2,  R3,  R4,  R5,  R6,  R7,
  R8, R9, R10, R11, R12, R13, R14, R15,
};

constexpr std::uint8_t opcode_to_nibble(op_code opc)
{ return static_cast<std::uint8_t>(opc); }

constexpr std::uint8_t register_to_nibble(reg r)
{ return static_cast<std::uint8_t>(r); }

constexpr std::size_t instruction_memory_size = 64;
constexpr std::size_t instruction_size = 2;
constexpr std::size_t max_instruction_count = instruction_memory_size / instruction_size;

std::string to_lower(std::string_view text);

// case-insensitive
std::optional<op_code> lookup_opcode(std::string_view mnemonic);
std::optional<reg> lookup_register(std::string_view name);

std::string_view mnemonic_of(op_code opc);
std::string register_name(reg r);

}

