#include <internal_error.hpp>
#include <assembler.hpp>

namespace nibasm
{

std::string_view generator_error_kind_to_str(generator_error_kind kind)
{
  switch(kind)
  {
  case generator_error_kind::SourceOrSinkRangeError: return "SourceOrSinkRangeError";
  case generator_error_kind::DanglingLabelError: return "DanglingLabelError";
  case generator_error_kind::MaximumInstructionsError: return "MaximumInstructionsError";
  case generator_error_kind::UndefinedLabelError: return "UndefinedLabelError";
  case generator_error_kind::JumpDestinationRangeError: return "JumpDestinationRangeError";
  }
  return "Undefined";
}

assembler::assembler(program& prog)
  : prog(prog)
{  }

std::variant<std::vector<std::uint8_t>, generator_error> assembler::generate(program& prog)
{
  assembler assm(prog);

  if(auto err = assm.phase_one())
    return *err;
  if(auto err = assm.phase_two())
    return *err;

  return std::move(assm.bytes);
}


std::optional<generator_error> assembler::phase_one()
{
  std::size_t pos = 0ULL;
  std::optional<label_id> ended_on_label;

  for(auto& it : prog.items)
  {
    if(auto* lab = std::get_if<label_item>(&it))
    {
      ended_on_label = lab->id;
      prog.labels.set_value_of(lab->id, static_cast<std::int8_t>(pos));
    }
    else
    {
      ended_on_label = std::nullopt;

      if(++pos > max_instruction_count)
        return generator_error { generator_error_kind::MaximumInstructionsError, std::nullopt };
    }
  }

  // a label at the end binds to nothing
  if(ended_on_label)
    return generator_error { generator_error_kind::DanglingLabelError, prog.labels.get_span_of(*ended_on_label) };

  return std::nullopt;
}

std::optional<generator_error> assembler::phase_two()
{
  bytes.reserve(prog.instruction_count() * instruction_size);

  for(auto& it : prog.items)
  {
    auto* instr = std::get_if<instruction>(&it);
    if(!instr)
      continue;

    if(auto* none = std::get_if<no_operand>(instr))
    {
      if(none->opc != op_code::NOP)
        internal_error("instruction without operands other than nop");

      generate_immediate(none->opc, reg::R0, 0);
    }
    else if(auto* single = std::get_if<single_operand>(instr))
    {
      if(auto err = encode(*single))
        return err;
    }
    else if(auto err = encode(std::get<double_operand>(*instr)))
      return err;
  }
  return std::nullopt;
}

std::optional<generator_error> assembler::encode(const single_operand& instr)
{
  switch(instr.opc)
  {
  case op_code::INV:
    {
      auto* r = std::get_if<register_operand>(&instr.op);
      if(!r)
        internal_error("inv expects a register");

      // data field is ignored by the machine
      generate_immediate(instr.opc, r->value, 0);
    } break;

  case op_code::J:
    {
      std::int8_t target = 0;
      if(auto* imm = std::get_if<integer_operand>(&instr.op))
        target = imm->value;
      else if(auto* lab = std::get_if<label_operand>(&instr.op))
      {
        auto value = resolve(*lab);
        if(auto* err = std::get_if<generator_error>(&value))
          return *err;
        target = std::get<std::int8_t>(value);
      }
      else
        internal_error("j expects an integer or a label");

      // register field is never looked at
      generate_immediate(instr.opc, reg::R0, static_cast<std::uint8_t>(target));
    } break;

  default:
    internal_error("unexpected single operand instruction");
  }
  return std::nullopt;
}

std::optional<generator_error> assembler::encode(const double_operand& instr)
{
  auto* r = std::get_if<register_operand>(&instr.first);
  if(!r)
    internal_error("first operand of a two operand instruction must be a register");

  switch(instr.opc)
  {
  case op_code::ADD:
  case op_code::SUB:
  case op_code::AND:
  case op_code::OR:
  case op_code::XOR:
  case op_code::SR:
  case op_code::SL:
    {
      auto* second = std::get_if<register_operand>(&instr.second);
      if(!second)
        internal_error("register-register instruction without second register");

      generate_double_register(instr.opc, r->value, second->value);
    } break;

  case op_code::JZ:
  case op_code::JLT:
    {
      std::int8_t target = 0;
      if(auto* lab = std::get_if<label_operand>(&instr.second))
      {
        auto value = resolve(*lab);
        if(auto* err = std::get_if<generator_error>(&value))
          return *err;
        target = std::get<std::int8_t>(value);
      }
      else if(auto* imm = std::get_if<integer_operand>(&instr.second))
      {
        if(imm->value >= static_cast<std::int8_t>(max_instruction_count))
          return generator_error { generator_error_kind::JumpDestinationRangeError, imm->loc };
        target = imm->value;
      }
      else
        internal_error("conditional jump expects an integer or a label");

      generate_immediate(instr.opc, r->value, static_cast<std::uint8_t>(target));
    } break;

  case op_code::LDI:
    {
      auto* imm = std::get_if<integer_operand>(&instr.second);
      if(!imm)
        internal_error("ldi expects an integer");

      generate_immediate(instr.opc, r->value, static_cast<std::uint8_t>(imm->value));
    } break;

  case op_code::IN:
  case op_code::OUT:
    {
      auto* imm = std::get_if<integer_operand>(&instr.second);
      if(!imm)
        internal_error("in/out expect an integer");

      if(!generate_io(instr.opc, r->value, static_cast<std::uint8_t>(imm->value)))
        return generator_error { generator_error_kind::SourceOrSinkRangeError, imm->loc };
    } break;

  default:
    internal_error("unexpected two operand instruction");
  }
  return std::nullopt;
}

std::variant<std::int8_t, generator_error> assembler::resolve(const label_operand& op) const
{
  if(auto value = prog.labels.get_value_of(op.value))
    return *value;
  return generator_error { generator_error_kind::UndefinedLabelError, op.loc };
}


void assembler::generate_immediate(op_code opc, reg r, std::uint8_t value)
{
  bytes.push_back(static_cast<std::uint8_t>((opcode_to_nibble(opc) << 4) | register_to_nibble(r)));
  bytes.push_back(value);
}

void assembler::generate_double_register(op_code opc, reg first, reg second)
{
  bytes.push_back(static_cast<std::uint8_t>((opcode_to_nibble(opc) << 4) | register_to_nibble(first)));
  bytes.push_back(static_cast<std::uint8_t>(register_to_nibble(second) << 4));
}

bool assembler::generate_io(op_code opc, reg r, std::uint8_t source_or_sink)
{
  if(source_or_sink > 0b1111)
    return false;

  generate_immediate(opc, r, static_cast<std::uint8_t>(source_or_sink << 4));
  return true;
}

}

