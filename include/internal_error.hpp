#pragma once

#include <string_view>

namespace nibasm
{

// The parser and the operand rules guarantee shapes the assembler relies on.
// Breaking that contract is a bug in nibasm, not in the user's program.
[[noreturn]] void internal_error(std::string_view what);

}

