#include <internal_error.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <cstdio>

namespace nibasm
{

void internal_error(std::string_view what)
{
  fmt::print(stderr, "Internal Assembler Error: {}\n", what);
  std::fflush(stderr);

  std::abort();
}

}

