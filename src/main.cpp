#include <arguments_parser.hpp>
#include <diagnostic.hpp>
#include <compiler.hpp>
#include <config.hpp>

#include <cstdio>

int main(int argc, const char** argv)
{
  arguments::parse(argc, argv, stdout);
  diagnostic.set_format(config.diagnostics_format == diagnostics_formats::json, config.colored, config.verbose);

  // bad arguments or help, nothing to assemble
  if(diagnostic.error_code() != 0 || config.print_help)
  {
    diagnostic.print(stderr, nullptr);
    return diagnostic.error_code();
  }

  compiler comp;
  comp.go();

  diagnostic.print(stderr, comp.source());
  return diagnostic.error_code();
}
