#pragma once

#include <source_index.hpp>
#include <program.hpp>
#include <config.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <variant>
#include <cstdint>
#include <cstdio>
#include <string>
#include <array>

namespace nibasm
{
  using image = std::array<std::uint8_t, instruction_memory_size>;

  using parse_result = std::variant<program, nlohmann::json>;
  using assembly_result = std::variant<image, nlohmann::json>;

  // lexing, filtering and parsing; the json alternative is the diagnostic
  parse_result parse(const source_index& src);

  // the full pipeline, unused bytes of the image are zero
  assembly_result assemble(const source_index& src);

  std::string hex_dump(const image& img);

  std::string derive_output_path(std::string_view input);

  // quotes and control characters of token text as C-style escapes
  std::string escape(std::string_view text);
}

/// Drives one invocation according to `config`.
struct compiler
{
  // dumps of tokens, items and hex go to `out`
  explicit compiler(std::FILE* out = stdout)
    : out(out)
  {  }

  void go();

  // the source of the last run, needed to print diagnostics
  const nibasm::source_index* source() const
  { return src ? &*src : nullptr; }
private:
  bool load();
  void write(const nibasm::image& img);
private:
  std::FILE* out;
  std::optional<nibasm::source_index> src;
};

