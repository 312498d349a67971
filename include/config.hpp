#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>

enum class emit_classes
{
  undef,
  help,
  bin,
  hex,
  tokens,
  items,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::bin, "bin" },
  { emit_classes::hex, "hex" },
  { emit_classes::tokens, "tokens" },
  { emit_classes::items, "items" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::bin,
  emit_classes::hex,
  emit_classes::tokens,
  emit_classes::items,
};

void print_emit_classes(std::FILE* f);

enum class diagnostics_formats
{
  undef,
  text,
  json,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diagnostics_formats, {
  { diagnostics_formats::undef, "undef" },
  { diagnostics_formats::text, "text" },
  { diagnostics_formats::json, "json" },
})

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::bin };
  diagnostics_formats diagnostics_format { diagnostics_formats::text };

  bool colored { true };
  bool verbose { false };

  std::vector<std::string_view> files;

  // empty means derived from the input file
  std::string output_file;
};

inline config_t config;

