#pragma once

#include <source_range.hpp>

#include <string_view>
#include <cstdint>

namespace nibasm
{

enum class token_kind : std::int_fast8_t
{
  Identifier,
  Label,
  Comma,
  Integer,
  Newline,
  Comment,

  InvalidToken,
  InvalidInteger,
};

std::string_view kind_to_str(token_kind kind);

struct token
{
  token_kind kind;
  span loc;
};

inline bool is_error(token_kind kind)
{ return kind == token_kind::InvalidToken || kind == token_kind::InvalidInteger; }

}

