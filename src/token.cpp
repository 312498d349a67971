#include <token.hpp>

namespace nibasm
{

std::string_view kind_to_str(token_kind kind)
{
  switch(kind)
  {
  case token_kind::Identifier: return "Identifier";
  case token_kind::Label: return "Label";
  case token_kind::Comma: return "Comma";
  case token_kind::Integer: return "Integer";
  case token_kind::Newline: return "Newline";
  case token_kind::Comment: return "Comment";
  case token_kind::InvalidToken: return "InvalidToken";
  case token_kind::InvalidInteger: return "InvalidInteger";
  }
  return "Undefined";
}

}

