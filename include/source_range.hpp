#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>

namespace nibasm
{

struct span
{
  std::uint32_t offset { 0 };
  std::uint32_t length { 0 };

  span() = default;

  span(std::uint32_t offset, std::uint32_t length)
    : offset(offset), length(length)
  {  }

  std::uint32_t end() const
  { return offset + length; }

  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const span& s);
};

inline bool operator==(const span& lhs, const span& rhs)
{ return lhs.offset == rhs.offset && lhs.length == rhs.length; }

inline bool operator!=(const span& lhs, const span& rhs)
{ return !(lhs == rhs); }

void to_json(nlohmann::json& j, const span& s);
void from_json(const nlohmann::json& j, span& s);

}

