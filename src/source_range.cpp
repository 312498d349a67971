#include <source_range.hpp>

namespace nibasm
{

std::string span::to_string() const
{
  return "[" + std::to_string(offset) + ", " + std::to_string(end()) + ")";
}

std::ostream& operator<<(std::ostream& os, const span& s)
{
  return os << s.to_string();
}


void to_json(nlohmann::json& j, const span& s)
{
  j = nlohmann::json{
    { "offset", s.offset },
    { "length", s.length },
  };
}

void from_json(const nlohmann::json& j, span& s)
{
  s = span { j["offset"].get<std::uint32_t>(),
             j["length"].get<std::uint32_t>()
  };
}

}

