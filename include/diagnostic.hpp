#pragma once

#include <source_index.hpp>
#include <assembler.hpp>
#include <reader.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <cstdio>
#include <vector>

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warning" },
})

namespace mk_diag
{
nlohmann::json error(const std::optional<nibasm::span>& range,
                     std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json warn(const std::optional<nibasm::span>& range,
                    std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json info(const std::optional<nibasm::span>& range,
                    std::uint_fast16_t hrc, const std::string_view& message);
}

namespace nibasm
{

// exactly one diagnostic per error, labels are taken from diagnostic_db
nlohmann::json to_diagnostic(const lex_error& err, const source_index& src);
nlohmann::json to_diagnostic(const parse_error& err, const source_index& src);
nlohmann::json to_diagnostic(const generator_error& err, const source_index& src);

// `<level>: <message>`, followed by locator, source line and caret underline
// if the diagnostic has a span
std::string render(const nlohmann::json& diag, const source_index* src, bool colored);

// adds the resolved location to the diagnostic
nlohmann::json with_location(const nlohmann::json& diag, const source_index* src);

}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return data.empty(); }
  const std::vector<nlohmann::json>& messages() const { return data; }

  void print(std::FILE* file, const nibasm::source_index* src);
  int error_code() const;

  void set_format(bool json, bool colored, bool verbose)
  { as_json = json; use_color = colored; print_info = verbose; }

  inline void reset() { err = 0; data.clear(); }
private:
  std::vector<nlohmann::json> data;

  int err { 0 };

  bool as_json { false };
  bool use_color { true };
  bool print_info { false };
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

