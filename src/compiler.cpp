#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <assembler.hpp>
#include <compiler.hpp>
#include <reader.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <functional>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

namespace nibasm
{

parse_result parse(const source_index& src)
{
  auto filtered = filter_tokens(tokenizer::read(src));
  if(auto* err = std::get_if<lex_error>(&filtered))
    return parse_result(std::in_place_index<1>, to_diagnostic(*err, src));

  auto parsed = asm_reader::read(std::get<std::vector<token>>(filtered), src);
  if(auto* err = std::get_if<parse_error>(&parsed))
    return parse_result(std::in_place_index<1>, to_diagnostic(*err, src));

  return parse_result(std::in_place_index<0>, std::move(std::get<program>(parsed)));
}

assembly_result assemble(const source_index& src)
{
  auto parsed = parse(src);
  if(auto* diag = std::get_if<nlohmann::json>(&parsed))
    return assembly_result(std::in_place_index<1>, *diag);

  auto code = assembler::generate(std::get<program>(parsed));
  if(auto* err = std::get_if<generator_error>(&code))
    return assembly_result(std::in_place_index<1>, to_diagnostic(*err, src));

  const auto& bytes = std::get<std::vector<std::uint8_t>>(code);

  image img {};
  std::copy(bytes.begin(), bytes.end(), img.begin());

  return assembly_result(std::in_place_index<0>, img);
}

std::string hex_dump(const image& img)
{
  constexpr std::size_t row_width = 8;

  std::string out;
  for(std::size_t row = 0; row < img.size(); row += row_width)
  {
    out += fmt::format("{:02x}:", row);
    for(std::size_t i = row; i < row + row_width && i < img.size(); ++i)
      out += fmt::format(" {:02x}", img[i]);
    out += "\n";
  }
  return out;
}

std::string escape(std::string_view text)
{
  std::string out;
  for(auto ch : text)
  {
    switch(ch)
    {
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '"':  out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    default:   out.push_back(ch); break;
    }
  }
  return out;
}

std::string derive_output_path(std::string_view input)
{
  if(input == "STDIN")
    return "a.bin";

  fs::path path(input);

  // never overwrite the input
  if(path.extension() == ".bin")
    return path.string() + ".bin";
  return path.replace_extension(".bin").string();
}

}

static const std::map<emit_classes, std::function<void(const nibasm::source_index&, std::FILE*)>> emitter =
{
  { emit_classes::tokens, [](const nibasm::source_index& src, std::FILE* out)
    {
      for(auto& tok : nibasm::tokenizer::read(src))
      {
        const auto info = src.get_span_line(tok.loc);
        fmt::print(out, "Token \'{}\' at {}:{}:{} with data \"{}\".\n", nibasm::kind_to_str(tok.kind), src.module(),
                   info ? info->line_number : 0, info ? info->column : 0, nibasm::escape(src.get_span(tok.loc).value_or("")));
      }
    } },
  { emit_classes::items, [](const nibasm::source_index& src, std::FILE* out)
    {
      auto parsed = nibasm::parse(src);
      if(auto* diag = std::get_if<nlohmann::json>(&parsed))
        diagnostic <<= *diag;
      else
        std::get<nibasm::program>(parsed).print(out);
    } },
};

void compiler::go()
{
  if(config.files.size() > 1)
  {
    diagnostic <<= diagnostic_db::args::too_many_inputs(std::nullopt, config.files.size());
    return;
  }
  if(!load())
    return;

  if(auto it = emitter.find(config.emit_class); it != emitter.end())
  {
    it->second(*src, out);
    return;
  }

  auto result = nibasm::assemble(*src);
  if(auto* diag = std::get_if<nlohmann::json>(&result))
  {
    diagnostic <<= *diag;
    return;
  }
  const auto& img = std::get<nibasm::image>(result);

  write(img);
  if(diagnostic.error_code() == 0 && config.emit_class == emit_classes::hex)
    fmt::print(out, "{}", nibasm::hex_dump(img));
}

bool compiler::load()
{
  if(config.files.empty())
  {
    src = nibasm::source_index::from_stream("STDIN", std::cin);
    return true;
  }

  src = nibasm::source_index::from_file(config.files.front());
  if(!src)
    diagnostic <<= diagnostic_db::io::cannot_open_file(std::nullopt, config.files.front());
  return src.has_value();
}

void compiler::write(const nibasm::image& img)
{
  const std::string path = config.output_file.empty()
    ? nibasm::derive_output_path(config.files.empty() ? "STDIN" : config.files.front())
    : config.output_file;

  std::ofstream of(path, std::ios::out | std::ios::binary | std::ios::trunc);
  of.write(reinterpret_cast<const char*>(img.data()), static_cast<std::streamsize>(img.size()));
  of.flush();

  if(!of)
  {
    diagnostic <<= diagnostic_db::io::cannot_write_output(std::nullopt, path);
    return;
  }
  diagnostic <<= diagnostic_db::io::wrote_image(std::nullopt, img.size(), path);
}

