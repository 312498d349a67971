#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <optional>

using namespace std::string_view_literals;

void print_emit_classes(std::FILE* f)
{
  std::string list;
  for(auto cls : emit_classes_list)
  {
    if(!list.empty())
      list += ", ";
    list += nlohmann::json(cls).get<std::string>();
  }
  fmt::print(f, "emit classes: {}\n", list);
}

namespace arguments
{

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("nibasm", "Assembler for the 16 register, 15 opcode nibble machine.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto){ return std::make_any<bool>(true); }, 0)
    (",f,-files", "The source file to assemble.", std::make_any<std::vector<std::string_view>>(), "STDIN",
      [](auto x){ return std::vector<std::string_view>(x.begin(), x.end()); })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::bin), "bin",
      [](auto x)
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = v;
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(std::nullopt, v);
        return emit_classes::help;
      }, 1)
    ("-diagnostics-format=", "Print diagnostics as \"text\" or \"json\".", std::make_any<diagnostics_formats>(diagnostics_formats::text), "text",
      [](auto x)
      {
        nlohmann::json easy_conversion = x.front();
        if(easy_conversion.get<diagnostics_formats>() != diagnostics_formats::undef)
          return easy_conversion.get<diagnostics_formats>();

        diagnostic <<= diagnostic_db::args::diagnostics_format_not_present(std::nullopt, x.front());
        return diagnostics_formats::text;
      }, 1)
    ("o,-output", "Output file to write the image to.", std::make_any<std::string>(""), "<input>.bin",
     [](auto x)
     { return std::string(x.front()); }, 1)
    ("-no-color", "Print diagnostics without colors.", std::make_any<bool>(false), "false", [](auto){ return std::make_any<bool>(true); }, 0)
    ("v,-verbose", "Print informational messages.", std::make_any<bool>(false), "false", [](auto){ return std::make_any<bool>(true); }, 0)
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<std::vector<std::string_view>>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
  config.diagnostics_format = std::any_cast<diagnostics_formats>(map["-diagnostics-format="]);
  config.output_file = std::any_cast<std::string>(map["o"]);
  config.colored = !std::any_cast<bool>(map["-no-color"]);
  config.verbose = std::any_cast<bool>(map["v"]);
}

namespace detail
{

// "o,-output" -> { "o", "-output" }, a trailing '=' marks options written as `--opt=value`
static std::vector<std::string_view> split_option_list(std::string_view list, bool& has_equals)
{
  std::vector<std::string_view> names;
  for(;;)
  {
    const auto comma = list.find(',');
    auto name = list.substr(0, comma);
    if(!name.empty() && name.back() == '=')
    {
      name.remove_suffix(1);
      has_equals = true;
    }
    // an empty name makes the option implicit
    if(!name.empty() || comma != std::string_view::npos)
      names.push_back(name);

    if(comma == std::string_view::npos)
      break;
    list.remove_prefix(comma + 1);
  }
  return names;
}

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, const std::function<std::any(const std::vector<std::string_view>&)>& f,
    std::size_t argc)
{
  bool has_equals = false;
  auto names = split_option_list(opt_list, has_equals);

  ot->data.push_back(CmdOption { std::move(names), description, std::move(default_value), default_value_str, f, argc, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


static std::string key_of(const CmdOption& o, std::string_view name)
{ return std::string(name) + (o.has_equals ? "=" : ""); }

struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  static bool is_implicit(const CmdOption& o)
  { return std::find(o.opt.begin(), o.opt.end(), ""sv) != o.opt.end(); }

  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    opt_args.clear();

    for(auto& v : cmdopts->data)
    {
      // if we have an implicit argument, make this the initial current option
      if(is_implicit(v))
      {
        cur_opt = v;
        opt_args = implicit_args;
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(std::size_t i = 0; i < args->size(); ++i)
    {
      const auto arg = (*args)[i];
      const auto next = i + 1 < args->size() ? (*args)[i + 1] : ""sv;

      if(arg.size() > 1 && arg.front() == '-')
        parse_option(arg);
      else
        parse_arg(arg, next);
    }
    return *map;
  }

  // "-o" and "--output" are looked up as "o" and "-output"
  std::optional<CmdOption> find_option(std::string_view str) const
  {
    const auto name = str.substr(1);
    for(auto& o : cmdopts->data)
    {
      if(std::find(o.opt.begin(), o.opt.end(), name) != o.opt.end())
        return o;
    }
    return std::nullopt;
  }

  void store()
  {
    std::any a = cur_opt->parser(opt_args);
    for(auto name : cur_opt->opt)
      (*map)[key_of(*cur_opt, name)] = a;

    // implicit arguments may be interleaved with options
    if(is_implicit(*cur_opt))
      implicit_args = opt_args;
  }

  void parse_arg(std::string_view str, std::string_view next)
  {
    if(!cur_opt.has_value())
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(std::nullopt, str);
      return;
    }
    opt_args.push_back(str);

    // parse option arguments only if we hit the end, another option or the option is saturated
    if(opt_args.size() == cur_opt->argc)
    {
      store();
      reset_cur_opt();
    }
    else if(next.empty() || next[0] == '-')
      store();
  }

  void parse_option(std::string_view str)
  {
    opt_args.clear();

    cur_opt = find_option(str);
    if(!cur_opt)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(std::nullopt, str);
      reset_cur_opt();
      return;
    }

    // flags take no arguments
    if(cur_opt->argc == 0)
    {
      store();
      reset_cur_opt();
    }
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map;

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::vector<std::string_view> implicit_args;
  std::optional<CmdOption> cur_opt;
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& o : data)
    for(auto name : o.opt)
      map[key_of(o, name)] = o.default_value;

  // `--emit=hex` is handled as `--emit hex`, plain inputs may contain '='
  std::vector<std::string_view> args;
  for(int i = 1; i < argc; ++i)
  {
    const std::string_view arg = argv[i];
    const auto eq = arg.find('=');

    if(arg.size() < 2 || arg.front() != '-' || eq == std::string_view::npos)
    {
      args.push_back(arg);
      continue;
    }
    args.push_back(arg.substr(0, eq));
    args.push_back(arg.substr(eq + 1));
  }
  if(args.empty())
    return map;

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += ", ";
      args += "-";
      args += o;
    }
    fmt::print(f, "  {:<28} {} [default={}]\n", args + (v.has_equals ? "=" : ""), v.description, v.default_value_str);
  }
}

}

}

