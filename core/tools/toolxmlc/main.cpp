// toolxmlc - Galaxy tool XML generator command line interface
//
// Usage:
//   toolxmlc build [tree.json | --project] [-o output]
//   toolxmlc canon <tree.json>
//   toolxmlc escape [<value> | -- <value> | --none | --true | --false]
//   toolxmlc unescape <token>
//   toolxmlc control [--value v] [--tag t] [--name n]
//   toolxmlc init <project-name>
//
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "toolxml/basic/diagnostic_printer.hpp"
#include "toolxml/canonical/canonicalizer.hpp"
#include "toolxml/codec/control_token.hpp"
#include "toolxml/codec/escape_codec.hpp"
#include "toolxml/driver/generator.hpp"
#include "toolxml/io/tool_json.hpp"
#include "toolxml/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "toolxmlc - Galaxy tool XML generator v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [tree.json]        Generate a tool, or every tool in the project\n"
            << "  canon <tree.json>        Print the canonical tree as JSON\n"
            << "  escape <value>           Escape a value for a tool document\n"
            << "  unescape <token>         Reverse an escaped value\n"
            << "  control                  Print a form control placeholder\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (single tool) or directory (project)\n"
            << "  --project                Build every tool listed in toolxml.yaml\n"
            << "  --config <path>          Use this toolxml.yaml instead of searching\n"
            << "  --none, --true, --false  Escape a sentinel instead of text\n"
            << "  --value, --tag, --name   Control placeholder components\n"
            << "  --                       Treat the next argument as a value\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const toolxml::DiagnosticBag & diagnostics)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  toolxml::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::optional<std::string> positional;
  std::string output_path;
  std::string config_path;
  std::optional<toolxml::ScalarKind> sentinel;
  std::optional<std::string> control_value;
  std::optional<std::string> control_tag;
  std::optional<std::string> control_name;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  bool options_done = false;
  int i = 2;
  const auto take_value = [&](const std::string & option, auto & target) {
    if (i + 1 >= argc) {
      args.error = "option '" + option + "' requires a value";
      return false;
    }
    target = argv[++i];
    return true;
  };

  for (; i < argc; ++i) {
    const std::string arg = argv[i];

    if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
      if (args.positional) {
        args.error = "unexpected argument '" + arg + "'";
        return args;
      }
      args.positional = arg;
    } else if (arg == "--") {
      // Everything after "--" is positional, e.g. `escape -- -x`
      options_done = true;
    } else if (arg == "-o" || arg == "--output") {
      if (!take_value(arg, args.output_path)) {
        return args;
      }
    } else if (arg == "--config") {
      if (!take_value(arg, args.config_path)) {
        return args;
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--none") {
      args.sentinel = toolxml::ScalarKind::Absent;
    } else if (arg == "--true") {
      args.sentinel = toolxml::ScalarKind::True;
    } else if (arg == "--false") {
      args.sentinel = toolxml::ScalarKind::False;
    } else if (arg == "--value") {
      if (!take_value(arg, args.control_value)) {
        return args;
      }
    } else if (arg == "--tag") {
      if (!take_value(arg, args.control_tag)) {
        return args;
      }
    } else if (arg == "--name") {
      if (!take_value(arg, args.control_name)) {
        return args;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else {
      args.error = "unknown option '" + arg + "' (use '--' before a value starting with '-')";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

// Returns false if a configuration was found but could not be loaded.
bool load_config(const CommandArgs & args, std::optional<toolxml::ProjectConfig> & out)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = toolxml::find_project_config(fs::current_path());
  }

  if (!config_path) {
    return true;
  }

  auto config_result = toolxml::load_project_config(*config_path);
  if (!config_result.success) {
    toolxml::DiagnosticBag diags;
    diags.report_error(config_result.error)
      .with_code(toolxml::diag_code::k_config_error)
      .with_file(config_path->string());
    print_diagnostics(diags);
    return false;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  out = std::move(config_result.config);
  return true;
}

int cmd_build(const CommandArgs & args)
{
  toolxml::GenerateOptions options;
  options.verbose = args.verbose;

  std::optional<toolxml::ProjectConfig> config;
  if (!load_config(args, config)) {
    return 1;
  }

  toolxml::GenerateResult result;

  if (args.use_project || !args.positional) {
    if (!config) {
      std::cerr << "error: no " << toolxml::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }
    if (!args.output_path.empty()) {
      options.output_dir = fs::path(args.output_path);
    }
    result = toolxml::Generator::generate_project(*config, options);
  } else {
    const fs::path input_path = fs::absolute(*args.positional);
    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    const fs::path output_path = args.output_path.empty()
                                   ? toolxml::Generator::output_name_for(input_path)
                                   : fs::path(args.output_path);
    const toolxml::DocumentMetadata meta = config ? config->metadata : toolxml::DocumentMetadata{};
    result = toolxml::Generator::generate_file(input_path, output_path, meta, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

int cmd_canon(const CommandArgs & args)
{
  if (!args.positional) {
    std::cerr << "error: input tree file required\n";
    std::cerr << "usage: toolxmlc canon <tree.json>\n";
    return 1;
  }

  try {
    const toolxml::Node raw = toolxml::load_tree_file(*args.positional);
    std::cout << toolxml::tree_to_json(toolxml::canonicalize(raw)).dump(2) << "\n";
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_escape(const CommandArgs & args)
{
  if (args.sentinel) {
    std::cout << toolxml::sentinel_token(*args.sentinel) << "\n";
    return 0;
  }
  if (!args.positional) {
    std::cerr << "error: value required\n";
    std::cerr << "usage: toolxmlc escape [<value> | --none | --true | --false]\n";
    return 1;
  }

  std::cout << toolxml::encode(toolxml::ScalarValue::make_text(*args.positional)) << "\n";
  return 0;
}

int cmd_unescape(const CommandArgs & args)
{
  if (!args.positional) {
    std::cerr << "error: token required\n";
    std::cerr << "usage: toolxmlc unescape <token>\n";
    return 1;
  }

  const toolxml::ScalarValue value = toolxml::decode(*args.positional);
  switch (value.kind()) {
    case toolxml::ScalarKind::Absent:
      std::cout << "None\n";
      break;
    case toolxml::ScalarKind::True:
      std::cout << "True\n";
      break;
    case toolxml::ScalarKind::False:
      std::cout << "False\n";
      break;
    case toolxml::ScalarKind::Text:
      std::cout << value.as_text() << "\n";
      break;
  }
  if (args.verbose) {
    std::cerr << "kind: " << toolxml::to_string(value.kind()) << "\n";
  }
  return 0;
}

int cmd_control(const CommandArgs & args)
{
  std::cout << toolxml::ui_control_token(args.control_value, args.control_tag, args.control_name)
            << "\n";
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (!args.positional) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: toolxmlc init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / *args.positional;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "trees");

    std::ofstream config(project_dir / toolxml::k_project_config_file_name);
    config << "metadata:\n"
           << "  generator_name: 'q2galaxy'\n"
           << "  generator_version: '0.1.0'\n"
           << "  target_name: 'qiime2'\n"
           << "  target_version: '2021.2.0'\n\n"
           << "output:\n"
           << "  directory: './tools'\n\n"
           << "tools:\n"
           << "  - './trees/example.json'\n";
    config.close();

    std::ofstream tree(project_dir / "trees" / "example.json");
    tree << "{\n"
         << "  \"tag\": \"tool\",\n"
         << "  \"attributes\": {\"id\": \"example\", \"name\": \"example\", \"version\": \"0.1.0\"},\n"
         << "  \"children\": [\n"
         << "    {\"tag\": \"description\", \"text\": \"Do a thing\"},\n"
         << "    {\"tag\": \"command\", \"text\": \"echo hello\"}\n"
         << "  ]\n"
         << "}\n";
    tree.close();

    std::cout << "Initialized new toolxml project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << *args.positional << "\n"
              << "  toolxmlc build\n";
    return 0;
  } catch (const fs::filesystem_error & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return 1;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "build") {
    return cmd_build(args);
  }

  if (args.command == "canon") {
    return cmd_canon(args);
  }

  if (args.command == "escape") {
    return cmd_escape(args);
  }

  if (args.command == "unescape") {
    return cmd_unescape(args);
  }

  if (args.command == "control") {
    return cmd_control(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
