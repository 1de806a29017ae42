// authzgen - Authorization schema code generator
//
// Usage:
//   authzgen [options] [schema-path] [output-dir]
//
#include <filesystem>
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

#include "authzgen/ast/ast_context.hpp"
#include "authzgen/ast/json_visitor.hpp"
#include "authzgen/basic/diagnostic_printer.hpp"
#include "authzgen/codegen/naming.hpp"
#include "authzgen/driver/compiler.hpp"
#include "authzgen/driver/schema_io.hpp"
#include "authzgen/project/project_config.hpp"
#include "authzgen/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "authzgen - authorization schema code generator\n\n"
            << "Usage: " << program_name << " [options] [schema-path] [output-dir]\n\n"
            << "Options:\n"
            << "  --schema <path>          Schema file or directory of .zed files\n"
            << "  -o, --output <dir>       Output directory (default: .)\n"
            << "  --package <name>         Package for definitions without a prefix\n"
            << "  --check                  Check syntax and semantics only (no codegen)\n"
            << "  --emit-ast               Print the parsed AST as JSON\n"
            << "  --stdout                 Print the generated source instead of writing it\n"
            << "  --no-format              Skip formatting of the generated source\n"
            << "  --config <path>          Use this authzgen.yaml\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const authzgen::DiagnosticBag & diags, const authzgen::SourceRegistry & sources)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  authzgen::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diags, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::optional<std::string> schema;
  std::optional<std::string> output_dir;
  std::optional<std::string> package;
  std::optional<std::string> config;
  bool check = false;
  bool emit_ast = false;
  bool to_stdout = false;
  bool no_format = false;
  bool verbose = false;
  bool show_help = false;
  /// Set when the command line itself is malformed
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  std::optional<std::string> positional_output;

  const auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 >= argc) {
      args.error = "missing value for '" + flag + "'";
      return std::nullopt;
    }
    return std::string(argv[++i]);
  };

  for (int i = 1; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];

    if (arg == "--schema") {
      args.schema = take_value(i, arg);
    } else if (arg == "-o" || arg == "--output") {
      args.output_dir = take_value(i, arg);
    } else if (arg == "--package") {
      args.package = take_value(i, arg);
    } else if (arg == "--config") {
      args.config = take_value(i, arg);
    } else if (arg == "--check") {
      args.check = true;
    } else if (arg == "--emit-ast") {
      args.emit_ast = true;
    } else if (arg == "--stdout") {
      args.to_stdout = true;
    } else if (arg == "--no-format") {
      args.no_format = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else if (!args.schema) {
      args.schema = arg;
    } else if (!positional_output) {
      positional_output = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  // Flags win over positional arguments.
  if (!args.output_dir && positional_output) {
    args.output_dir = positional_output;
  }
  if (args.error.empty() && args.package && !authzgen::codegen::is_identifier(*args.package)) {
    args.error = "invalid value for '--package': '" + *args.package + "' (must be an identifier)";
  }
  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_emit_ast(const fs::path & schema_path)
{
  authzgen::SchemaInput input;
  try {
    input = authzgen::read_schema_input(schema_path);
  } catch (const authzgen::IoError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  authzgen::SourceRegistry sources;
  authzgen::AstContext ast;
  authzgen::DiagnosticBag diags;
  const auto parsed = authzgen::parse_sources(sources, std::move(input.files), ast, diags);
  if (!parsed.success) {
    print_diagnostics(diags, sources);
    return 1;
  }

  std::cout << authzgen::to_json(parsed.definitions).dump(2) << "\n";
  return 0;
}

int run(const CommandArgs & args, const char * program_name)
{
  // Project configuration: explicit --config, else search upward.
  std::optional<authzgen::ProjectConfig> config;
  std::optional<fs::path> config_path;
  if (args.config) {
    config_path = fs::path(*args.config);
  } else {
    config_path = authzgen::find_project_config(fs::current_path());
  }
  if (config_path) {
    auto loaded = authzgen::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return 1;
    }
    if (args.verbose) {
      std::cerr << "Using config: " << config_path->string() << "\n";
    }
    config = std::move(loaded.config);
  }

  std::optional<fs::path> schema_path;
  if (args.schema) {
    schema_path = fs::path(*args.schema);
  } else if (config && config->generator.schema) {
    schema_path = config->generator.schema;
  }
  if (!schema_path) {
    std::cerr << "error: schema path is required\n";
    print_usage(program_name);
    return 1;
  }

  if (args.emit_ast) {
    return cmd_emit_ast(*schema_path);
  }

  authzgen::CompileOptions options;
  options.mode = args.check ? authzgen::CompileMode::Check : authzgen::CompileMode::Build;
  if (config) {
    options.output_dir = config->generator.output_dir;
    options.default_package = config->generator.default_package;
    options.file_extension = config->generator.extension;
    options.format_output = config->generator.format;
    if (config->generator.template_path) {
      try {
        options.template_text = authzgen::read_text_file(*config->generator.template_path);
      } catch (const authzgen::IoError & e) {
        std::cerr << "error: cannot load template: " << e.what() << "\n";
        return 1;
      }
    }
  }
  if (args.output_dir) {
    options.output_dir = *args.output_dir;
  }
  if (args.package) {
    options.default_package = *args.package;
  }
  if (args.no_format) {
    options.format_output = false;
  }

  if (args.verbose) {
    std::cerr << (args.check ? "Checking: " : "Building: ") << schema_path->string() << "\n";
  }

  authzgen::FileSystemWriter file_writer;
  authzgen::MemoryWriter memory_writer;
  authzgen::OutputWriter & writer =
    args.to_stdout ? static_cast<authzgen::OutputWriter &>(memory_writer) : file_writer;

  const auto result = authzgen::Compiler::compile_path(*schema_path, options, writer);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.sources);
  }
  if (!result.success) {
    return 1;
  }

  if (args.check) {
    std::cout << schema_path->string() << ": OK\n";
    return 0;
  }

  if (args.verbose && result.unit) {
    std::cerr << "Package: " << result.unit->package << "\n";
  }
  if (args.to_stdout) {
    std::cout << result.unit->source;
    return 0;
  }
  for (const auto & file : result.generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  return run(args, argv[0]);
}
