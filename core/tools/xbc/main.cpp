// xbc - XAML Bridge Converter Command Line Interface
//
// Usage:
//   xbc convert <file.xaml> [-o output] [--config xaml_bridge.yaml] [--mappings db.json]
//   xbc dump <file.xaml>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <nlohmann/json.hpp>

#include "xaml_bridge/ast/json_dump.hpp"
#include "xaml_bridge/basic/diagnostic_printer.hpp"
#include "xaml_bridge/basic/logging.hpp"
#include "xaml_bridge/config/conversion_config.hpp"
#include "xaml_bridge/driver/converter.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "XAML Bridge Converter v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  convert <file.xaml>      Convert WPF markup to Avalonia markup\n"
            << "  dump <file.xaml>         Print the parsed document as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file (default: stdout)\n"
            << "  --config <path>          Configuration file (default: nearest xaml_bridge.yaml)\n"
            << "  --mappings <path>        JSON mapping database\n"
            << "  --no-semantic            Structural parse only\n"
            << "  --target-namespace       Write the target default namespace on the root\n"
            << "  --annotate               Append a review comment listing diagnostics\n"
            << "  --no-preserve            Re-indent instead of preserving formatting\n"
            << "  -v, --verbose            Verbose output (info diagnostics, debug log)\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(
  const xaml_bridge::DiagnosticBag & diagnostics, const std::string & source_text, bool verbose)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  xaml_bridge::DiagnosticPrinter printer(std::cerr, use_color);
  const xaml_bridge::SourceIndex source(source_text);

  for (const auto & diag : diagnostics) {
    if (!verbose && diag.severity != xaml_bridge::Severity::Error &&
        diag.severity != xaml_bridge::Severity::Warning) {
      continue;
    }
    printer.print(diag, source_text.empty() ? nullptr : &source);
  }
  printer.print_summary(diagnostics);
}

bool read_file(const fs::path & path, std::string & out)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return false;
  std::stringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string config_path;
  std::string mappings_path;
  bool no_semantic = false;
  bool target_namespace = false;
  bool annotate = false;
  bool no_preserve = false;
  bool verbose = false;
  bool show_help = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--mappings") {
      if (i + 1 < argc) {
        args.mappings_path = argv[++i];
      }
    } else if (arg == "--no-semantic") {
      args.no_semantic = true;
    } else if (arg == "--target-namespace") {
      args.target_namespace = true;
    } else if (arg == "--annotate") {
      args.annotate = true;
    } else if (arg == "--no-preserve") {
      args.no_preserve = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

/// Configuration from --config, the nearest xaml_bridge.yaml, or defaults; flags override
bool build_config(const CommandArgs & args, const fs::path & input, xaml_bridge::ConversionConfig & out)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = xaml_bridge::find_conversion_config(input.parent_path());
  }

  if (config_path) {
    auto loaded = xaml_bridge::load_conversion_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return false;
    }
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    out = std::move(loaded.config);
  }

  if (!args.mappings_path.empty()) out.mappings.file = fs::absolute(args.mappings_path);
  if (args.no_semantic) out.parser.semantic = false;
  if (args.target_namespace) out.writer.use_target_namespace = true;
  if (args.annotate) out.writer.annotate_diagnostics = true;
  if (args.no_preserve) out.writer.preserve_formatting = false;
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_convert(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: xbc convert <file.xaml> [-o output]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::string text;
  if (!fs::exists(input_path) || !read_file(input_path, text)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  xaml_bridge::ConversionConfig config;
  if (!build_config(args, input_path, config)) return 1;

  if (args.verbose) {
    std::cerr << "Converting: " << input_path.string() << "\n";
  }

  const xaml_bridge::Converter converter(std::move(config));
  const auto result = converter.convert_text(text, input_path.string());

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, text, args.verbose);
  }

  if (!result.success || result.diagnostics.has_errors()) {
    return 1;
  }

  if (args.output_path.empty()) {
    std::cout << result.output;
    return 0;
  }

  std::ofstream out(args.output_path, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << args.output_path << "\n";
    return 1;
  }
  out << result.output;
  std::cerr << "Converted " << args.input_file << " to " << args.output_path << " ("
            << result.summary.rules_applied << " transformations)\n";
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: xbc dump <file.xaml>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  std::string text;
  if (!fs::exists(input_path) || !read_file(input_path, text)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  xaml_bridge::ConversionConfig config;
  if (!build_config(args, input_path, config)) return 1;

  const xaml_bridge::Converter converter(std::move(config));
  const auto result = converter.parse_only(text, input_path.string());

  if (!result.success) {
    print_diagnostics(result.diagnostics, text, true);
    return 1;
  }

  std::cout << xaml_bridge::to_json(*result.document).dump(2) << "\n";
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

  xaml_bridge::set_log_level(args.verbose ? "debug" : "warn");

  if (args.command == "convert") {
    return cmd_convert(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
