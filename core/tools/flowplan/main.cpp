// flowplan - Workflow Plan Compiler Command Line Interface
//
// Usage:
//   flowplan build [workflow.json] [-o output] [--format json|xml|tree] [--lenient]
//   flowplan check [workflow.json] [--lenient]
//   flowplan topology [workflow.json]
//   flowplan order [workflow.json]
//   flowplan init <project-name>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "flowplan/basic/diagnostic_printer.hpp"
#include "flowplan/driver/compiler.hpp"
#include "flowplan/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "flowplan - workflow plan compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [workflow.json]    Compile a workflow into an execution plan\n"
            << "  check [workflow.json]    Validate a workflow (no output)\n"
            << "  topology [workflow.json] Print the plan as a tree\n"
            << "  order [workflow.json]    Print node ids in execution order\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Without a workflow file, the entry of flowplan.yaml is used.\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file\n"
            << "  --format <fmt>           Output format: json, xml or tree\n"
            << "  --lenient                Report validation errors but keep compiling\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const flowplan::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  flowplan::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
  printer.print_summary(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string format;
  bool lenient = false;
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
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--lenient") {
      args.lenient = true;
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

// ============================================================================
// Input Resolution
// ============================================================================

/**
 * What to compile and how: the workflow path plus options from the project
 * file, if there is one.
 */
struct Invocation
{
  fs::path workflow;
  std::string name;
  std::optional<flowplan::ProjectConfig> project;
  flowplan::CompileOptions options;
};

std::optional<Invocation> resolve_invocation(const CommandArgs & args)
{
  Invocation inv;

  if (args.input_file.empty()) {
    // Project mode: find flowplan.yaml
    auto config_path = flowplan::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no workflow given and no " << flowplan::k_project_config_file_name
                << " found in current directory or parents\n";
      return std::nullopt;
    }

    auto config_result = flowplan::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }

    const flowplan::ProjectConfig & config = config_result.config;
    if (!config.compiler.entry) {
      std::cerr << "error: compiler.entry is not set in " << config_path->string() << "\n";
      return std::nullopt;
    }

    inv.workflow = config.project_root / *config.compiler.entry;
    inv.name = config.package.name;
    inv.options = flowplan::CompileOptions::from_project(config);
    inv.project = std::move(config_result.config);

    if (args.verbose) {
      std::cerr << "Project: " << (inv.name.empty() ? config_path->string() : inv.name) << "\n";
    }
  } else {
    inv.workflow = fs::absolute(args.input_file);
  }

  if (!fs::exists(inv.workflow)) {
    std::cerr << "error: file not found: " << inv.workflow.string() << "\n";
    return std::nullopt;
  }

  if (inv.name.empty()) {
    inv.name = inv.workflow.stem().string();
  }
  if (args.lenient) {
    inv.options.strict = false;
  }
  inv.options.verbose = args.verbose;
  return inv;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_build(const CommandArgs & args)
{
  auto inv = resolve_invocation(args);
  if (!inv) {
    return 1;
  }

  flowplan::OutputFormat format =
    inv->project ? inv->project->compiler.format : flowplan::OutputFormat::Json;
  if (!args.format.empty()) {
    const auto parsed = flowplan::parse_output_format(args.format);
    if (!parsed) {
      std::cerr << "error: unknown format '" << args.format << "' (expected json, xml or tree)\n";
      return 1;
    }
    format = *parsed;
  }

  if (args.verbose) {
    std::cerr << "Building: " << inv->workflow.string() << "\n";
  }

  flowplan::CompileResult result = flowplan::Compiler::compile_file(inv->workflow, inv->options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  // Output target: -o, else the project's output_dir, else stdout
  std::optional<fs::path> output;
  if (!args.output_path.empty()) {
    output = fs::path(args.output_path);
  } else if (inv->project) {
    output = inv->project->project_root / inv->project->compiler.output_dir /
             (inv->workflow.stem().string() + flowplan::file_extension(format));
  }

  if (!output) {
    std::cout << flowplan::Compiler::render(result, format, inv->name);
    return 0;
  }

  flowplan::DiagnosticBag emit_diags;
  if (!flowplan::Compiler::emit(result, format, inv->name, *output, emit_diags)) {
    print_diagnostics(emit_diags);
    return 1;
  }

  std::cerr << "Generated: " << output->string() << "\n";
  return 0;
}

int cmd_check(const CommandArgs & args)
{
  auto inv = resolve_invocation(args);
  if (!inv) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << inv->workflow.string() << "\n";
  }

  const flowplan::CompileResult result =
    flowplan::Compiler::compile_file(inv->workflow, inv->options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (result.success) {
    std::cout << inv->workflow.filename().string() << ": OK\n";
    return 0;
  }

  return 1;
}

int cmd_topology(const CommandArgs & args)
{
  auto inv = resolve_invocation(args);
  if (!inv) {
    return 1;
  }

  const flowplan::CompileResult result =
    flowplan::Compiler::compile_file(inv->workflow, inv->options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  std::cout << flowplan::Compiler::render(result, flowplan::OutputFormat::Tree, inv->name);
  return 0;
}

int cmd_order(const CommandArgs & args)
{
  auto inv = resolve_invocation(args);
  if (!inv) {
    return 1;
  }

  const flowplan::CompileResult result =
    flowplan::Compiler::compile_file(inv->workflow, inv->options);

  if (result.diagnostics.has_errors()) {
    print_diagnostics(result.diagnostics);
  }

  if (result.topological_order.empty()) {
    return 1;
  }

  for (const auto & id : result.topological_order) {
    std::cout << id << "\n";
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: flowplan init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "prompts");
    fs::create_directories(project_dir / "generated");

    // Create flowplan.yaml
    std::ofstream config(project_dir / flowplan::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "compiler:\n"
           << "  entry: 'workflow.json'\n"
           << "  output_dir: './generated'\n"
           << "  format: json\n"
           << "  strict: true\n";
    config.close();

    // Create a two-task workflow
    std::ofstream workflow(project_dir / "workflow.json");
    workflow << "{\n"
             << "  \"name\": \"" << args.input_file << "\",\n"
             << "  \"regions\": [\n"
             << "    {\n"
             << "      \"id\": \"main\",\n"
             << "      \"name\": \"Main\",\n"
             << "      \"nodes\": [\n"
             << "        { \"id\": \"prompt\", \"type\": \"prompt\", \"name\": \"Instructions\",\n"
             << "          \"config\": { \"file_path\": \"prompts/main.md\" } },\n"
             << "        { \"id\": \"draft\", \"type\": \"agent\", \"name\": \"Draft\" },\n"
             << "        { \"id\": \"review\", \"type\": \"agent\", \"name\": \"Review\" }\n"
             << "      ],\n"
             << "      \"edges\": [\n"
             << "        { \"id\": \"e1\", \"source\": \"prompt\", \"target\": \"draft\" },\n"
             << "        { \"id\": \"e2\", \"source\": \"prompt\", \"target\": \"review\" },\n"
             << "        { \"id\": \"e3\", \"source\": \"draft\", \"target\": \"review\",\n"
             << "          \"sourceHandle\": \"output\", \"targetHandle\": \"input\" }\n"
             << "      ]\n"
             << "    }\n"
             << "  ]\n"
             << "}\n";
    workflow.close();

    std::ofstream prompt(project_dir / "prompts" / "main.md");
    prompt << "Describe what the tasks should do.\n";
    prompt.close();

    std::cout << "Initialized new flowplan project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  flowplan build\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "build") {
    return cmd_build(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "topology") {
    return cmd_topology(args);
  }

  if (args.command == "order") {
    return cmd_order(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
