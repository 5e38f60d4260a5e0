#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

void AddDecodeFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--offset")
      .scan<'u', size_t>()
      .help("Skip this many bytes before the header");
  cmd.add_argument("--max-depth")
      .scan<'u', size_t>()
      .help("Maximum nesting depth (default 10000, 0 = unbounded)");
  cmd.add_argument("--no-count-check")
      .default_value(false)
      .implicit_value(true)
      .help("Do not compare the object count with the header");
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const camlbin::driver::ToolConfig& config)
    -> camlbin::driver::CommandInput {
  camlbin::driver::CommandInput input;
  input.file = cmd.get<std::string>("file");
  input.offset = cmd.present<size_t>("--offset").value_or(0);

  // Scalars: CLI overrides config
  input.decode.max_depth =
      cmd.present<size_t>("--max-depth").value_or(config.max_depth);
  input.decode.check_object_count =
      config.check_object_count && !cmd.get<bool>("--no-count-check");
  input.print.preview = config.preview;
  return input;
}

auto LoadOptionalConfig() -> std::optional<camlbin::driver::ToolConfig> {
  auto config_path = camlbin::driver::FindConfig();
  if (!config_path) {
    return camlbin::driver::ToolConfig{};
  }
  auto config = camlbin::driver::LoadConfig(*config_path);
  if (!config) {
    camlbin::driver::PrintError(config.error());
    return std::nullopt;
  }
  return *config;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  int verbosity = 0;

  // -v is taken by --verbose, so only the help flag is built in
  argparse::ArgumentParser program(
      "camlbin", "0.1.0", argparse::default_arguments::help);
  program.add_description("Inspect OCaml marshaled data");
  program.add_argument("--version")
      .default_value(false)
      .implicit_value(true)
      .help("Print version and exit");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Increase log verbosity (repeatable)");

  // Subcommand: header
  argparse::ArgumentParser header_cmd("header");
  header_cmd.add_description("Print the header fields");
  header_cmd.add_argument("file").help("Marshaled data file");
  header_cmd.add_argument("--offset")
      .scan<'u', size_t>()
      .help("Skip this many bytes before the header");

  // Subcommand: dump
  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Decode and print the value tree");
  dump_cmd.add_argument("file").help("Marshaled data file");
  AddDecodeFlags(dump_cmd);
  dump_cmd.add_argument("--preview")
      .scan<'u', size_t>()
      .help("Bytes shown per string (default 64)");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Decode and report errors only");
  check_cmd.add_argument("file").help("Marshaled data file");
  AddDecodeFlags(check_cmd);

  program.add_subparser(header_cmd);
  program.add_subparser(dump_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    camlbin::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (program.get<bool>("--version")) {
    std::cout << "camlbin 0.1.0\n";
    return 0;
  }

  // Handle -C before searching for camlbin.toml
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      camlbin::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  auto config = LoadOptionalConfig();
  if (!config) {
    return 1;
  }

  auto base_level = camlbin::driver::ParseLogLevel(config->log_level);
  camlbin::driver::ConfigureLogging(
      camlbin::driver::ApplyVerbosity(
          base_level.value_or(spdlog::level::warn), verbosity));

  if (program.is_subcommand_used("header")) {
    camlbin::driver::CommandInput input;
    input.file = header_cmd.get<std::string>("file");
    input.offset = header_cmd.present<size_t>("--offset").value_or(0);
    return camlbin::driver::HeaderCommand(input, std::cout);
  }

  if (program.is_subcommand_used("dump")) {
    auto input = BuildInput(dump_cmd, *config);
    if (auto preview = dump_cmd.present<size_t>("--preview")) {
      input.print.preview = *preview;
    }
    return camlbin::driver::DumpCommand(input, std::cout);
  }

  if (program.is_subcommand_used("check")) {
    return camlbin::driver::CheckCommand(BuildInput(check_cmd, *config));
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
