/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <array>
#include <iostream>

#include "version.h"

namespace hkpdb::app {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

namespace {

constexpr std::array<const char*, 6> kCommands = {"load", "get", "search", "since", "resolve", "digest"};

/**
 * @brief Check if argument matches short or long option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

}  // namespace

bool CommandLineParser::IsCommand(const std::string& name) {
  for (const char* command : kCommands) {
    if (name == command) {
      return true;
    }
  }
  return false;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  int index = 1;
  for (; index < argc; ++index) {
    std::string arg = argv[index];

    if (MatchesOption(arg, "-h", "--help")) {
      args.show_help = true;
      return args;
    }
    if (MatchesOption(arg, "-v", "--version")) {
      args.show_version = true;
      return args;
    }

    if (MatchesOption(arg, "-c", "--config")) {
      if (index + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--config requires a file path argument"));
      }
      args.config_file = argv[++index];
    } else if (MatchesOption(arg, "-s", "--schema")) {
      if (index + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--schema requires a file path argument"));
      }
      args.schema_file = argv[++index];
    } else if (MatchesOption(arg, "-k", "--keyring")) {
      if (index + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--keyring requires a file path argument"));
      }
      args.keyring_files.emplace_back(argv[++index]);
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else {
      break;
    }
  }

  if (args.config_test_mode) {
    if (args.config_file.empty()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kInvalidArgument, "--config-test requires --config <file>. Use --help for usage."));
    }
    if (index < argc) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      "--config-test does not take a command: " + std::string(argv[index])));
    }
    return args;
  }

  if (index >= argc) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No command given. Use --help for usage."));
  }

  args.command = argv[index++];
  if (!IsCommand(args.command)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown command: " + args.command));
  }

  for (; index < argc; ++index) {
    args.operands.emplace_back(argv[index]);
  }

  if (args.operands.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, args.command + " requires at least one argument"));
  }
  if (args.command == "since" && args.operands.size() != 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "since takes exactly one timestamp"));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] <command> <args>...\n";
  std::cout << "       " << program_name << " -c <config.yaml|config.json> -t\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path (default: in-memory store)\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -k, --keyring <file>           Load a binary keyring before the command (repeatable)\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  load <keyring-file>...         Insert or merge every key in the files\n";
  std::cout << "  get <id>...                    Show keys by fingerprint, key ID or short ID\n";
  std::cout << "  search <word>...               Show keys whose user IDs contain any word\n";
  std::cout << "  since <unix-seconds>           Show keys modified after the timestamp\n";
  std::cout << "  resolve <id>...                Print the stored identities matching the IDs\n";
  std::cout << "  digest <md5>...                Print the stored identities with the digests\n";
  std::cout << "\n";
  std::cout << "Configuration file format (auto-detected):\n";
  std::cout << "  - YAML (.yaml, .yml) - validated against built-in schema\n";
  std::cout << "  - JSON (.json)       - validated against built-in schema\n";
}

void CommandLineParser::PrintVersion() { std::cout << Version::FullString() << "\n"; }

}  // namespace hkpdb::app
