/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef HKPDB_APP_COMMAND_LINE_PARSER_H_
#define HKPDB_APP_COMMAND_LINE_PARSER_H_

#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::app {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;                 ///< Empty = built-in defaults
  std::string schema_file;                 ///< Optional JSON Schema file path
  std::vector<std::string> keyring_files;  ///< Keyrings loaded before the command runs
  std::string command;                     ///< load, get, search, since, resolve or digest
  std::vector<std::string> operands;
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Options come first, then the command and its operands. Everything after
 * the command is an operand, so operands may start with '-'.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or error
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path
   * - -s, --schema <file>: Use custom JSON Schema
   * - -k, --keyring <file>: Load a keyring before running the command (repeatable)
   * - -t, --config-test: Test configuration file and exit
   * - -h, --help: Show help message
   * - -v, --version: Show version information
   *
   * @note Help and version flags take precedence (set show_help/show_version flags)
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Check whether name is a known command
   */
  static bool IsCommand(const std::string& name);

  /**
   * @brief Print help message to stdout
   * @param program_name Program name (argv[0])
   */
  static void PrintHelp(const char* program_name);

  /**
   * @brief Print version information to stdout
   */
  static void PrintVersion();

 private:
  CommandLineParser() = default;
};

}  // namespace hkpdb::app

#endif  // HKPDB_APP_COMMAND_LINE_PARSER_H_
