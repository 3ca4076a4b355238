/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <iostream>

#include "app/backend_factory.h"
#include "app/key_commands.h"
#include "utils/structured_log.h"
#include "version.h"

namespace hkpdb::app {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

namespace {

void LogApplicationError(const char* type, const Error& error) {
  hkp::utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("error", error.to_string())
      .Error();
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

int Application::Run() {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    LogApplicationError("logging_config_failed", logging_result.error());
    return 1;
  }

  spdlog::debug("{} running '{}'", Version::FullString(), args_.command);

  auto init_result = Initialize();
  if (!init_result) {
    LogApplicationError("initialization_failed", init_result.error());
    return 1;
  }

  auto preload_result = PreloadKeyrings();
  if (!preload_result) {
    LogApplicationError("keyring_load_failed", preload_result.error());
    return 1;
  }

  KeyCommands commands(*storage_, std::cout);
  auto command_result = commands.Execute(args_.command, args_.operands);
  if (!command_result) {
    LogApplicationError("command_failed", command_result.error());
    std::cerr << args_.command << ": " << command_result.error().to_string() << "\n";
    return 1;
  }
  return 0;
}

int Application::HandleSpecialModes() {
  if (args_.show_help || args_.show_version) {
    return 0;
  }
  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest(std::cout);
  }
  return -1;
}

Expected<void, Error> Application::Initialize() {
  if (storage_) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "Application already initialized"));
  }

  auto opened = OpenKeyStorage(config_manager_->GetConfig());
  if (!opened) {
    return MakeUnexpected(opened.error());
  }
  storage_ = std::move(*opened);

  storage_->Subscribe([](const storage::KeyChange& change) -> Expected<void, Error> {
    spdlog::info("{}", storage::ToString(change));
    return {};
  });
  return {};
}

Expected<void, Error> Application::PreloadKeyrings() {
  if (args_.keyring_files.empty()) {
    return {};
  }

  KeyCommands loader(*storage_, std::cerr);
  for (const auto& path : args_.keyring_files) {
    auto summary = loader.LoadFile(path);
    if (!summary) {
      return MakeUnexpected(summary.error());
    }
    spdlog::info("Loaded keyring {}: {} added, {} updated, {} unchanged", path, summary->added, summary->replaced,
                 summary->unchanged);
  }
  return {};
}

}  // namespace hkpdb::app
