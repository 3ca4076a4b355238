/**
 * @file application.h
 * @brief Main application class
 */

#ifndef HKPDB_APP_APPLICATION_H_
#define HKPDB_APP_APPLICATION_H_

#include <memory>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "storage/key_storage.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::app {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief Main application class
 *
 * Parses the command line, loads configuration, opens the key store on the
 * configured backend and runs one command against it.
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   *
   * Prints help or version right away when requested. Does not touch the
   * backend; that happens in Run().
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application
   * @return Exit code (0 = success, non-zero = error)
   */
  int Run();

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  Expected<void, Error> Initialize();
  Expected<void, Error> PreloadKeyrings();

  // Returns exit code, or -1 to continue normal execution
  int HandleSpecialModes();

  CommandLineArgs args_;

  std::unique_ptr<ConfigurationManager> config_manager_;
  std::unique_ptr<storage::KeyStorage> storage_;
};

}  // namespace hkpdb::app

#endif  // HKPDB_APP_APPLICATION_H_
