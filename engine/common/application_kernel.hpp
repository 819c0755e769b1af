#pragma once

#include "config_manager.hpp"
#include <atomic>
#include <string>

namespace CLI {
class App;
}  // namespace CLI

namespace docgate {
namespace engine {
namespace common {

/**
 * @brief Base application framework providing common infrastructure.
 *
 * ApplicationKernel provides a standardized lifecycle for applications:
 * 1. Initialize: parse command line, load config, setup logging
 * 2. Start: begin processing (derived class logic)
 * 3. Run: wait until a signal or RequestStop()
 * 4. Stop: graceful shutdown
 *
 * Features:
 * - Command line parsing (CLI11), --config_file is always required
 * - Configuration management (JSON)
 * - Structured logging (spdlog, file + console)
 * - Signal handling (SIGINT, SIGTERM)
 *
 * Usage:
 * ```cpp
 * class MyApp : public ApplicationKernel {
 *  protected:
 *   void OnStart() override { // Start your work }
 *   void OnStop() override { // Cancel and join it }
 * };
 * ```
 */
class ApplicationKernel {
 public:
  //=== Constructors & Destructor ===
  ApplicationKernel();
  virtual ~ApplicationKernel();

  //=== Deleted Copy Operations ===
  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  //=== Main Lifecycle ===
  /**
   * @brief Main entry point for the application.
   *
   * Orchestrates full lifecycle: parse args, load config, initialize,
   * start, wait for stop, stop, shutdown.
   * @return Exit code (0 for success, non-zero for error).
   */
  int Run(int argc, char** argv);

  /** @brief Ask Run() to leave its wait loop; thread-safe. */
  void RequestStop(int exit_code = 0);

  bool IsRunning() const { return running_.load(); }

  //=== Accessors ===
  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  /** @brief Application name (logger name and default log file). */
  const std::string& GetAppName() const { return app_name_; }
  void SetAppName(const std::string& name) { app_name_ = name; }

 protected:
  //=== Lifecycle Hooks (Override in Derived Classes) ===
  /** @brief Register app-specific command line options. */
  virtual void AddCommandLineOptions(CLI::App& /* app */) {}

  /** @brief Called after config loaded and logging set up. */
  virtual void OnInitialize() {}

  /** @brief Called when application starts (begin processing). */
  virtual void OnStart() {}

  /** @brief Called when application stops (end processing). */
  virtual void OnStop() {}

  /** @brief Called during final cleanup. */
  virtual void OnShutdown() {}

 private:
  std::string app_name_;                  ///< Application name
  ConfigManager config_;                  ///< Configuration manager
  std::atomic<bool> running_{false};      ///< Running state flag
  std::atomic<bool> shutdown_done_{false};
  std::atomic<int> exit_code_{0};
  std::string loaded_config_file_;        ///< Path to loaded config
  static std::atomic<ApplicationKernel*> instance_;  ///< For the signal handler

  bool Initialize(int argc, char** argv);
  void SetupSignalHandlers();
  static void SignalHandler(int signal);
  void Shutdown();

  //=== Initialization Helpers ===
  /** @brief Parse arguments; false when the app should exit (help or error). */
  bool ParseCommandLineArguments(int argc, char** argv, std::string& config_file);

  /** @brief Setup spdlog with configured level and format. */
  void InitializeLogging();
};

}  // namespace common
}  // namespace engine
}  // namespace docgate
