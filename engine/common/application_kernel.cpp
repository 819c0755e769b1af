#include "application_kernel.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <thread>
#include <vector>

namespace docgate {
namespace engine {
namespace common {

std::atomic<ApplicationKernel*> ApplicationKernel::instance_{nullptr};

//=== Constructors & Destructor ===
ApplicationKernel::ApplicationKernel() : app_name_("docgate_app") {
  instance_ = this;
}

ApplicationKernel::~ApplicationKernel() {
  ApplicationKernel* self = this;
  instance_.compare_exchange_strong(self, nullptr);
}

//=== Main Lifecycle ===

bool ApplicationKernel::Initialize(int argc, char** argv) {
  std::string config_file;
  if (!ParseCommandLineArguments(argc, argv, config_file)) {
    return false;
  }

  loaded_config_file_ = config_file;
  bool config_loaded = config_.LoadFromFile(config_file);

  // Logging reads its settings from config, so it comes second
  InitializeLogging();
  if (!config_loaded) {
    SPDLOG_ERROR("Could not load configuration from {}", config_file);
    exit_code_ = 1;
    return false;
  }

  SPDLOG_INFO("Starting application: {}", app_name_);
  config_.PrintAllConfig();

  SetupSignalHandlers();

  try {
    OnInitialize();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("OnInitialize hook failed: {}", e.what());
    exit_code_ = 1;
    return false;
  }
  return true;
}

bool ApplicationKernel::ParseCommandLineArguments(int argc, char** argv, std::string& config_file) {
  CLI::App app{app_name_};
  app.add_option("--config_file", config_file, "Path to configuration file")
     ->required()
     ->check(CLI::ExistingFile);
  AddCommandLineOptions(app);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    // Prints usage for --help, the CLI11 message otherwise
    exit_code_ = app.exit(e);
    return false;
  }
  return true;
}

void ApplicationKernel::InitializeLogging() {
  std::string log_file_path = config_.GetString("app.log.file", "logs/" + app_name_ + ".log");
  std::string log_level_str = config_.GetString("app.log.level", "info");

  spdlog::level::level_enum level = spdlog::level::from_str(log_level_str);
  if (level == spdlog::level::off && log_level_str != "off") {
    level = spdlog::level::info;  // from_str maps unknown names to off
  }

  std::string path_str = log_file_path;
  try {
    std::filesystem::path p(log_file_path);
    if (!p.is_absolute()) {
      p = std::filesystem::absolute(p);
    }
    path_str = p.string();
    if (p.has_parent_path()) {
      std::filesystem::create_directories(p.parent_path());
    }

    // Create file and console sinks
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_str, true);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};

    auto logger = std::make_shared<spdlog::logger>(app_name_, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v [%s:%#]");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[docgate] InitLogging failed (path=%s): %s\n", path_str.c_str(), e.what());
    // Fallback to console only
    spdlog::set_default_logger(spdlog::stdout_color_mt(app_name_));
    spdlog::set_level(level);
  }

  SPDLOG_INFO("Logging to {} with level {} (config: {})", path_str, log_level_str, loaded_config_file_);
}

int ApplicationKernel::Run(int argc, char** argv) {
  if (!Initialize(argc, argv)) {
    return exit_code_.load();
  }

  SPDLOG_INFO("ApplicationKernel: Starting application");
  running_ = true;
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Start failed: {}", e.what());
    running_ = false;
    exit_code_ = 1;
  }

  if (running_.load()) {
    SPDLOG_INFO("Application {} started", app_name_);
  }
  while (running_.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  SPDLOG_INFO("Stop requested");
  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Stop hook failed: {}", e.what());
    exit_code_ = 1;
  }

  Shutdown();

  SPDLOG_INFO("Application {} stopped (exit code {})", app_name_, exit_code_.load());
  spdlog::default_logger()->flush();
  return exit_code_.load();
}

void ApplicationKernel::RequestStop(int exit_code) {
  if (exit_code != 0) {
    exit_code_ = exit_code;
  }
  running_.store(false, std::memory_order_release);
}

//=== Private Methods ===
void ApplicationKernel::SetupSignalHandlers() {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
}

void ApplicationKernel::SignalHandler(int signal) {
  ApplicationKernel* instance = instance_.load();
  if (instance && (signal == SIGINT || signal == SIGTERM)) {
    instance->running_.store(false, std::memory_order_release);
  }
}

void ApplicationKernel::Shutdown() {
  if (shutdown_done_.exchange(true)) {
    return;  // Already shut down
  }

  running_ = false;
  SPDLOG_INFO("Shutting down application: {}", app_name_);

  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Shutdown hook exception: {}", e.what());
  }
}

}  // namespace common
}  // namespace engine
}  // namespace docgate
