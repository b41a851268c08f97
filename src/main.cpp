#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdint>
#include <iostream> // Keep for CLI output and early errors before logger initialized

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<file>        Load settings from a JSON file (later flags override it)\n"
      << "  --start=<n>          First block to request (rounded down to a slice boundary)\n"
      << "  --final=<n>          Last block to request (default: unbounded)\n"
      << "  --slices=<n>         Slices held in memory at once (default: 64)\n"
      << "  --queue=<n>          Send queue capacity in messages (default: "
      << headerpipe::protocol::DEFAULT_SEND_QUEUE_CAPACITY << ")\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, sync, app, all\n"
      << "                       Can be comma-separated: --debug=network,sync\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

namespace {

bool ParseBlockArg(const std::string &name, const std::string &value, uint64_t &out) {
  auto parsed = headerpipe::util::SafeParseUInt64(value, 0, UINT64_MAX);
  if (!parsed) {
    std::cerr << "Error: Invalid " << name << " block number: " << value << std::endl;
    return false;
  }
  out = *parsed;
  return true;
}

bool ParseCountArg(const std::string &name, const std::string &value, size_t &out) {
  auto parsed = headerpipe::util::SafeParseUInt64(value, 1, 1000000);
  if (!parsed) {
    std::cerr << "Error: Invalid " << name << ": " << value << std::endl;
    std::cerr << "Value must be a number between 1 and 1000000" << std::endl;
    return false;
  }
  out = static_cast<size_t>(*parsed);
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    headerpipe::app::AppConfig config;
    std::vector<std::string> debug_components;

    // --conf is applied first so that every other flag overrides the file
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--conf=") == 0) {
        std::string error;
        if (!headerpipe::app::LoadConfigFile(arg.substr(7), config, error)) {
          std::cerr << "Error: " << error << std::endl;
          return 1;
        }
      }
    }

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << headerpipe::GetFullVersionString() << std::endl;
        std::cout << headerpipe::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--conf=") == 0) {
        // Already applied
      } else if (arg.find("--start=") == 0) {
        if (!ParseBlockArg("start", arg.substr(8), config.start_block)) return 1;
      } else if (arg.find("--final=") == 0) {
        uint64_t final_block = 0;
        if (!ParseBlockArg("final", arg.substr(8), final_block)) return 1;
        config.final_block = final_block;
      } else if (arg.find("--slices=") == 0) {
        if (!ParseCountArg("slice count", arg.substr(9), config.max_slices)) return 1;
      } else if (arg.find("--queue=") == 0) {
        if (!ParseCountArg("queue capacity", arg.substr(8), config.send_queue_capacity)) return 1;
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=network,sync
        for (auto &component : headerpipe::util::SplitCommaList(arg.substr(8))) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    if (config.final_block && *config.final_block < config.start_block) {
      std::cerr << "Error: --final must not be below --start" << std::endl;
      return 1;
    }

    headerpipe::util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                                             config.log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        headerpipe::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        headerpipe::util::LogManager::SetComponentLevel("network", "trace");
      } else {
        headerpipe::util::LogManager::SetComponentLevel(component, "trace");
      }
    }

    int exit_code = 0;

    // Nested scope: the app (and its io thread) must be gone before
    // LogManager::Shutdown()
    {
      headerpipe::app::Application app(config);

      if (!app.initialize()) {
        LOG_APP_ERROR("Failed to initialize application");
        headerpipe::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.start()) {
        LOG_APP_ERROR("Failed to start application");
        headerpipe::util::LogManager::Shutdown();
        return 1;
      }

      // Run until the stage runs out of work or a signal arrives
      app.wait_for_shutdown();

      nlohmann::json summary = app.summary();
      std::cout << summary.dump(2) << std::endl;
      if (summary.value("failed", false)) {
        exit_code = 1;
      }
    }

    headerpipe::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    headerpipe::util::LogManager::Shutdown();
    return 1;
  }
}
