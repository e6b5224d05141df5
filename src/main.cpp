#include "core/errors.hpp"
#include "server/preview_service.hpp"
#include "utils/config.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "hotpreview - Hot-reloading preview server for many projects\n\n";
  std::cout << "Commands:\n";
  std::cout << "  hotpreview serve [config]     Serve the configured projects\n";
  std::cout << "  hotpreview check [config]     Validate the config file\n";
  std::cout << "  hotpreview --help             Show this help\n\n";
  std::cout << "The config defaults to ./hotpreview.yaml\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  fs::path config_path =
      argc > 2 ? fs::path(argv[2]) : fs::current_path() / "hotpreview.yaml";

  try {

    if (command == "serve") {
      PreviewConfig config = PreviewConfig::load(config_path);
      return start_preview_service(config);
    } else if (command == "check") {
      PreviewConfig config = PreviewConfig::load(config_path);
      int problems = check_config(config);
      if (problems > 0) {
        std::cerr << problems << " problem(s) in " << config_path.string()
                  << std::endl;
        return 1;
      }
      std::cout << config_path.string() << " is valid" << std::endl;
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
