#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "core/errors.hpp"
#include "core/exclude_rules.hpp"
#include "core/project.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class PreviewConfig {
private:
  static std::chrono::milliseconds millis(const YAML::Node &node,
                                          std::chrono::milliseconds fallback) {
    if (!node) {
      return fallback;
    }
    long value = node.as<long>();
    if (value < 0) {
      throw ConfigurationError("Durations must not be negative");
    }
    return std::chrono::milliseconds(value);
  }

  static std::vector<std::string> string_list(const YAML::Node &node) {
    std::vector<std::string> items;
    if (!node) {
      return items;
    }
    if (!node.IsSequence()) {
      throw ConfigurationError("Expected a list");
    }
    for (const auto &item : node) {
      items.push_back(item.as<std::string>());
    }
    return items;
  }

  static fs::path resolve_path(const std::string &value, const fs::path &base_dir) {
    fs::path path(value);
    if (path.is_relative()) {
      path = base_dir / path;
    }
    return path.lexically_normal();
  }

public:
  std::string host = "127.0.0.1";
  int gateway_port = 3001;

  std::chrono::milliseconds debounce_window{300};
  std::chrono::milliseconds settle_window{100};
  std::chrono::milliseconds compile_timeout{30000};
  std::chrono::milliseconds proxy_timeout{10000};

  std::size_t max_error_bytes = 4096;
  std::size_t mailbox_capacity = 64;
  std::size_t max_channels = 50;

  bool inject_livereload = true;
  bool quiet = false;

  std::vector<std::string> exclude = ExcludeRules::default_patterns();

  std::vector<fs::path> allowed_paths;
  std::vector<fs::path> blocked_paths;

  std::vector<Project> projects;

  static Project parse_project(const YAML::Node &node, const fs::path &base_dir) {
    if (!node.IsMap()) {
      throw ConfigurationError("Each project must be a map");
    }

    Project project;
    if (node["id"])
      project.id = node["id"].as<std::string>();
    if (node["name"])
      project.name = node["name"].as<std::string>();
    if (!node["root"]) {
      throw ConfigurationError("Project '" + project.id + "' has no root");
    }
    project.root = resolve_path(node["root"].as<std::string>(), base_dir);
    if (node["entry"])
      project.entry_document = node["entry"].as<std::string>();

    if (node["proxy"]) {
      for (const auto &rule : node["proxy"]) {
        if (!rule["prefix"] || !rule["target"]) {
          throw ConfigurationError("Proxy rules need 'prefix' and 'target'");
        }
        project.proxy_rules.push_back(
            {rule["prefix"].as<std::string>(), rule["target"].as<std::string>()});
      }
    }

    if (node["compile"]) {
      const auto &compile = node["compile"];
      if (!compile["command"]) {
        throw ConfigurationError("Compile step of '" + project.id +
                                 "' has no command");
      }
      CompileStep step;
      step.command = compile["command"].as<std::string>();
      step.working_dir =
          compile["working_dir"]
              ? resolve_path(compile["working_dir"].as<std::string>(), base_dir)
              : project.root;
      step.timeout = millis(compile["timeout_ms"], std::chrono::milliseconds(0));
      project.compile_step = step;
    }

    return project;
  }

  static PreviewConfig load(const fs::path &config_path) {
    PreviewConfig config;

    if (!fs::exists(config_path)) {
      throw ConfigurationError("Config file not found: " + config_path.string());
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigurationError("YAML parsing error: " + std::string(e.what()));
    }

    fs::path base_dir = fs::absolute(config_path).parent_path();

    try {
      if (yaml["host"])
        config.host = yaml["host"].as<std::string>();
      if (yaml["gateway_port"])
        config.gateway_port = yaml["gateway_port"].as<int>();

      config.debounce_window = millis(yaml["debounce_ms"], config.debounce_window);
      config.settle_window = millis(yaml["settle_ms"], config.settle_window);
      config.compile_timeout =
          millis(yaml["compile_timeout_ms"], config.compile_timeout);
      config.proxy_timeout = millis(yaml["proxy_timeout_ms"], config.proxy_timeout);

      if (yaml["max_error_bytes"])
        config.max_error_bytes = yaml["max_error_bytes"].as<std::size_t>();
      if (yaml["mailbox_capacity"])
        config.mailbox_capacity = yaml["mailbox_capacity"].as<std::size_t>();
      if (yaml["max_channels"])
        config.max_channels = yaml["max_channels"].as<std::size_t>();

      if (yaml["inject_livereload"])
        config.inject_livereload = yaml["inject_livereload"].as<bool>();
      if (yaml["quiet"])
        config.quiet = yaml["quiet"].as<bool>();

      if (yaml["exclude"])
        config.exclude = string_list(yaml["exclude"]);

      if (yaml["access"]) {
        for (const auto &path : string_list(yaml["access"]["allowed"])) {
          config.allowed_paths.push_back(resolve_path(path, base_dir));
        }
        for (const auto &path : string_list(yaml["access"]["blocked"])) {
          config.blocked_paths.push_back(resolve_path(path, base_dir));
        }
      }

      if (yaml["projects"]) {
        for (const auto &node : yaml["projects"]) {
          config.projects.push_back(parse_project(node, base_dir));
        }
      }
    } catch (const YAML::Exception &e) {
      throw ConfigurationError("Invalid config " + config_path.string() + ": " +
                               e.what());
    }

    if (config.gateway_port < 0 || config.gateway_port > 65535) {
      throw ConfigurationError("gateway_port out of range");
    }

    return config;
  }
};

#endif
