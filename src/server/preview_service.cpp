#include "preview_service.hpp"
#include "core/access_policy.hpp"
#include "core/errors.hpp"
#include "core/preview_registry.hpp"
#include "server/preview_gateway.hpp"
#include "utils/log.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

namespace {

void print_row(const std::string &label, const std::string &value) {
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << std::setw(12) << std::left << label << termcolor::bright_white
            << std::setw(28) << std::left << value << termcolor::reset
            << termcolor::bright_green << "║" << termcolor::reset << "\n";
}

} // namespace

int start_preview_service(const PreviewConfig &config) {
  auto total_start = std::chrono::high_resolution_clock::now();

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 Starting Preview Service        ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  PathAccessPolicy policy(config.allowed_paths, config.blocked_paths);
  PreviewRegistry registry(config, policy);
  PreviewGateway gateway(registry, {config.host, config.gateway_port});

  std::cout << termcolor::bright_cyan << "🔌 Starting gateway..."
            << termcolor::reset << "\n";

  try {
    gateway.start();
  } catch (const PreviewError &e) {
    log_error(e.what());
    return 1;
  }

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Registering projects"
            << termcolor::reset << "\n";

  int registered = 0;
  for (const auto &project : config.projects) {
    try {
      registry.register_project(project);
      registered++;
    } catch (const PreviewError &e) {
      std::cout << termcolor::bright_yellow << "  ⚠ " << termcolor::reset
                << "Skipping " << termcolor::bright_blue
                << (project.id.empty() ? project.root.string() : project.id)
                << termcolor::reset << " (" << e.what() << ")\n";
    }
  }

  auto total_end = std::chrono::high_resolution_clock::now();
  auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      total_end - total_start);

  auto sessions = registry.list();
  if (!sessions.empty()) {
    std::cout << "\n"
              << termcolor::bright_cyan << "📄 Previews" << termcolor::reset
              << "\n";
  }
  for (const auto &session : sessions) {
    std::cout << termcolor::bright_blue << "  → " << termcolor::reset
              << termcolor::cyan << std::setw(24) << std::left
              << session.project_name << termcolor::reset
              << termcolor::bright_white << session.base_url
              << termcolor::reset << termcolor::bright_blue << " ("
              << to_string(session.status) << ")" << termcolor::reset << "\n";
  }

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Service Ready!               ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  print_row("Control:", gateway.http_url() + "/projects");
  print_row("WebSocket:", gateway.ws_url());
  print_row("Projects:", std::to_string(registered) + " of " +
                             std::to_string(config.projects.size()));
  print_row("Debounce:", std::to_string(config.debounce_window.count()) + "ms");
  print_row("Started in:", std::to_string(total_duration.count()) + "ms");
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  std::cout << termcolor::bright_blue << "Press ENTER to stop server..."
            << termcolor::reset << "\n\n";

  std::cin.get();

  std::cout << "\n"
            << termcolor::bright_yellow << "⏳ Shutting down..."
            << termcolor::reset << "\n";

  // Project channels get their farewell before the gateway goes away.
  registry.shutdown();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  gateway.stop();

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Preview service stopped cleanly\n\n";
  return 0;
}

int check_config(const PreviewConfig &config) {
  PathAccessPolicy policy(config.allowed_paths, config.blocked_paths);
  int problems = 0;

  if (config.debounce_window.count() == 0) {
    log_warn("debounce_ms is 0, every settled change rebuilds");
  }
  if (config.mailbox_capacity == 0) {
    log_error("mailbox_capacity must be at least 1");
    problems++;
  }
  if (config.max_channels == 0) {
    log_error("max_channels must be at least 1");
    problems++;
  }

  for (const auto &project : config.projects) {
    std::string label = project.id.empty() ? project.root.string() : project.id;
    try {
      Project checked = PreviewRegistry::validate(project, policy);
      log_ok(label + " → " + checked.root.string());
    } catch (const PreviewError &e) {
      log_error(label + ": " + e.what());
      problems++;
    }
  }

  if (config.projects.empty()) {
    log_warn("No projects configured; register them through POST /projects");
  }
  return problems;
}
