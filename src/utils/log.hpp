#ifndef LOG_HPP
#define LOG_HPP

#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <termcolor/termcolor.hpp>

using Color = std::ostream &(*)(std::ostream &);

// Worker threads of every project write to the same console.
inline std::mutex &log_mutex() {
  static std::mutex mutex;
  return mutex;
}

inline std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  return ss.str();
}

inline void log_ok(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset << message
            << "\n";
}

inline void log_warn(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cout << termcolor::bright_yellow << "⚠ " << termcolor::reset << message
            << "\n";
}

inline void log_error(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << termcolor::bright_red << "✗ " << termcolor::reset
            << termcolor::bright_white << message << termcolor::reset << "\n";
}

// "12:04:55 📡 Broadcast rebuild-complete to 2 clients"
inline void log_event(Color color, const std::string &tag,
                      const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cout << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << color << tag << termcolor::reset << " " << message
            << "\n";
}

inline void log_request(const std::string &project_id,
                        const std::string &method, const std::string &path,
                        int status, std::size_t bytes) {
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cout << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::magenta << "[" << project_id << "]"
            << termcolor::reset << " " << termcolor::bright_cyan << method
            << termcolor::reset << " " << termcolor::white << std::setw(30)
            << std::left << path << termcolor::reset << " ";

  if (status >= 200 && status < 300) {
    std::cout << termcolor::bright_green;
  } else if (status >= 300 && status < 400) {
    std::cout << termcolor::bright_blue;
  } else if (status >= 400 && status < 500) {
    std::cout << termcolor::bright_yellow;
  } else {
    std::cout << termcolor::bright_red;
  }

  std::cout << status << termcolor::reset << " " << termcolor::bright_blue
            << bytes << "B" << termcolor::reset << "\n";
}

#endif
