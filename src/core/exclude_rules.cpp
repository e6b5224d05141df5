#include "exclude_rules.hpp"
#include <sstream>

static bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool starts_with(const std::string &str, const std::string &prefix) {
  if (prefix.size() > str.size())
    return false;
  return str.compare(0, prefix.size(), prefix) == 0;
}

ExcludeRules::ExcludeRules(const std::vector<std::string> &patterns)
    : patterns_(patterns) {
  for (std::string pattern : patterns) {
    if (pattern.empty()) {
      continue;
    }

    if (ends_with(pattern, "/**")) {
      pattern.resize(pattern.size() - 3);
    }
    while (pattern.size() > 1 && pattern.back() == '/') {
      pattern.pop_back();
    }

    if (pattern == ".*") {
      dotfiles_ = true;
    } else if (pattern[0] == '*') {
      suffixes_.push_back(pattern.substr(1));
    } else if (pattern[0] == '/') {
      prefixes_.push_back(pattern.substr(1));
    } else {
      segments_.push_back(pattern);
    }
  }
}

std::vector<std::string> ExcludeRules::default_patterns() {
  return {"node_modules", "dist", "build", ".git", ".*",         "*.log",
          "*.tmp",        "*.swp", "*.swx", "*~",  ".DS_Store", ".env"};
}

ExcludeRules ExcludeRules::defaults() { return ExcludeRules(default_patterns()); }

bool ExcludeRules::excluded(const std::string &relative_path) const {
  std::string path = relative_path;
  for (auto &c : path) {
    if (c == '\\') {
      c = '/';
    }
  }
  while (starts_with(path, "./")) {
    path = path.substr(2);
  }

  for (const auto &prefix : prefixes_) {
    if (path == prefix || starts_with(path, prefix + "/")) {
      return true;
    }
  }

  std::string segment;
  std::istringstream stream(path);
  while (std::getline(stream, segment, '/')) {
    if (segment.empty() || segment == ".") {
      continue;
    }
    if (dotfiles_ && segment[0] == '.' && segment != "..") {
      return true;
    }
    for (const auto &name : segments_) {
      if (segment == name) {
        return true;
      }
    }
  }

  std::string filename = path.substr(path.find_last_of('/') + 1);
  for (const auto &suffix : suffixes_) {
    if (ends_with(filename, suffix)) {
      return true;
    }
  }

  return false;
}
