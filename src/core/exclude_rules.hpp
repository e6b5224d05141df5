#ifndef EXCLUDE_RULES_HPP
#define EXCLUDE_RULES_HPP

#include <string>
#include <vector>

// Glob-like exclusions evaluated against project relative paths:
//   "*.log"         file name suffix
//   ".*"            any dotfile or dot directory
//   "/build"        path prefix anchored at the project root
//   "node_modules"  any path segment with that exact name
//   "dist/**"       same as "dist"
class ExcludeRules {
public:
  ExcludeRules() = default;
  explicit ExcludeRules(const std::vector<std::string> &patterns);

  static std::vector<std::string> default_patterns();
  static ExcludeRules defaults();

  bool excluded(const std::string &relative_path) const;

  const std::vector<std::string> &patterns() const { return patterns_; }

private:
  std::vector<std::string> patterns_;
  std::vector<std::string> segments_;
  std::vector<std::string> prefixes_;
  std::vector<std::string> suffixes_;
  bool dotfiles_ = false;
};

#endif
