#include "access_policy.hpp"

const char *to_string(AccessOperation operation) {
  return operation == AccessOperation::Watch ? "watch" : "read";
}

PathAccessPolicy::PathAccessPolicy(std::vector<fs::path> allowed,
                                   std::vector<fs::path> blocked)
    : allowed_(std::move(allowed)), blocked_(std::move(blocked)) {
  for (auto &path : allowed_) {
    path = path.lexically_normal();
  }
  for (auto &path : blocked_) {
    path = path.lexically_normal();
  }
}

bool PathAccessPolicy::is_within(const fs::path &path, const fs::path &root) {
  auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
  if (rel.empty()) {
    return false;
  }
  return *rel.begin() != "..";
}

bool PathAccessPolicy::can_access(const fs::path &absolute_path,
                                  AccessOperation operation) const {
  (void)operation;

  if (!absolute_path.is_absolute()) {
    return false;
  }

  for (const auto &blocked : blocked_) {
    if (is_within(absolute_path, blocked)) {
      return false;
    }
  }

  if (allowed_.empty()) {
    return true;
  }

  for (const auto &allowed : allowed_) {
    if (is_within(absolute_path, allowed)) {
      return true;
    }
  }
  return false;
}
