#ifndef ACCESS_POLICY_HPP
#define ACCESS_POLICY_HPP

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

enum class AccessOperation { Watch, Read };

const char *to_string(AccessOperation operation);

// Decides whether a path may be watched or served. Consulted before any
// file handle or socket is opened for it.
class AccessPolicy {
public:
  virtual ~AccessPolicy() = default;

  virtual bool can_access(const fs::path &absolute_path,
                          AccessOperation operation) const = 0;
};

// Prefix based policy: a blocked prefix always wins, an empty allow list
// allows everything that is not blocked.
class PathAccessPolicy : public AccessPolicy {
public:
  PathAccessPolicy(std::vector<fs::path> allowed, std::vector<fs::path> blocked);

  bool can_access(const fs::path &absolute_path,
                  AccessOperation operation) const override;

  static bool is_within(const fs::path &path, const fs::path &root);

private:
  std::vector<fs::path> allowed_;
  std::vector<fs::path> blocked_;
};

#endif
