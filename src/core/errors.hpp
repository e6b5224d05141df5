#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base of every error the preview core reports to its callers.
class PreviewError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;

  // True when the same call may succeed later without changing its input.
  virtual bool retryable() const { return false; }
};

// Invalid project descriptor: root missing, inaccessible or denied.
class ConfigurationError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

// The watch could not be established or its root became unreadable.
class WatchError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

// Compile step failed, timed out or could not be spawned.
class BuildError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

// Request denied by the access policy or escaping the project root.
class ServeError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

// No free port or channel slot left.
class ResourceExhaustion : public PreviewError {
public:
  using PreviewError::PreviewError;

  bool retryable() const override { return true; }
};

// The service itself cannot run, e.g. the gateway port cannot be bound.
class StartupError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

class NotFoundError : public PreviewError {
public:
  using PreviewError::PreviewError;
};

#endif
