#pragma once
#include <stdexcept>
#include <string>

namespace dca {

enum class ErrorKind {
  kInvalidArgument,
  kMissingConfiguration,
  kTargetExists,
  kDirectoryUnusable,
  kInsertConflict,
  kUpdateConflict,
  kIoFailure,
  kExtractionFailure,
  kRegistryFailure,
};

// Every fatal condition of an archive run. main() maps the kind to an exit status.
class ArchiveError : public std::runtime_error {
public:
  ArchiveError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

const char* to_string(ErrorKind kind);
int exit_code_for(ErrorKind kind);

} // namespace dca
