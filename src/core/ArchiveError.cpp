#include "ArchiveError.hpp"

namespace dca {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidArgument:      return "invalid argument";
    case ErrorKind::kMissingConfiguration: return "missing configuration";
    case ErrorKind::kTargetExists:         return "target exists";
    case ErrorKind::kDirectoryUnusable:    return "directory unusable";
    case ErrorKind::kInsertConflict:       return "insert conflict";
    case ErrorKind::kUpdateConflict:       return "update conflict";
    case ErrorKind::kIoFailure:            return "I/O failure";
    case ErrorKind::kExtractionFailure:    return "extraction failure";
    case ErrorKind::kRegistryFailure:      return "registry failure";
  }
  return "unknown";
}

int exit_code_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidArgument:      return 3;
    case ErrorKind::kMissingConfiguration: return 4;
    case ErrorKind::kTargetExists:         return 5;
    case ErrorKind::kDirectoryUnusable:    return 6;
    case ErrorKind::kInsertConflict:       return 7;
    case ErrorKind::kUpdateConflict:       return 8;
    case ErrorKind::kIoFailure:            return 9;
    case ErrorKind::kExtractionFailure:    return 10;
    case ErrorKind::kRegistryFailure:      return 11;
  }
  return 2;
}

} // namespace dca
