#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/archive/ArchivePipeline.hpp"
#include "core/registry/RegistrySynchronizer.hpp"

namespace dca {

// Immutable run configuration, built once from argv and the environment.
struct ArchiveOptions {
  ArchiveRequest              request;
  std::optional<std::string>  profile;
  bool                        dbInsert = false;
  bool                        dbUpdate = false;
  std::string                 summaryCommand;
  bool                        initDb   = false;
  bool                        help     = false;

  // Registry mode when a profile is configured.
  RegistryMode registryMode() const;
};

// Reads flags, then falls back to DCA_PROFILE / DCA_SUMMARY_COMMAND.
// Throws ArchiveError(kInvalidArgument) on unknown or incomplete flags.
ArchiveOptions parse_options(const std::vector<std::string>& args);
ArchiveOptions parse_options(int argc, char** argv);

// Cross-flag and path checks. Throws ArchiveError(kInvalidArgument).
void validate_options(const ArchiveOptions& opts);

std::string usage(const std::string& argv0);

std::string get_env_or(const char* key, const std::string& defval);

} // namespace dca
