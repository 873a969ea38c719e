// src/main.cpp
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config/Options.hpp"
#include "config/Profile.hpp"
#include "core/ArchiveError.hpp"
#include "core/archive/ArchivePipeline.hpp"
#include "core/registry/ArchiveRegistry.hpp"
#include "core/registry/InitDb.hpp"
#include "core/summary/SummaryExtractor.hpp"

// ---------- helpers ----------

static void setup_logging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("dicom-archive");
  logger->set_pattern("%^%l%$: %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

// Command line wins, then the profile, then the built-in default.
static std::string summary_command_for(const dca::ArchiveOptions& opts,
                                       const std::optional<dca::Profile>& profile) {
  if (!opts.summaryCommand.empty()) return opts.summaryCommand;
  if (profile && profile->summaryCommand) return *profile->summaryCommand;
  return "dicom_summary";
}

static int run(const dca::ArchiveOptions& opts) {
  dca::validate_options(opts);

  std::optional<dca::Profile> profile;
  if (opts.profile) profile = dca::load_profile(*opts.profile);

  if (opts.initDb) {
    dca::initDatabase(profile->databasePath, dca::find_schema_path(*profile));
    std::cout << "Registry initialized at: " << profile->databasePath << "\n";
    return 0;
  }

  // Registry is opened only when a profile is configured.
  std::unique_ptr<dca::ArchiveRegistry> registry;
  std::optional<dca::RegistrySynchronizer> sync;
  if (profile) {
    const dca::RegistryMode mode = opts.registryMode();
    if (mode == dca::RegistryMode::kCheckOnly) {
      // Lookup only: leave the registry file and its schema untouched.
      registry = std::make_unique<dca::ArchiveRegistry>(profile->databasePath, true);
    } else {
      dca::initDatabase(profile->databasePath, dca::find_schema_path(*profile));
      registry = std::make_unique<dca::ArchiveRegistry>(profile->databasePath);
    }
    sync.emplace(*registry, mode);
  }

  dca::CommandSummaryExtractor extractor(summary_command_for(opts, profile));
  dca::ArchivePipeline pipeline(opts.request, extractor, sync);
  pipeline.run();
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const dca::ArchiveOptions opts = dca::parse_options(argc, argv);
    if (opts.help) {
      std::cout << dca::usage(argv[0]);
      return 0;
    }
    setup_logging(opts.request.verbose);
    return run(opts);
  } catch (const dca::ArchiveError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return dca::exit_code_for(e.kind());
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
