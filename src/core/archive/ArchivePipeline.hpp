#pragma once
#include <optional>
#include <string>

#include "core/archive/ProvenanceLog.hpp"
#include "core/registry/RegistrySynchronizer.hpp"
#include "core/summary/SummaryExtractor.hpp"

namespace dca {

// Settings of one archive run, fixed before the run starts.
struct ArchiveRequest {
  std::string sourceDir;
  std::string targetDir;
  bool useToday   = false;
  bool yearBucket = false;
  bool overwrite  = false;
  bool verbose    = false;
};

// Artifact paths of one run. Only archivePath survives a successful run.
struct ArchiveBundle {
  std::string tarPath;
  std::string zipPath;
  std::string summaryPath;
  std::string logPath;
  std::string archivePath;
};

struct ArchiveResult {
  ArchiveBundle bundle;
  Summary       summary;
  ProvenanceLog log;
};

// Source dir with trailing slashes removed; its last component names every artifact.
std::string normalize_source_dir(const std::string& sourceDir);

// Intermediate paths for `baseName` under `targetDir`; archivePath is left empty.
ArchiveBundle intermediate_paths(const std::string& targetDir, const std::string& baseName);

// Removes the four intermediates; failures are warnings.
void remove_intermediates(const ArchiveBundle& bundle);

// Guard -> extract -> registry check -> pack -> hash -> compress -> hash ->
// name -> guard -> log -> seal -> hash -> cleanup -> registry write.
// Any failure throws ArchiveError; artifacts of completed stages stay on disk.
class ArchivePipeline {
public:
  ArchivePipeline(ArchiveRequest request,
                  SummaryExtractor& extractor,
                  std::optional<RegistrySynchronizer> registry = std::nullopt);

  ArchiveResult run();

private:
  void seal(const ArchiveBundle& bundle);

  ArchiveRequest request_;
  SummaryExtractor& extractor_;
  std::optional<RegistrySynchronizer> registry_;
};

} // namespace dca
