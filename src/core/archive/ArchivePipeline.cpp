#include "ArchivePipeline.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <system_error>

#include "core/ArchiveError.hpp"
#include "core/storage/ArchiveNaming.hpp"
#include "core/storage/Checksum.hpp"
#include "core/storage/GzipCompressor.hpp"
#include "core/storage/PathGuard.hpp"
#include "core/storage/TarWriter.hpp"

namespace dca {

namespace fs = std::filesystem;

static std::string base_name_of(const std::string& path) {
  return fs::path(path).filename().string();
}

std::string normalize_source_dir(const std::string& sourceDir) {
  std::string out = sourceDir;
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

ArchiveBundle intermediate_paths(const std::string& targetDir, const std::string& baseName) {
  ArchiveBundle b;
  b.tarPath     = targetDir + "/" + baseName + ".tar";
  b.zipPath     = targetDir + "/" + baseName + ".tar.gz";
  b.summaryPath = targetDir + "/" + baseName + ".meta";
  b.logPath     = targetDir + "/" + baseName + ".log";
  return b;
}

void remove_intermediates(const ArchiveBundle& bundle) {
  for (const auto* p : {&bundle.tarPath, &bundle.zipPath, &bundle.summaryPath, &bundle.logPath}) {
    std::error_code ec;
    if (!fs::remove(*p, ec)) {
      spdlog::warn("Could not remove temporary file '{}': {}", *p,
                   ec ? ec.message() : std::string("not found"));
    }
  }
}

ArchivePipeline::ArchivePipeline(ArchiveRequest request,
                                 SummaryExtractor& extractor,
                                 std::optional<RegistrySynchronizer> registry)
  : request_(std::move(request)), extractor_(extractor), registry_(std::move(registry)) {}

void ArchivePipeline::seal(const ArchiveBundle& bundle) {
  TarWriter tar(bundle.archivePath);
  tar.add(bundle.zipPath,     base_name_of(bundle.zipPath));
  tar.add(bundle.summaryPath, base_name_of(bundle.summaryPath));
  tar.add(bundle.logPath,     base_name_of(bundle.logPath));
  tar.close();
}

ArchiveResult ArchivePipeline::run() {
  const std::string source = normalize_source_dir(request_.sourceDir);
  const std::string baseName = base_name_of(source);
  if (baseName.empty() || baseName == "." || baseName == "..") {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "Cannot derive an archive name from source '" + request_.sourceDir + "'");
  }

  const PathGuard guard(request_.overwrite);
  ArchiveBundle bundle = intermediate_paths(request_.targetDir, baseName);
  guard.checkCreateFile(bundle.tarPath);
  guard.checkCreateFile(bundle.zipPath);
  guard.checkCreateFile(bundle.summaryPath);
  guard.checkCreateFile(bundle.logPath);

  spdlog::info("Extracting DICOM information (may take a long time)");
  Summary summary = extractor_.extract(source);

  if (registry_) registry_->checkPrecondition(summary.study_uid);

  spdlog::info("Copying into DICOM tar");
  pack_directory(source, bundle.tarPath);

  spdlog::info("Calculating DICOM tar MD5 sum");
  const Checksum tarball = md5_file(bundle.tarPath);

  spdlog::info("Zipping DICOM tar (may take a long time)");
  gzip_file(bundle.tarPath, bundle.zipPath);

  spdlog::info("Calculating DICOM zip MD5 sum");
  const Checksum zipball = md5_file(bundle.zipPath);

  spdlog::info("Getting DICOM scan date");
  std::optional<Date> scanDate = summary.scan_date;
  if (!scanDate && request_.useToday) scanDate = today_local();

  const ArchiveName name = resolve_archive_name(request_.targetDir, baseName, scanDate,
                                                request_.useToday, request_.yearBucket);
  for (const auto& advisory : name.advisories) spdlog::warn("{}", advisory);
  if (name.yearBucket) guard.ensureDirectory(name.directory);

  bundle.archivePath = name.path();
  guard.checkCreateFile(bundle.archivePath);

  ProvenanceLog log = make_provenance_log(source, bundle.archivePath, tarball, zipball);

  if (request_.verbose) {
    std::cout << "The archive will be created with the following arguments:\n"
              << log_to_string(log) << std::flush;
  }

  spdlog::info("Writing summary file");
  write_summary_file(bundle.summaryPath, summary);

  spdlog::info("Writing log file");
  write_log_file(bundle.logPath, log);

  spdlog::info("Copying into DICOM archive");
  seal(bundle);

  spdlog::info("Calculating DICOM archive MD5 sum");
  log.archive_checksum = md5_file(bundle.archivePath);

  spdlog::info("Removing temporary files");
  remove_intermediates(bundle);

  if (registry_) registry_->commit(log, summary);

  spdlog::info("Success");
  return ArchiveResult{bundle, std::move(summary), std::move(log)};
}

} // namespace dca
