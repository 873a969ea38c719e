#include "Options.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "core/ArchiveError.hpp"

namespace dca {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

RegistryMode ArchiveOptions::registryMode() const {
  if (dbInsert) return RegistryMode::kInsert;
  if (dbUpdate) return RegistryMode::kUpdate;
  return RegistryMode::kCheckOnly;
}

ArchiveOptions parse_options(const std::vector<std::string>& args) {
  ArchiveOptions o;
  std::vector<std::string> positional;

  auto value_of = [&](size_t& i) -> std::string {
    if (i + 1 >= args.size()) {
      throw ArchiveError(ErrorKind::kInvalidArgument, "Option '" + args[i] + "' requires a value.");
    }
    return args[++i];
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if      (a == "--profile")         o.profile = value_of(i);
    else if (a == "--source")          o.request.sourceDir = value_of(i);
    else if (a == "--target")          o.request.targetDir = value_of(i);
    else if (a == "--summary-command") o.summaryCommand = value_of(i);
    else if (a == "--today")           o.request.useToday = true;
    else if (a == "--year")            o.request.yearBucket = true;
    else if (a == "--overwrite")       o.request.overwrite = true;
    else if (a == "--verbose")         o.request.verbose = true;
    else if (a == "--db-insert")       o.dbInsert = true;
    else if (a == "--db-update")       o.dbUpdate = true;
    else if (a == "--init-db")         o.initDb = true;
    else if (a == "--help" || a == "-h") o.help = true;
    else if (a.size() > 1 && a[0] == '-') {
      throw ArchiveError(ErrorKind::kInvalidArgument, "Unknown option '" + a + "'.");
    } else {
      positional.push_back(a);
    }
  }

  for (const auto& p : positional) {
    if (o.request.sourceDir.empty())      o.request.sourceDir = p;
    else if (o.request.targetDir.empty()) o.request.targetDir = p;
    else throw ArchiveError(ErrorKind::kInvalidArgument, "Unexpected argument '" + p + "'.");
  }

  if (!o.profile) {
    const std::string envProfile = get_env_or("DCA_PROFILE", "");
    if (!envProfile.empty()) o.profile = envProfile;
  }
  if (o.summaryCommand.empty()) {
    o.summaryCommand = get_env_or("DCA_SUMMARY_COMMAND", "");
  }
  return o;
}

ArchiveOptions parse_options(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return parse_options(args);
}

void validate_options(const ArchiveOptions& opts) {
  namespace fs = std::filesystem;

  if (opts.dbInsert && opts.dbUpdate) {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "Arguments '--db-insert' and '--db-update' must not be set both at the same time.");
  }
  if ((opts.dbInsert || opts.dbUpdate || opts.initDb) && !opts.profile) {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "Argument '--profile' must be set when a '--db-*' argument is set.");
  }
  if (opts.initDb) return;

  const std::string& source = opts.request.sourceDir;
  std::error_code ec;
  if (source.empty() || !fs::is_directory(source, ec) || ::access(source.c_str(), R_OK | X_OK) != 0) {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "Argument '--source' must be a readable directory path.");
  }
  const std::string& target = opts.request.targetDir;
  if (target.empty() || !fs::is_directory(target, ec) || ::access(target.c_str(), W_OK) != 0) {
    throw ArchiveError(ErrorKind::kInvalidArgument,
                       "Argument '--target' must be a writable directory path.");
  }
}

std::string usage(const std::string& argv0) {
  std::ostringstream oss;
  oss << "Usage:\n"
      << "  " << argv0 << " [options] --source <dicom dir> --target <archive dir>\n"
      << "  " << argv0 << " --profile <file> --init-db\n"
      << "\n"
      << "Read a DICOM directory, process it into a structured and compressed archive,\n"
      << "and optionally insert it or update it in the archive registry.\n"
      << "\n"
      << "  --profile <file>          registry profile under $DCA_CONFIG/.dicom_archive (DCA_PROFILE)\n"
      << "  --source <dir>            source DICOM directory\n"
      << "  --target <dir>            target directory for the DICOM archive\n"
      << "  --summary-command <cmd>   metadata extraction command (DCA_SUMMARY_COMMAND)\n"
      << "  --today                   use today's date when no scan date is found\n"
      << "  --year                    create the archive in a year subdirectory\n"
      << "  --overwrite               overwrite existing output files\n"
      << "  --db-insert               insert the archive in the registry (study must be absent)\n"
      << "  --db-update               update the archive in the registry (study must be present)\n"
      << "  --init-db                 create/upgrade the registry schema and exit\n"
      << "  --verbose                 print the archiving log before writing\n";
  return oss.str();
}

} // namespace dca
