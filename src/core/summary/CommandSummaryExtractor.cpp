#include "SummaryExtractor.hpp"

#include <spdlog/spdlog.h>
#include <sys/wait.h>

#include <array>
#include <cstdio>

#include "core/ArchiveError.hpp"

namespace dca {

static std::string shell_quote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

Summary CommandSummaryExtractor::extract(const std::string& sourceDir) {
  const std::string cmd = command_ + " " + shell_quote(sourceDir);
  spdlog::debug("Running summary command: {}", cmd);

  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (!pipe) {
    throw ArchiveError(ErrorKind::kExtractionFailure, "Cannot run summary command '" + command_ + "'");
  }

  std::string output;
  std::array<char, 4096> buf{};
  size_t n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    output.append(buf.data(), n);
  }
  const bool readFailed = std::ferror(pipe) != 0;
  const int status = ::pclose(pipe);

  if (readFailed) {
    throw ArchiveError(ErrorKind::kExtractionFailure, "Failed reading output of '" + command_ + "'");
  }
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       "Summary command '" + command_ + "' failed on '" + sourceDir + "'");
  }
  if (output.empty()) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       "Summary command '" + command_ + "' produced no output");
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(output);
  } catch (const nlohmann::json::parse_error& e) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       std::string("invalid JSON from summary command: ") + e.what());
  }
  return summary_from_json(j);
}

} // namespace dca
