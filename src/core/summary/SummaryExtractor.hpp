#pragma once
#include <string>

#include "Summary.hpp"

namespace dca {

// Metadata extraction service: reads a DICOM directory and describes the study.
class SummaryExtractor {
public:
  virtual ~SummaryExtractor() = default;
  virtual Summary extract(const std::string& sourceDir) = 0;
};

// Runs `<command> <sourceDir>` and parses the JSON summary the command prints.
class CommandSummaryExtractor : public SummaryExtractor {
public:
  explicit CommandSummaryExtractor(std::string command)
    : command_(std::move(command)) {}

  Summary extract(const std::string& sourceDir) override;

private:
  std::string command_;
};

} // namespace dca
