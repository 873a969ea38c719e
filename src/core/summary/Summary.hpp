#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Date.hpp"

namespace dca {

struct AcquisitionSummary {
  std::string series_uid;
  int64_t     series_number = 0;
  std::string series_description;
  std::string modality;
  int64_t     file_count = 0;
};

struct FileSummary {
  std::string file_name;
  std::string md5_sum;
  std::string series_uid;
};

// Study description produced by the metadata extraction service.
struct Summary {
  std::string          study_uid;
  std::optional<Date>  scan_date;

  std::string          patient_id;
  std::string          patient_name;
  std::string          patient_sex;
  std::optional<Date>  patient_birth_date;

  std::string          scanner_manufacturer;
  std::string          scanner_model;
  std::string          scanner_serial_number;
  std::string          scanner_software_version;
  std::string          institution_name;

  std::vector<AcquisitionSummary> acquisitions;
  std::vector<FileSummary>        files;
};

nlohmann::json summary_to_json(const Summary& s);

// Throws ArchiveError(kExtractionFailure) when study_uid is missing or a
// field has the wrong type.
Summary summary_from_json(const nlohmann::json& j);

// Writes the .meta artifact. Throws ArchiveError(kIoFailure).
void write_summary_file(const std::string& path, const Summary& s);

} // namespace dca
