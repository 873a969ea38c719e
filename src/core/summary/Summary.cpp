#include "Summary.hpp"

#include <fstream>

#include "core/ArchiveError.hpp"

using nlohmann::json;

namespace dca {

static json date_or_null(const std::optional<Date>& d) {
  if (!d) return nullptr;
  return format_date(*d);
}

static std::optional<Date> read_date(const json& j, const char* k) {
  if (!j.contains(k) || j[k].is_null()) return std::nullopt;
  if (!j[k].is_string()) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       std::string("summary field '") + k + "' must be a string");
  }
  const std::string text = j[k].get<std::string>();
  if (text.empty()) return std::nullopt;
  auto d = parse_date(text);
  if (!d) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       std::string("summary field '") + k + "' is not a date: '" + text + "'");
  }
  return d;
}

json summary_to_json(const Summary& s) {
  json acquisitions = json::array();
  for (const auto& a : s.acquisitions) {
    acquisitions.push_back({
      {"series_uid",         a.series_uid},
      {"series_number",      a.series_number},
      {"series_description", a.series_description},
      {"modality",           a.modality},
      {"file_count",         a.file_count}
    });
  }
  json files = json::array();
  for (const auto& f : s.files) {
    files.push_back({
      {"file_name",  f.file_name},
      {"md5_sum",    f.md5_sum},
      {"series_uid", f.series_uid}
    });
  }

  return json{
    {"study_uid",  s.study_uid},
    {"scan_date",  date_or_null(s.scan_date)},
    {"patient", {
      {"id",         s.patient_id},
      {"name",       s.patient_name},
      {"sex",        s.patient_sex},
      {"birth_date", date_or_null(s.patient_birth_date)}
    }},
    {"scanner", {
      {"manufacturer",     s.scanner_manufacturer},
      {"model",            s.scanner_model},
      {"serial_number",    s.scanner_serial_number},
      {"software_version", s.scanner_software_version}
    }},
    {"institution_name", s.institution_name},
    {"acquisitions",     acquisitions},
    {"files",            files}
  };
}

Summary summary_from_json(const json& j) {
  if (!j.is_object()) {
    throw ArchiveError(ErrorKind::kExtractionFailure, "summary must be a JSON object");
  }

  try {
    Summary s;
    s.study_uid = j.value("study_uid", std::string());
    if (s.study_uid.empty()) {
      throw ArchiveError(ErrorKind::kExtractionFailure, "summary has no study_uid");
    }
    s.scan_date = read_date(j, "scan_date");

    const json patient = j.value("patient", json::object());
    s.patient_id         = patient.value("id", std::string());
    s.patient_name       = patient.value("name", std::string());
    s.patient_sex        = patient.value("sex", std::string());
    s.patient_birth_date = read_date(patient, "birth_date");

    const json scanner = j.value("scanner", json::object());
    s.scanner_manufacturer     = scanner.value("manufacturer", std::string());
    s.scanner_model            = scanner.value("model", std::string());
    s.scanner_serial_number    = scanner.value("serial_number", std::string());
    s.scanner_software_version = scanner.value("software_version", std::string());

    s.institution_name = j.value("institution_name", std::string());

    for (const auto& a : j.value("acquisitions", json::array())) {
      AcquisitionSummary acq;
      acq.series_uid         = a.value("series_uid", std::string());
      acq.series_number      = a.value("series_number", int64_t{0});
      acq.series_description = a.value("series_description", std::string());
      acq.modality           = a.value("modality", std::string());
      acq.file_count         = a.value("file_count", int64_t{0});
      s.acquisitions.push_back(std::move(acq));
    }
    for (const auto& f : j.value("files", json::array())) {
      FileSummary file;
      file.file_name  = f.value("file_name", std::string());
      file.md5_sum    = f.value("md5_sum", std::string());
      file.series_uid = f.value("series_uid", std::string());
      s.files.push_back(std::move(file));
    }
    return s;
  } catch (const json::exception& e) {
    throw ArchiveError(ErrorKind::kExtractionFailure,
                       std::string("malformed summary: ") + e.what());
  }
}

void write_summary_file(const std::string& path, const Summary& s) {
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) throw ArchiveError(ErrorKind::kIoFailure, "Cannot open summary file '" + path + "'");
  os << summary_to_json(s).dump(4) << "\n";
  os.flush();
  if (!os) throw ArchiveError(ErrorKind::kIoFailure, "Failed writing summary file '" + path + "'");
}

} // namespace dca
