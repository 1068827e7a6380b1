/**
 * @file MetricsReport.cpp
 * @brief Implementation of the metrics CSV table and table correlation
 */

#include "MetricsReport.h"
#include "../common/NeuroQAPExceptions.h"
#include "../io/TextDataIO.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <tuple>

namespace neuroqap {
namespace temporal {

namespace {

using RowKey = std::tuple<std::string, std::string, std::string>;

RowKey KeyOf(const MetricsRow &row) {
  return RowKey(row.participant, row.session, row.series);
}

std::string Trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

struct CSVRecord {
  int line_number = 0; // Line on which the record starts, 1-based
  std::string text;
};

// Record breaks are \n, \r\n or \r outside double quotes
std::vector<CSVRecord> SplitCSVRecords(const std::string &content) {
  std::vector<CSVRecord> records;
  CSVRecord current;
  current.line_number = 1;
  int line_number = 1;
  bool in_quotes = false;

  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (c != '\r' && c != '\n') {
      if (c == '"') {
        in_quotes = !in_quotes;
      }
      current.text += c;
      continue;
    }

    std::string line_break(1, c);
    if (c == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
      line_break += '\n';
      ++i;
    }
    ++line_number;

    if (in_quotes) {
      current.text += line_break;
    } else {
      records.push_back(current);
      current.text.clear();
      current.line_number = line_number;
    }
  }

  if (!current.text.empty()) {
    records.push_back(current);
  }
  return records;
}

bool IsMissingCell(const std::string &cell) {
  std::string lowered;
  for (char c : cell) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered.empty() || lowered == "nan" || lowered == "na" ||
         lowered == "n/a";
}

std::string FormatValue(double value) {
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
  return ss.str();
}

void AddSummary(std::map<std::string, double> &values,
                const std::string &family, const SeriesSummary &summary) {
  values[family + " (Mean)"] = summary.mean;
  values[family + " (Std)"] = summary.std_dev;
  values[family + " (Percent Outliers)"] = summary.percent_outliers;
  values[family + " (IQR)"] = summary.iqr;
}

} // namespace

const std::vector<std::string> &MetricsReport::GetMetricColumns() {
  static const std::vector<std::string> columns = {
      "Timepoints",
      "RMSD (Mean)",
      "RMSD (Max)",
      "RMSD (Num High Motion)",
      "RMSD (Percent High Motion)",
      "RMSD (Percent Outliers)",
      "RMSD (IQR)",
      "Fraction of Outliers (Mean)",
      "Fraction of Outliers (Std)",
      "Fraction of Outliers (Percent Outliers)",
      "Fraction of Outliers (IQR)",
      "Quality (Mean)",
      "Quality (Std)",
      "Quality (Percent Outliers)",
      "Quality (IQR)",
      "GCOR",
      "Nuisance Mean Std",
      "SFS (Mean)"};
  return columns;
}

std::map<std::string, double>
MetricsReport::ToColumnValues(const TemporalQCMetrics &metrics) {
  std::map<std::string, double> values;

  if (metrics.num_timepoints > 0) {
    values["Timepoints"] = static_cast<double>(metrics.num_timepoints);
  }

  if (metrics.displacement) {
    const auto &fd = *metrics.displacement;
    values["RMSD (Mean)"] = fd.mean_fd;
    values["RMSD (Max)"] = fd.max_fd;
    values["RMSD (Num High Motion)"] = fd.num_fd_above_threshold;
    values["RMSD (Percent High Motion)"] = fd.percent_fd_above_threshold;
    values["RMSD (Percent Outliers)"] = fd.percent_outliers;
    values["RMSD (IQR)"] = fd.iqr;
  }

  if (metrics.outlier_fraction) {
    AddSummary(values, "Fraction of Outliers", *metrics.outlier_fraction);
  }
  if (metrics.quality) {
    AddSummary(values, "Quality", *metrics.quality);
  }

  if (metrics.voxel) {
    values["GCOR"] = metrics.voxel->gcor;
    values["Nuisance Mean Std"] = metrics.voxel->nuisance_mean_std;
    values["SFS (Mean)"] = metrics.voxel->mean_sfs;
  }

  return values;
}

void MetricsReport::WriteMetricsCSV(
    const std::string &filename, const std::vector<TemporalQCMetrics> &records) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw TextIOException(filename, "write", "cannot open file for writing");
  }

  const auto &columns = GetMetricColumns();

  file << kParticipantColumn << "," << kSessionColumn << "," << kSeriesColumn;
  for (const auto &column : columns) {
    file << "," << column;
  }
  file << "\n";

  for (const auto &record : records) {
    file << EscapeCSVField(record.participant) << ","
         << EscapeCSVField(record.session) << ","
         << EscapeCSVField(record.series);

    auto values = ToColumnValues(record);
    for (const auto &column : columns) {
      file << ",";
      auto it = values.find(column);
      if (it != values.end()) {
        file << FormatValue(it->second);
      }
    }
    file << "\n";
  }

  if (!file.good()) {
    throw TextIOException(filename, "write", "stream error");
  }
}

std::vector<MetricsRow>
MetricsReport::ReadMetricsCSV(const std::string &filename) {
  const auto records = SplitCSVRecords(io::TextDataIO::ReadTextFile(filename));

  size_t record_index = 0;
  while (record_index < records.size() &&
         Trim(records[record_index].text).empty()) {
    ++record_index;
  }
  if (record_index == records.size()) {
    throw MalformedInputException(filename, 0, "no header row");
  }

  std::vector<std::string> header = SplitCSVLine(records[record_index].text);
  for (auto &column : header) {
    column = Trim(column);
  }
  const int header_line = records[record_index].line_number;

  auto find_column = [&](const char *name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
      throw MalformedInputException(filename, header_line,
                                    std::string("missing column '") + name +
                                        "'");
    }
    return static_cast<size_t>(it - header.begin());
  };
  const size_t participant_index = find_column(kParticipantColumn);
  const size_t session_index = find_column(kSessionColumn);
  const size_t series_index = find_column(kSeriesColumn);

  std::vector<MetricsRow> rows;
  for (++record_index; record_index < records.size(); ++record_index) {
    if (Trim(records[record_index].text).empty()) {
      continue;
    }

    const int line_number = records[record_index].line_number;
    auto fields = SplitCSVLine(records[record_index].text);
    if (fields.size() != header.size()) {
      throw MalformedInputException(
          filename, line_number,
          "expected " + std::to_string(header.size()) + " fields, found " +
              std::to_string(fields.size()));
    }

    MetricsRow row;
    row.participant = Trim(fields[participant_index]);
    row.session = Trim(fields[session_index]);
    row.series = Trim(fields[series_index]);

    for (size_t i = 0; i < fields.size(); ++i) {
      if (i == participant_index || i == session_index || i == series_index) {
        continue;
      }

      const std::string cell = Trim(fields[i]);
      if (IsMissingCell(cell)) {
        continue;
      }

      auto value = io::TextDataIO::ParseFloat(cell);
      if (!value) {
        throw MalformedInputException(filename, line_number,
                                      "non-numeric value '" + cell +
                                          "' in column '" + header[i] + "'");
      }
      row.values[header[i]] = *value;
    }

    rows.push_back(std::move(row));
  }

  return rows;
}

std::vector<std::string>
MetricsReport::ReadReplacements(const std::string &filename) {
  std::vector<std::string> replacements;
  for (const auto &line :
       io::TextDataIO::SplitLines(io::TextDataIO::ReadTextFile(filename))) {
    if (!Trim(line).empty()) {
      replacements.push_back(line);
    }
  }
  return replacements;
}

void MetricsReport::ApplyReplacements(
    std::vector<MetricsRow> &rows, const std::vector<std::string> &replacements) {
  std::map<std::string, std::string> renames;
  for (const auto &line : replacements) {
    const auto comma = line.find(',');
    if (comma == std::string::npos) {
      throw ConfigurationException("replacements", line, "old_name,new_name");
    }
    const auto second_comma = line.find(',', comma + 1);
    renames[line.substr(0, comma)] =
        line.substr(comma + 1, second_comma == std::string::npos
                                   ? std::string::npos
                                   : second_comma - comma - 1);
  }

  if (renames.empty()) {
    return;
  }

  for (auto &row : rows) {
    std::map<std::string, double> renamed;
    for (const auto &entry : row.values) {
      auto it = renames.find(entry.first);
      renamed[it == renames.end() ? entry.first : it->second] = entry.second;
    }
    row.values = std::move(renamed);
  }
}

std::map<std::string, double>
MetricsReport::CorrelateMetricTables(std::vector<MetricsRow> old_rows,
                                     std::vector<MetricsRow> new_rows,
                                     const std::vector<std::string> &replacements) {
  ApplyReplacements(old_rows, replacements);
  ApplyReplacements(new_rows, replacements);

  std::multimap<RowKey, const MetricsRow *> new_index;
  for (const auto &row : new_rows) {
    new_index.emplace(KeyOf(row), &row);
  }

  // Inner join; duplicate keys pair up every combination
  std::vector<std::pair<const MetricsRow *, const MetricsRow *>> joined;
  for (const auto &row : old_rows) {
    auto range = new_index.equal_range(KeyOf(row));
    for (auto it = range.first; it != range.second; ++it) {
      joined.emplace_back(&row, it->second);
    }
  }

  std::map<std::string, std::pair<std::vector<double>, std::vector<double>>>
      paired_values;
  for (const auto &pair : joined) {
    for (const auto &entry : pair.first->values) {
      auto it = pair.second->values.find(entry.first);
      if (it != pair.second->values.end()) {
        auto &columns = paired_values[entry.first];
        columns.first.push_back(entry.second);
        columns.second.push_back(it->second);
      }
    }
  }

  std::map<std::string, double> correlations;
  for (const auto &entry : paired_values) {
    const auto &old_values = entry.second.first;
    const auto &new_values = entry.second.second;
    if (old_values.size() < 2 ||
        DistributionStatistics::PopulationStandardDeviation(old_values) == 0.0 ||
        DistributionStatistics::PopulationStandardDeviation(new_values) == 0.0) {
      continue;
    }
    correlations[entry.first] =
        DistributionStatistics::PearsonCorrelation(old_values, new_values);
  }

  return correlations;
}

std::vector<std::string> MetricsReport::SplitCSVLine(const std::string &line) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        field += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(field);
      field.clear();
    } else {
      field += c;
    }
  }
  fields.push_back(field);

  return fields;
}

std::string MetricsReport::EscapeCSVField(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }

  std::string escaped = "\"";
  for (char c : field) {
    if (c == '"') {
      escaped += '"';
    }
    escaped += c;
  }
  escaped += '"';
  return escaped;
}

} // namespace temporal
} // namespace neuroqap
