/**
 * @file MetricsReport.h
 * @brief CSV table of temporal QC records and version-to-version correlation
 *
 * One row per scan keyed by Participant, Session and Series. Metric columns
 * use the QAP output names, e.g. "RMSD (Mean)" or "Fraction of Outliers
 * (Mean)"; a metric family that was not computed leaves its cells empty.
 */

#ifndef NEUROQAP_METRICS_REPORT_H
#define NEUROQAP_METRICS_REPORT_H

#include "TemporalQC.h"
#include <map>
#include <string>
#include <vector>

namespace neuroqap {
namespace temporal {

/**
 * @brief One row of a metrics table as read back from disk
 */
struct MetricsRow {
  std::string participant;
  std::string session;
  std::string series;
  std::map<std::string, double> values; // Empty cells are absent
};

class MetricsReport {
public:
  static constexpr const char *kParticipantColumn = "Participant";
  static constexpr const char *kSessionColumn = "Session";
  static constexpr const char *kSeriesColumn = "Series";

  /// Metric column names in output order.
  static const std::vector<std::string> &GetMetricColumns();

  /// Metric values of one record keyed by column name; absent families omitted.
  static std::map<std::string, double>
  ToColumnValues(const TemporalQCMetrics &metrics);

  /// @throws TextIOException if the file cannot be written
  static void WriteMetricsCSV(const std::string &filename,
                              const std::vector<TemporalQCMetrics> &records);

  /**
   * @brief Read a metrics table written by WriteMetricsCSV (or by QAP)
   *
   * Columns other than the three identifiers are read as metrics, so tables
   * from other versions with extra or renamed columns load as well. A quoted
   * field may span line breaks.
   *
   * @throws TextIOException if the file cannot be opened
   * @throws MalformedInputException on a missing identifier column, a row of
   *         the wrong width or a non-numeric metric cell
   */
  static std::vector<MetricsRow> ReadMetricsCSV(const std::string &filename);

  /// Replacement lines of a text file; blank lines skipped.
  static std::vector<std::string>
  ReadReplacements(const std::string &filename);

  /**
   * @brief Rename metric columns by "old_name,new_name" lines
   * @throws ConfigurationException on a line without a comma
   */
  static void ApplyReplacements(std::vector<MetricsRow> &rows,
                                const std::vector<std::string> &replacements);

  /**
   * @brief Pearson r of every metric shared by two metric tables
   *
   * Rows are inner-joined on Participant, Session and Series. A metric is
   * correlated over the joined rows where both tables have a value; metrics
   * with fewer than two such rows, or constant in either table, are left out.
   */
  static std::map<std::string, double>
  CorrelateMetricTables(std::vector<MetricsRow> old_rows,
                        std::vector<MetricsRow> new_rows,
                        const std::vector<std::string> &replacements = {});

  static std::vector<std::string> SplitCSVLine(const std::string &line);
  static std::string EscapeCSVField(const std::string &field);
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_METRICS_REPORT_H
