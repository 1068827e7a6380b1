/**
 * @file DistributionStatistics.h
 * @brief Distribution summaries of per-timepoint scalar series
 *
 * Percentiles use linear interpolation between closest ranks (Hyndman and
 * Fan type 7): the p-th percentile of n sorted values sits at position
 * p / 100 * (n - 1).
 */

#ifndef NEUROQAP_DISTRIBUTION_STATISTICS_H
#define NEUROQAP_DISTRIBUTION_STATISTICS_H

#include <cstddef>
#include <vector>

namespace neuroqap {
namespace temporal {

/**
 * @brief Tukey fence outlier summary
 */
struct OutlierStatistics {
  double percent_outliers = 0.0; // Fraction in [0, 1], not a percentage
  double iqr = 0.0;
  double first_quartile = 0.0;
  double third_quartile = 0.0;
  size_t num_outliers = 0;
};

/**
 * @brief The mean / std / percent outliers / IQR family reported per series
 */
struct SeriesSummary {
  double mean = 0.0;
  double std_dev = 0.0;
  double percent_outliers = 0.0;
  double iqr = 0.0;
};

class DistributionStatistics {
public:
  static constexpr double kDefaultIQRMultiplier = 1.5;

  /**
   * @brief Fraction of values outside [Q1 - k IQR, Q3 + k IQR]
   * @throws NumericException if @p values is empty
   */
  static OutlierStatistics
  ComputeOutlierStatistics(const std::vector<double> &values,
                           double iqr_multiplier = kDefaultIQRMultiplier);

  /// @p percentile in [0, 100]; throws NumericException on empty input.
  static double Percentile(const std::vector<double> &values,
                           double percentile);

  /// Percentile of values that are already sorted ascending.
  static double SortedPercentile(const std::vector<double> &sorted_values,
                                 double percentile);

  static double Mean(const std::vector<double> &values);

  /// Divides by n, not n - 1.
  static double PopulationStandardDeviation(const std::vector<double> &values);

  /**
   * @brief Pearson product-moment correlation
   * @throws NumericException on length mismatch, fewer than two values or a
   *         constant input
   */
  static double PearsonCorrelation(const std::vector<double> &x,
                                   const std::vector<double> &y);

  static SeriesSummary
  SummarizeSeries(const std::vector<double> &values,
                  double iqr_multiplier = kDefaultIQRMultiplier);
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_DISTRIBUTION_STATISTICS_H
