/**
 * @file DistributionStatistics.cpp
 * @brief Implementation of distribution summaries
 */

#include "DistributionStatistics.h"
#include "../common/NeuroQAPExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>

namespace neuroqap {
namespace temporal {

OutlierStatistics
DistributionStatistics::ComputeOutlierStatistics(const std::vector<double> &values,
                                                 double iqr_multiplier) {
  if (values.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "ComputeOutlierStatistics",
                           "percentiles of an empty vector are undefined");
  }

  std::vector<double> sorted_values(values);
  std::sort(sorted_values.begin(), sorted_values.end());

  OutlierStatistics stats;
  stats.first_quartile = SortedPercentile(sorted_values, 25.0);
  stats.third_quartile = SortedPercentile(sorted_values, 75.0);
  stats.iqr = stats.third_quartile - stats.first_quartile;

  const double low_threshold = stats.first_quartile - iqr_multiplier * stats.iqr;
  const double high_threshold = stats.third_quartile + iqr_multiplier * stats.iqr;

  stats.num_outliers = static_cast<size_t>(std::count_if(
      sorted_values.begin(), sorted_values.end(), [&](double value) {
        return value < low_threshold || value > high_threshold;
      }));

  stats.percent_outliers =
      static_cast<double>(stats.num_outliers) / sorted_values.size();

  return stats;
}

double DistributionStatistics::Percentile(const std::vector<double> &values,
                                          double percentile) {
  if (values.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput, "Percentile");
  }

  std::vector<double> sorted_values(values);
  std::sort(sorted_values.begin(), sorted_values.end());
  return SortedPercentile(sorted_values, percentile);
}

double
DistributionStatistics::SortedPercentile(const std::vector<double> &sorted_values,
                                         double percentile) {
  if (sorted_values.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "SortedPercentile");
  }
  if (!(percentile >= 0.0 && percentile <= 100.0)) {
    throw NumericException(NumericException::Reason::DegeneratePercentile,
                           "SortedPercentile",
                           "percentile " + std::to_string(percentile) +
                               " outside [0, 100]");
  }

  const double position = percentile / 100.0 * (sorted_values.size() - 1);
  const size_t lower = static_cast<size_t>(std::floor(position));
  const size_t upper = std::min(lower + 1, sorted_values.size() - 1);
  const double fraction = position - lower;

  return sorted_values[lower] +
         fraction * (sorted_values[upper] - sorted_values[lower]);
}

double DistributionStatistics::Mean(const std::vector<double> &values) {
  if (values.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput, "Mean");
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double DistributionStatistics::PopulationStandardDeviation(
    const std::vector<double> &values) {
  const double mean = Mean(values);

  double variance = 0.0;
  for (double value : values) {
    variance += (value - mean) * (value - mean);
  }
  variance /= values.size();

  return std::sqrt(variance);
}

double DistributionStatistics::PearsonCorrelation(const std::vector<double> &x,
                                                  const std::vector<double> &y) {
  if (x.size() != y.size()) {
    throw NumericException(NumericException::Reason::LengthMismatch,
                           "PearsonCorrelation",
                           std::to_string(x.size()) + " vs " +
                               std::to_string(y.size()) + " values");
  }
  if (x.size() < 2) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "PearsonCorrelation", "need at least two pairs");
  }

  const double mean_x = Mean(x);
  const double mean_y = Mean(y);

  double sxy = 0.0;
  double sxx = 0.0;
  double syy = 0.0;
  for (size_t i = 0; i < x.size(); ++i) {
    const double dx = x[i] - mean_x;
    const double dy = y[i] - mean_y;
    sxy += dx * dy;
    sxx += dx * dx;
    syy += dy * dy;
  }

  if (sxx == 0.0 || syy == 0.0) {
    throw NumericException(NumericException::Reason::ZeroVariance,
                           "PearsonCorrelation");
  }

  return sxy / std::sqrt(sxx * syy);
}

SeriesSummary
DistributionStatistics::SummarizeSeries(const std::vector<double> &values,
                                        double iqr_multiplier) {
  SeriesSummary summary;
  summary.mean = Mean(values);
  summary.std_dev = PopulationStandardDeviation(values);

  auto outliers = ComputeOutlierStatistics(values, iqr_multiplier);
  summary.percent_outliers = outliers.percent_outliers;
  summary.iqr = outliers.iqr;

  return summary;
}

} // namespace temporal
} // namespace neuroqap
