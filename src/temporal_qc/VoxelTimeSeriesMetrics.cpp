/**
 * @file VoxelTimeSeriesMetrics.cpp
 * @brief Implementation of whole-brain time series reductions
 */

#include "VoxelTimeSeriesMetrics.h"
#include "../common/NeuroQAPExceptions.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace neuroqap {
namespace temporal {

namespace {

struct MomentPair {
  double mean = 0.0;
  double std_dev = 0.0;
};

MomentPair ComputeMoments(const std::vector<double> &series) {
  MomentPair moments;
  for (double value : series) {
    moments.mean += value;
  }
  moments.mean /= series.size();

  double variance = 0.0;
  for (double value : series) {
    variance += (value - moments.mean) * (value - moments.mean);
  }
  moments.std_dev = std::sqrt(variance / series.size());

  return moments;
}

} // namespace

VoxelTimeSeriesMetrics::MapType
VoxelTimeSeriesMetrics::ComputeTemporalStdMap(const MaskedVoxelSeries &series) {
  MapType std_map(series.GetSize());
  std_map.Fill(0.0);

  for (size_t index : series.GetMaskedIndices()) {
    std_map[index] = ComputeMoments(series.GetVoxelTimeSeries(index)).std_dev;
  }

  return std_map;
}

VoxelTimeSeriesMetrics::MapType
VoxelTimeSeriesMetrics::ComputeTemporalMeanImage(const MaskedVoxelSeries &series) {
  MapType mean_image(series.GetSize());
  mean_image.Fill(0.0);

  for (size_t index : series.GetMaskedIndices()) {
    mean_image[index] = ComputeMoments(series.GetVoxelTimeSeries(index)).mean;
  }

  return mean_image;
}

double
VoxelTimeSeriesMetrics::ComputeGlobalCorrelation(const MaskedVoxelSeries &series,
                                                 ZeroVariancePolicy policy) {
  const size_t num_timepoints = series.GetNumberOfTimepoints();
  std::vector<double> average(num_timepoints, 0.0);
  size_t num_included = 0;

  for (size_t index : series.GetMaskedIndices()) {
    auto voxel_series = series.GetVoxelTimeSeries(index);
    auto moments = ComputeMoments(voxel_series);
    if (!std::isfinite(moments.mean) || !std::isfinite(moments.std_dev)) {
      throw NumericException(NumericException::Reason::NonFiniteResult,
                             "ComputeGlobalCorrelation",
                             "voxel " + std::to_string(index) +
                                 " has a non-finite mean or std");
    }

    if (HasZeroVariance(moments.mean, moments.std_dev)) {
      if (policy == ZeroVariancePolicy::Fail) {
        auto voxel = series.GetMask().LinearToIndex(index);
        throw NumericException(NumericException::Reason::ZeroVariance,
                               "ComputeGlobalCorrelation",
                               "voxel (" + std::to_string(voxel[0]) + ", " +
                                   std::to_string(voxel[1]) + ", " +
                                   std::to_string(voxel[2]) +
                                   ") has a constant time series");
      }
      continue;
    }

    for (size_t t = 0; t < num_timepoints; ++t) {
      average[t] += (voxel_series[t] - moments.mean) / moments.std_dev;
    }
    ++num_included;
  }

  if (num_included == 0) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "ComputeGlobalCorrelation",
                           "no masked voxel with temporal variance");
  }

  double gcor = 0.0;
  for (double &value : average) {
    value /= num_included;
    gcor += value * value;
  }

  return gcor / num_timepoints;
}

double VoxelTimeSeriesMetrics::EstimateNuisanceMeanStd(const MapType &std_map,
                                                       double percentile,
                                                       size_t min_voxels) {
  if (!(percentile >= 0.0 && percentile < 100.0)) {
    throw NumericException(NumericException::Reason::DegeneratePercentile,
                           "EstimateNuisanceMeanStd",
                           "percentile " + std::to_string(percentile) +
                               " is outside [0, 100)");
  }

  std::vector<double> nonzero_stds;
  for (double value : std_map.GetDataVector()) {
    if (!std::isfinite(value)) {
      throw NumericException(NumericException::Reason::NonFiniteResult,
                             "EstimateNuisanceMeanStd",
                             "std map holds a NaN or infinite value");
    }
    if (value != 0.0) {
      nonzero_stds.push_back(value);
    }
  }

  if (nonzero_stds.size() < min_voxels || nonzero_stds.empty()) {
    throw NumericException(NumericException::Reason::DegeneratePercentile,
                           "EstimateNuisanceMeanStd",
                           std::to_string(nonzero_stds.size()) +
                               " non-zero voxels, need at least " +
                               std::to_string(min_voxels));
  }

  std::sort(nonzero_stds.begin(), nonzero_stds.end());

  const size_t cutoff_index =
      static_cast<size_t>(percentile / 100.0 * nonzero_stds.size());
  if (cutoff_index >= nonzero_stds.size()) {
    throw NumericException(NumericException::Reason::DegeneratePercentile,
                           "EstimateNuisanceMeanStd",
                           "percentile " + std::to_string(percentile) +
                               " leaves no voxel above the cutoff");
  }
  const double cutoff = nonzero_stds[cutoff_index];

  // Re-threshold the map itself; every tie with the cutoff is selected
  double sum = 0.0;
  size_t count = 0;
  for (double value : std_map.GetDataVector()) {
    if (value != 0.0 && value >= cutoff) {
      sum += value;
      ++count;
    }
  }

  return sum / count;
}

double VoxelTimeSeriesMetrics::ComputeWholeBrainMean(const MapType &mean_image,
                                                     const MaskType &mask) {
  if (!mean_image.HasSameSize(mask)) {
    throw MalformedInputException("ComputeWholeBrainMean", 0,
                                  "mean image and mask extents differ");
  }

  double sum = 0.0;
  size_t count = 0;
  const auto &mask_data = mask.GetDataVector();
  for (size_t i = 0; i < mask_data.size(); ++i) {
    if (mask_data[i] != 0) {
      sum += mean_image[i];
      ++count;
    }
  }

  if (count == 0) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "ComputeWholeBrainMean", "mask selects no voxel");
  }

  return sum / count;
}

double VoxelTimeSeriesMetrics::SignalFluctuationSensitivity(
    double voxel_mean, double voxel_std, double whole_brain_mean,
    double nuisance_mean_std) {
  return (voxel_mean / whole_brain_mean) * (voxel_std / nuisance_mean_std);
}

std::vector<double> VoxelTimeSeriesMetrics::ComputeSignalFluctuationSensitivity(
    const MapType &mean_image, const MaskType &mask, const MapType &std_map,
    double nuisance_mean_std) {
  if (!std_map.HasSameSize(mask)) {
    throw MalformedInputException("ComputeSignalFluctuationSensitivity", 0,
                                  "std map and mask extents differ");
  }

  const double whole_brain_mean = ComputeWholeBrainMean(mean_image, mask);
  if (whole_brain_mean == 0.0) {
    throw NumericException(NumericException::Reason::NonFiniteResult,
                           "ComputeSignalFluctuationSensitivity",
                           "whole-brain mean is zero");
  }
  if (nuisance_mean_std == 0.0 || !std::isfinite(nuisance_mean_std)) {
    throw NumericException(NumericException::Reason::NonFiniteResult,
                           "ComputeSignalFluctuationSensitivity",
                           "nuisance mean std is " +
                               std::to_string(nuisance_mean_std));
  }

  std::vector<double> sfs;
  const auto &mask_data = mask.GetDataVector();
  for (size_t i = 0; i < mask_data.size(); ++i) {
    if (mask_data[i] != 0) {
      sfs.push_back(SignalFluctuationSensitivity(
          mean_image[i], std_map[i], whole_brain_mean, nuisance_mean_std));
    }
  }

  return sfs;
}

std::vector<double> VoxelTimeSeriesMetrics::ComputeSignalFluctuationSensitivity(
    const MaskedVoxelSeries &series, double percentile, size_t min_voxels) {
  auto mean_image = ComputeTemporalMeanImage(series);
  auto std_map = ComputeTemporalStdMap(series);
  const double nuisance_mean_std =
      EstimateNuisanceMeanStd(std_map, percentile, min_voxels);

  return ComputeSignalFluctuationSensitivity(mean_image, series.GetMask(),
                                             std_map, nuisance_mean_std);
}

bool VoxelTimeSeriesMetrics::HasZeroVariance(double mean, double std_dev) {
  return std_dev <= kZeroVarianceTolerance * std::max(1.0, std::abs(mean));
}

} // namespace temporal
} // namespace neuroqap
