/**
 * @file TemporalQC.cpp
 * @brief Implementation of the per-scan temporal QC processor
 */

#include "TemporalQC.h"
#include "../common/NeuroQAPExceptions.h"
#include <algorithm>
#include <cmath>

namespace neuroqap {
namespace temporal {

std::string ScanInputs::GetIdentifier() const {
  std::string identifier = participant.empty() ? "unknown" : participant;
  if (!session.empty()) {
    identifier += "/" + session;
  }
  if (!series.empty()) {
    identifier += "/" + series;
  }
  return identifier;
}

TemporalQC::TemporalQC() : m_params(GetDefaultParameters()) {}

TemporalQC::TemporalQC(const TemporalQCParameters &params) {
  SetParameters(params);
}

void TemporalQC::SetParameters(const TemporalQCParameters &params) {
  ValidateParameters(params);
  m_params = params;
}

TemporalQCMetrics TemporalQC::Process(const ScanInputs &inputs) const {
  TemporalQCMetrics metrics;
  metrics.participant = inputs.participant;
  metrics.session = inputs.session;
  metrics.series = inputs.series;

  try {
    // Motion family; a transform sequence wins over precomputed values
    if (!inputs.transforms.empty()) {
      metrics.fd_series =
          FramewiseDisplacement::ComputeJenkinson(inputs.transforms, m_params.rmax);
    } else if (inputs.precomputed_displacement) {
      metrics.fd_series =
          FramewiseDisplacement::FromPrecomputed(*inputs.precomputed_displacement);
    }

    if (!metrics.fd_series.empty()) {
      metrics.displacement = ComputeDisplacementMetrics(metrics.fd_series);
      metrics.num_timepoints = metrics.fd_series.size();
    }

    if (inputs.outlier_values) {
      metrics.outlier_fraction = DistributionStatistics::SummarizeSeries(
          *inputs.outlier_values, m_params.iqr_multiplier);
      if (metrics.num_timepoints == 0) {
        metrics.num_timepoints = inputs.outlier_values->size();
      }
    }

    if (inputs.quality_values) {
      metrics.quality = DistributionStatistics::SummarizeSeries(
          *inputs.quality_values, m_params.iqr_multiplier);
      if (metrics.num_timepoints == 0) {
        metrics.num_timepoints = inputs.quality_values->size();
      }
    }

    if (m_params.compute_voxel_metrics && inputs.voxel_series) {
      metrics.voxel = ComputeVoxelMetrics(*inputs.voxel_series);
      if (metrics.num_timepoints == 0) {
        metrics.num_timepoints = inputs.voxel_series->GetNumberOfTimepoints();
      }
    }
  } catch (NumericException &e) {
    e.SetScanIdentifier(inputs.GetIdentifier());
    throw;
  }

  return metrics;
}

DisplacementMetrics TemporalQC::ComputeDisplacementMetrics(
    const std::vector<double> &fd_series) const {
  if (fd_series.empty()) {
    throw NumericException(NumericException::Reason::EmptyInput,
                           "ComputeDisplacementMetrics");
  }

  DisplacementMetrics metrics;
  metrics.mean_fd = DistributionStatistics::Mean(fd_series);
  metrics.max_fd = *std::max_element(fd_series.begin(), fd_series.end());

  metrics.num_fd_above_threshold = static_cast<int>(
      std::count_if(fd_series.begin(), fd_series.end(),
                    [this](double fd) { return fd > m_params.fd_threshold; }));
  metrics.percent_fd_above_threshold =
      100.0 * metrics.num_fd_above_threshold / fd_series.size();

  auto outliers = DistributionStatistics::ComputeOutlierStatistics(
      fd_series, m_params.iqr_multiplier);
  metrics.percent_outliers = outliers.percent_outliers;
  metrics.iqr = outliers.iqr;

  return metrics;
}

VoxelMetrics
TemporalQC::ComputeVoxelMetrics(const MaskedVoxelSeries &series) const {
  VoxelMetrics metrics;
  metrics.gcor = VoxelTimeSeriesMetrics::ComputeGlobalCorrelation(
      series, m_params.zero_variance_policy);

  auto mean_image = VoxelTimeSeriesMetrics::ComputeTemporalMeanImage(series);
  auto std_map = VoxelTimeSeriesMetrics::ComputeTemporalStdMap(series);
  metrics.nuisance_mean_std = VoxelTimeSeriesMetrics::EstimateNuisanceMeanStd(
      std_map, m_params.nuisance_percentile, m_params.min_nuisance_voxels);

  auto sfs = VoxelTimeSeriesMetrics::ComputeSignalFluctuationSensitivity(
      mean_image, series.GetMask(), std_map, metrics.nuisance_mean_std);
  metrics.mean_sfs = DistributionStatistics::Mean(sfs);

  return metrics;
}

TemporalQCParameters TemporalQC::GetDefaultParameters() {
  return TemporalQCParameters();
}

void TemporalQC::ValidateParameters(const TemporalQCParameters &params) {
  FramewiseDisplacement::ValidateRadius(params.rmax);

  if (!std::isfinite(params.fd_threshold) || params.fd_threshold < 0.0) {
    throw ConfigurationException("fd_threshold",
                                 std::to_string(params.fd_threshold),
                                 "finite value >= 0 (mm)");
  }
  if (!std::isfinite(params.iqr_multiplier) || params.iqr_multiplier <= 0.0) {
    throw ConfigurationException("iqr_multiplier",
                                 std::to_string(params.iqr_multiplier),
                                 "finite value > 0");
  }
  if (!(params.nuisance_percentile >= 0.0 &&
        params.nuisance_percentile < 100.0)) {
    throw ConfigurationException("nuisance_percentile",
                                 std::to_string(params.nuisance_percentile),
                                 "value in [0, 100)");
  }
  if (params.min_nuisance_voxels == 0) {
    throw ConfigurationException("min_nuisance_voxels", "0", "at least 1");
  }
}

} // namespace temporal
} // namespace neuroqap
