/**
 * @file VoxelTimeSeriesMetrics.h
 * @brief Whole-brain reductions of masked functional time series
 *
 * - Global correlation (GCOR): Saad et al., "Correcting Brain-Wide
 *   Correlation Differences in Resting-State fMRI", Brain Connectivity 2013.
 * - Signal fluctuation sensitivity (SFS): DeDora et al., "Signal Fluctuation
 *   Sensitivity: An Improved Metric for Optimizing Detection of
 *   Resting-State fMRI Networks", Frontiers in Neuroscience 2016.
 *
 * All standard deviations are population standard deviations.
 */

#ifndef NEUROQAP_VOXEL_TIME_SERIES_METRICS_H
#define NEUROQAP_VOXEL_TIME_SERIES_METRICS_H

#include "MaskedVoxelSeries.h"
#include <vector>

namespace neuroqap {
namespace temporal {

/**
 * @brief Handling of voxels whose time series is constant
 */
enum class ZeroVariancePolicy {
  Exclude, // Drop the voxel from the z-scored average
  Fail     // Raise NumericException
};

class VoxelTimeSeriesMetrics {
public:
  using MapType = io::Image3D<double>;
  using MaskType = MaskedVoxelSeries::MaskType;

  static constexpr double kDefaultNuisancePercentile = 98.0;
  static constexpr size_t kDefaultMinNuisanceVoxels = 50;
  // Relative to max(1, |mean|)
  static constexpr double kZeroVarianceTolerance = 1e-12;

  /// Temporal std of every masked voxel; 0 outside the mask.
  static MapType ComputeTemporalStdMap(const MaskedVoxelSeries &series);

  /// Time-averaged functional image; 0 outside the mask.
  static MapType ComputeTemporalMeanImage(const MaskedVoxelSeries &series);

  /**
   * @brief GCOR of the masked time series
   *
   * Every voxel series is z-scored, the z-scored series are averaged per
   * timepoint, and GCOR is the squared norm of that average divided by the
   * number of timepoints.
   *
   * @throws NumericException when no voxel with temporal variance remains,
   *         or on the first constant voxel under ZeroVariancePolicy::Fail
   */
  static double
  ComputeGlobalCorrelation(const MaskedVoxelSeries &series,
                           ZeroVariancePolicy policy = ZeroVariancePolicy::Exclude);

  /**
   * @brief Mean temporal std of the highest-variance voxels
   *
   * The non-zero values of @p std_map are sorted ascending and the cutoff is
   * the value at index floor(percentile / 100 * count). Every voxel at or
   * above the cutoff contributes to the mean.
   *
   * @throws NumericException (DegeneratePercentile) with fewer than
   *         @p min_voxels non-zero voxels or a percentile outside [0, 100),
   *         (NonFiniteResult) if the map holds NaN or infinity
   */
  static double
  EstimateNuisanceMeanStd(const MapType &std_map,
                          double percentile = kDefaultNuisancePercentile,
                          size_t min_voxels = kDefaultMinNuisanceVoxels);

  /// Mean of @p mean_image over the non-zero voxels of @p mask.
  static double ComputeWholeBrainMean(const MapType &mean_image,
                                      const MaskType &mask);

  static double SignalFluctuationSensitivity(double voxel_mean,
                                             double voxel_std,
                                             double whole_brain_mean,
                                             double nuisance_mean_std);

  /**
   * @brief Per-voxel SFS in mask iteration order
   * @throws NumericException if the whole-brain mean or the nuisance std is
   *         zero, or the mask selects no voxel
   */
  static std::vector<double>
  ComputeSignalFluctuationSensitivity(const MapType &mean_image,
                                      const MaskType &mask,
                                      const MapType &std_map,
                                      double nuisance_mean_std);

  /// Convenience form deriving the mean image, std map and nuisance std.
  static std::vector<double> ComputeSignalFluctuationSensitivity(
      const MaskedVoxelSeries &series,
      double percentile = kDefaultNuisancePercentile,
      size_t min_voxels = kDefaultMinNuisanceVoxels);

  static bool HasZeroVariance(double mean, double std_dev);
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_VOXEL_TIME_SERIES_METRICS_H
