/**
 * @file TemporalQC.h
 * @brief Per-scan functional temporal quality metrics and batch processing
 *
 * TemporalQC merges the motion estimator, the distribution statistics of
 * AFNI per-timepoint outputs and the whole-brain voxel reductions into one
 * TemporalQCMetrics record per scan. BatchTemporalQC runs many scans and
 * keeps going when one of them fails.
 */

#ifndef NEUROQAP_TEMPORAL_QC_H
#define NEUROQAP_TEMPORAL_QC_H

#include "DistributionStatistics.h"
#include "FramewiseDisplacement.h"
#include "MaskedVoxelSeries.h"
#include "VoxelTimeSeriesMetrics.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace neuroqap {
namespace temporal {

/**
 * @brief Temporal QC configuration parameters
 */
struct TemporalQCParameters {
  // Motion
  double rmax = FramewiseDisplacement::kDefaultRadius; // Brain radius (mm)
  double fd_threshold = 0.2;                           // High-motion FD (mm)

  // Distribution statistics
  double iqr_multiplier = DistributionStatistics::kDefaultIQRMultiplier;

  // Voxel reductions
  bool compute_voxel_metrics = true;
  double nuisance_percentile = VoxelTimeSeriesMetrics::kDefaultNuisancePercentile;
  size_t min_nuisance_voxels = VoxelTimeSeriesMetrics::kDefaultMinNuisanceVoxels;
  ZeroVariancePolicy zero_variance_policy = ZeroVariancePolicy::Exclude;
};

/**
 * @brief Everything known about one scan before its metrics are computed
 *
 * Either transforms or precomputed_displacement should be set; absent
 * inputs simply leave the matching metric family unset.
 */
struct ScanInputs {
  std::string participant;
  std::string session;
  std::string series;

  TransformSequence transforms;
  std::optional<std::vector<double>> precomputed_displacement;
  std::optional<std::vector<double>> outlier_values; // 3dToutcount
  std::optional<std::vector<double>> quality_values; // 3dTqual
  std::shared_ptr<const MaskedVoxelSeries> voxel_series;

  std::string GetIdentifier() const;
};

/**
 * @brief Displacement family of the record
 */
struct DisplacementMetrics {
  double mean_fd = 0.0;
  double max_fd = 0.0;
  int num_fd_above_threshold = 0;
  double percent_fd_above_threshold = 0.0; // Percentage, 0-100
  double percent_outliers = 0.0;
  double iqr = 0.0;
};

/**
 * @brief Whole-brain voxel family of the record
 */
struct VoxelMetrics {
  double gcor = 0.0;
  double nuisance_mean_std = 0.0;
  double mean_sfs = 0.0;
};

/**
 * @brief Complete temporal metrics of one scan
 */
struct TemporalQCMetrics {
  std::string participant;
  std::string session;
  std::string series;

  size_t num_timepoints = 0;
  std::optional<DisplacementMetrics> displacement;
  std::optional<SeriesSummary> outlier_fraction;
  std::optional<SeriesSummary> quality;
  std::optional<VoxelMetrics> voxel;

  std::vector<double> fd_series;
};

/**
 * @brief Per-scan temporal QC processor
 */
class TemporalQC {
private:
  TemporalQCParameters m_params;

public:
  TemporalQC();
  explicit TemporalQC(const TemporalQCParameters &params);

  void SetParameters(const TemporalQCParameters &params);
  const TemporalQCParameters &GetParameters() const { return m_params; }

  /**
   * @brief Compute every metric family whose inputs are present
   * @throws NumericException, tagged with the scan identifier
   */
  TemporalQCMetrics Process(const ScanInputs &inputs) const;

  DisplacementMetrics
  ComputeDisplacementMetrics(const std::vector<double> &fd_series) const;
  VoxelMetrics ComputeVoxelMetrics(const MaskedVoxelSeries &series) const;

  static TemporalQCParameters GetDefaultParameters();

  /// @throws ConfigurationException naming the first invalid parameter
  static void ValidateParameters(const TemporalQCParameters &params);
};

/**
 * @brief Batch temporal QC over many scans
 */
class BatchTemporalQC {
public:
  /**
   * @brief One scan of the batch
   *
   * File-backed jobs name a motion file (matrix file or MCFLIRT rel.rms) and
   * optional text files holding AFNI tool output; they are loaded when the
   * job runs. In-memory inputs already present in `inputs` are kept.
   */
  struct BatchJob {
    ScanInputs inputs;
    std::string motion_file;
    std::string outlier_output_file;
    std::string quality_output_file;

    bool completed = false;
    std::string error_message;
    TemporalQCMetrics metrics;
    double processing_time_ms = 0.0;
  };

  struct BatchOptions {
    int max_parallel_jobs = 1;       // Number of parallel jobs
    bool continue_on_error = true;   // Continue processing if one job fails
    bool save_summary_report = true; // Save metrics CSV when done
    std::string report_file = "qap_functional_temporal.csv";
    std::string log_file;            // Path to log file
    bool verbose = true;             // Verbose output
  };

  struct BatchStatistics {
    int total_jobs = 0;
    int completed_jobs = 0;
    int failed_jobs = 0;
    double total_processing_time_ms = 0.0;
    double average_processing_time_ms = 0.0;
  };

private:
  BatchOptions m_options;
  TemporalQCParameters m_params;
  std::vector<BatchJob> m_jobs;
  std::function<void(const BatchJob &, double)> m_batch_progress_callback;

public:
  BatchTemporalQC() = default;
  explicit BatchTemporalQC(const BatchOptions &options,
                           const TemporalQCParameters &params =
                               TemporalQCParameters());

  // Job management
  void AddJob(const ScanInputs &inputs);
  void AddFileJob(const ScanInputs &identity, const std::string &motion_file,
                  const std::string &outlier_output_file = "",
                  const std::string &quality_output_file = "");
  void ClearJobs() { m_jobs.clear(); }
  size_t GetJobCount() const { return m_jobs.size(); }

  // Batch processing
  bool ProcessAllJobs();
  bool ProcessJob(size_t job_index);

  void SetBatchProgressCallback(
      const std::function<void(const BatchJob &, double)> &callback) {
    m_batch_progress_callback = callback;
  }

  const std::vector<BatchJob> &GetJobs() const { return m_jobs; }
  std::vector<BatchJob> GetCompletedJobs() const;
  std::vector<BatchJob> GetFailedJobs() const;
  std::vector<TemporalQCMetrics> GetCompletedMetrics() const;

  BatchStatistics GetBatchStatistics() const;

private:
  static ScanInputs LoadJobInputs(const BatchJob &job);
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_TEMPORAL_QC_H
