/**
 * @file FramewiseDisplacement.h
 * @brief Jenkinson framewise displacement from per-timepoint affine matrices
 *
 * Implements the relative RMS displacement of Jenkinson et al. (2002) as
 * used for the QAP "RMSD" functional temporal metric. Input is the 3x4
 * row-major affine matrix file written by AFNI 3dvolreg -1Dmatrix_save; the
 * MCFLIRT rel.rms file is accepted as an already computed series.
 */

#ifndef NEUROQAP_FRAMEWISE_DISPLACEMENT_H
#define NEUROQAP_FRAMEWISE_DISPLACEMENT_H

#include "itkMatrix.h"
#include <optional>
#include <string>
#include <vector>

namespace neuroqap {
namespace temporal {

using TransformMatrix = itk::Matrix<double, 4, 4>;
using TransformSequence = std::vector<TransformMatrix>;
using DisplacementSeries = std::vector<double>;

/**
 * @brief Running state of the displacement fold
 *
 * The previous transform is empty before the first timepoint has been seen.
 */
struct FDAccumulator {
  std::optional<TransformMatrix> previous;
  DisplacementSeries values;
};

class FramewiseDisplacement {
public:
  static constexpr double kDefaultRadius = 80.0;            // mm
  static constexpr double kSingularityTolerance = 1e-10;
  static constexpr const char *kPrecomputedMarker = "rel.rms";

  /**
   * @brief Displacement series of a transform sequence
   * @param transforms One rigid-body transform per timepoint, N >= 1
   * @param rmax Radius of the sphere approximating the brain
   * @return N values; element 0 is 0.0
   * @throws NumericException on an empty sequence, a singular transform or a
   *         non-finite displacement
   * @throws ConfigurationException if rmax is not finite and positive
   */
  static DisplacementSeries
  ComputeJenkinson(const TransformSequence &transforms,
                   double rmax = kDefaultRadius);

  /**
   * @brief Fold one timepoint into the accumulator
   *
   * The first timepoint emits 0.0 without any computation; every later one
   * emits the displacement relative to the previous transform. The current
   * transform always becomes the new previous transform.
   */
  static FDAccumulator Accumulate(FDAccumulator accumulator,
                                  const TransformMatrix &current, double rmax);

  /// sqrt((rmax^2 / 5) trace(A'A) + b'b) for M = current * inv(previous) - I
  static double JenkinsonDisplacement(const TransformMatrix &previous,
                                      const TransformMatrix &current,
                                      double rmax);

  /// Already computed displacement values, passed through unchanged.
  static DisplacementSeries
  FromPrecomputed(const std::vector<double> &displacements);

  // Sequence construction
  static TransformMatrix MatrixFromRow(const std::vector<double> &row);
  static TransformSequence
  TransformSequenceFromRows(const std::vector<std::vector<double>> &rows);
  static TransformSequence ReadTransformSequence(const std::string &filename);

  // File-level processing
  static bool IsPrecomputedDisplacementFile(const std::string &filename);
  static std::string DefaultOutputPath(const std::string &in_file);

  /**
   * @brief Compute (or forward) the displacement file of one scan
   * @param in_file Matrix file, or an MCFLIRT rel.rms file which is copied
   * @param out_file Output path; defaults to DefaultOutputPath(in_file)
   * @return Path of the written displacement file
   */
  static std::string
  ComputeFramewiseDisplacementFile(const std::string &in_file,
                                   double rmax = kDefaultRadius,
                                   const std::string &out_file = "");

  static void ValidateRadius(double rmax);
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_FRAMEWISE_DISPLACEMENT_H
