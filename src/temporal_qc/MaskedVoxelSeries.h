/**
 * @file MaskedVoxelSeries.h
 * @brief Functional time series restricted to a brain mask
 */

#ifndef NEUROQAP_MASKED_VOXEL_SERIES_H
#define NEUROQAP_MASKED_VOXEL_SERIES_H

#include "../io/Image3D.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace neuroqap {
namespace temporal {

/**
 * @brief One Image3D per timepoint plus a binary mask of the same extent
 *
 * Only voxels with a non-zero mask value take part in any reduction. The
 * masked voxels are visited in the linear order of Image3D, which is the
 * order of every per-voxel output of the library.
 */
class MaskedVoxelSeries {
public:
  using VolumeType = io::Image3D<float>;
  using Image4DType = std::vector<std::unique_ptr<VolumeType>>;
  using MaskType = io::Image3D<uint8_t>;
  using SizeType = VolumeType::SizeType;

private:
  Image4DType m_volumes;
  MaskType m_mask;
  std::vector<size_t> m_masked_indices;

public:
  /**
   * @throws MalformedInputException if there are no volumes, a volume is
   *         missing or invalid, the extents of volumes and mask differ, or a
   *         masked voxel holds a NaN or infinite sample
   */
  MaskedVoxelSeries(Image4DType volumes, MaskType mask);

  MaskedVoxelSeries(const MaskedVoxelSeries &) = delete;
  MaskedVoxelSeries &operator=(const MaskedVoxelSeries &) = delete;
  MaskedVoxelSeries(MaskedVoxelSeries &&) noexcept = default;
  MaskedVoxelSeries &operator=(MaskedVoxelSeries &&) noexcept = default;

  size_t GetNumberOfTimepoints() const { return m_volumes.size(); }
  size_t GetNumberOfMaskedVoxels() const { return m_masked_indices.size(); }
  const SizeType &GetSize() const { return m_mask.GetSize(); }

  const MaskType &GetMask() const { return m_mask; }
  const VolumeType &GetVolume(size_t timepoint) const;

  /// Linear indices of the masked voxels, ascending.
  const std::vector<size_t> &GetMaskedIndices() const {
    return m_masked_indices;
  }

  bool IsMasked(size_t linear_index) const {
    return m_mask[linear_index] != 0;
  }

  std::vector<double> GetVoxelTimeSeries(size_t linear_index) const;

  /// Time series of every masked voxel, in mask iteration order.
  std::vector<std::vector<double>> GetMaskedTimeSeries() const;
};

} // namespace temporal
} // namespace neuroqap

#endif // NEUROQAP_MASKED_VOXEL_SERIES_H
