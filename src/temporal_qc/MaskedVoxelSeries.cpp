/**
 * @file MaskedVoxelSeries.cpp
 * @brief Implementation of the masked functional time series
 */

#include "MaskedVoxelSeries.h"
#include "../common/NeuroQAPExceptions.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace neuroqap {
namespace temporal {

namespace {

std::string SizeToString(const MaskedVoxelSeries::SizeType &size) {
  return std::to_string(size[0]) + "x" + std::to_string(size[1]) + "x" +
         std::to_string(size[2]);
}

} // namespace

MaskedVoxelSeries::MaskedVoxelSeries(Image4DType volumes, MaskType mask)
    : m_volumes(std::move(volumes)), m_mask(std::move(mask)) {
  if (m_volumes.empty()) {
    throw MalformedInputException("MaskedVoxelSeries", 0,
                                  "time series has no volumes");
  }
  if (!m_mask.IsValid()) {
    throw MalformedInputException("MaskedVoxelSeries", 0, "mask is empty");
  }

  for (size_t t = 0; t < m_volumes.size(); ++t) {
    if (!m_volumes[t] || !m_volumes[t]->IsValid()) {
      throw MalformedInputException("MaskedVoxelSeries", 0,
                                    "volume " + std::to_string(t) +
                                        " is missing or empty");
    }
    if (!m_volumes[t]->HasSameSize(m_mask)) {
      throw MalformedInputException(
          "MaskedVoxelSeries", 0,
          "volume " + std::to_string(t) + " is " +
              SizeToString(m_volumes[t]->GetSize()) + " but the mask is " +
              SizeToString(m_mask.GetSize()));
    }
  }

  const auto &mask_data = m_mask.GetDataVector();
  for (size_t i = 0; i < mask_data.size(); ++i) {
    if (mask_data[i] != 0) {
      m_masked_indices.push_back(i);
    }
  }

  // Masked samples feed every reduction and must be finite
  for (size_t t = 0; t < m_volumes.size(); ++t) {
    const auto &volume = *m_volumes[t];
    for (size_t index : m_masked_indices) {
      if (!std::isfinite(volume[index])) {
        auto voxel = m_mask.LinearToIndex(index);
        throw MalformedInputException(
            "MaskedVoxelSeries", 0,
            "non-finite sample at voxel (" + std::to_string(voxel[0]) + ", " +
                std::to_string(voxel[1]) + ", " + std::to_string(voxel[2]) +
                "), volume " + std::to_string(t));
      }
    }
  }
}

const MaskedVoxelSeries::VolumeType &
MaskedVoxelSeries::GetVolume(size_t timepoint) const {
  if (timepoint >= m_volumes.size()) {
    throw std::out_of_range("Timepoint out of range");
  }
  return *m_volumes[timepoint];
}

std::vector<double>
MaskedVoxelSeries::GetVoxelTimeSeries(size_t linear_index) const {
  std::vector<double> series;
  series.reserve(m_volumes.size());

  for (const auto &volume : m_volumes) {
    series.push_back(static_cast<double>((*volume)[linear_index]));
  }

  return series;
}

std::vector<std::vector<double>> MaskedVoxelSeries::GetMaskedTimeSeries() const {
  std::vector<std::vector<double>> series;
  series.reserve(m_masked_indices.size());

  for (size_t index : m_masked_indices) {
    series.push_back(GetVoxelTimeSeries(index));
  }

  return series;
}

} // namespace temporal
} // namespace neuroqap
