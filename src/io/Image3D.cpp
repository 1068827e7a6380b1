/**
 * @file Image3D.cpp
 * @brief Implementation of the voxel grid
 */

#include "Image3D.h"
#include <algorithm>
#include <stdexcept>

namespace neuroqap {
namespace io {

template <typename PixelType>
Image3D<PixelType>::Image3D(const SizeType &size)
    : m_size(size), m_data(size[0] * size[1] * size[2], PixelType()) {}

template <typename PixelType>
Image3D<PixelType>::Image3D(size_t nx, size_t ny, size_t nz)
    : Image3D(SizeType{{nx, ny, nz}}) {}

template <typename PixelType>
PixelType &Image3D<PixelType>::operator[](size_t linear_index) {
  if (linear_index >= m_data.size()) {
    throw std::out_of_range("Linear index out of bounds");
  }
  return m_data[linear_index];
}

template <typename PixelType>
const PixelType &Image3D<PixelType>::operator[](size_t linear_index) const {
  if (linear_index >= m_data.size()) {
    throw std::out_of_range("Linear index out of bounds");
  }
  return m_data[linear_index];
}

template <typename PixelType>
PixelType &Image3D<PixelType>::operator()(size_t x, size_t y, size_t z) {
  return m_data[ToLinear(x, y, z)];
}

template <typename PixelType>
const PixelType &Image3D<PixelType>::operator()(size_t x, size_t y,
                                                size_t z) const {
  return m_data[ToLinear(x, y, z)];
}

template <typename PixelType>
void Image3D<PixelType>::Fill(const PixelType &value) {
  std::fill(m_data.begin(), m_data.end(), value);
}

template <typename PixelType>
typename Image3D<PixelType>::IndexType
Image3D<PixelType>::LinearToIndex(size_t linear_index) const {
  if (linear_index >= m_data.size()) {
    throw std::out_of_range("Linear index out of bounds");
  }

  const size_t plane = m_size[0] * m_size[1];
  IndexType index;
  index[2] = linear_index / plane;
  index[1] = (linear_index % plane) / m_size[0];
  index[0] = linear_index % m_size[0];
  return index;
}

template <typename PixelType>
size_t Image3D<PixelType>::ToLinear(size_t x, size_t y, size_t z) const {
  if (x >= m_size[0] || y >= m_size[1] || z >= m_size[2]) {
    throw std::out_of_range("Image index out of bounds");
  }
  return (z * m_size[1] + y) * m_size[0] + x;
}

// Volumes, masks and metric maps
template class Image3D<uint8_t>;
template class Image3D<float>;
template class Image3D<double>;

} // namespace io
} // namespace neuroqap
