/**
 * @file Image3D.h
 * @brief 3D voxel grid used for functional volumes, masks and metric maps
 *
 * NeuroQAP does not read or write image formats; volumes are handed to the
 * library already decoded, one Image3D per timepoint.
 */

#ifndef NEUROQAP_IMAGE3D_H
#define NEUROQAP_IMAGE3D_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace neuroqap {
namespace io {

/**
 * @brief Dense voxel grid of one pixel type
 *
 * Voxels are stored with x varying fastest, then y, then z. This linear
 * order is the iteration order of every masked reduction in the library.
 * Every accessor is bounds-checked and throws std::out_of_range.
 */
template <typename PixelType> class Image3D {
public:
  using IndexType = std::array<size_t, 3>;
  using SizeType = std::array<size_t, 3>;

private:
  SizeType m_size = {{0, 0, 0}};
  std::vector<PixelType> m_data;

public:
  Image3D() = default;
  explicit Image3D(const SizeType &size);
  Image3D(size_t nx, size_t ny, size_t nz);

  PixelType &operator[](size_t linear_index);
  const PixelType &operator[](size_t linear_index) const;

  PixelType &operator()(size_t x, size_t y, size_t z);
  const PixelType &operator()(size_t x, size_t y, size_t z) const;

  const SizeType &GetSize() const { return m_size; }
  size_t GetNumberOfVoxels() const { return m_data.size(); }

  /// False for a default-constructed image or one with a zero extent.
  bool IsValid() const { return !m_data.empty(); }

  template <typename OtherPixelType>
  bool HasSameSize(const Image3D<OtherPixelType> &other) const {
    return m_size == other.GetSize();
  }

  void Fill(const PixelType &value);

  const std::vector<PixelType> &GetDataVector() const { return m_data; }

  IndexType LinearToIndex(size_t linear_index) const;

private:
  size_t ToLinear(size_t x, size_t y, size_t z) const;
};

} // namespace io
} // namespace neuroqap

#endif // NEUROQAP_IMAGE3D_H
