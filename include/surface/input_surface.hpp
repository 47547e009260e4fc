// surface/input_surface.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "common/constants.hpp"
#include "common/matrix.hpp"

namespace cl {

/**
 * InputSurface
 *
 * Owns the input intensity grid and converts brush strokes and decoded
 * pixel rasters into it. Values stay within [0, kMaxIntensity] for brush and
 * raster input; SetMatrix accepts any finite values.
 */
class InputSurface {
public:
  explicit InputSurface(int dim = kDefaultGridSize);

  // Replaces the grid with a zeroed one of the new size.
  void Resize(int dim);

  void Clear();

  // Stamps the brush centered on (x, y). Centers outside the grid are ignored.
  void Paint(int x, int y);

  // RGBA8, row-major, dim x dim pixels. Intensity = (r + g + b) / 3 / 255.
  void LoadRgba(const std::vector<std::uint8_t>& rgba, int dim);

  // dim must match the current grid.
  void SetMatrix(const Matrix& m);

  int dim() const { return grid_.dim; }
  const Matrix& matrix() const { return grid_; }

private:
  void AddClamped_(int x, int y, float amount);

  Matrix grid_;
};

} // namespace cl
