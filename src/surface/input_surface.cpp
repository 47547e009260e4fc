#include "surface/input_surface.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace cl {

namespace {

struct BrushTap {
  int   dx;
  int   dy;
  float amount;
};

constexpr std::array<BrushTap, 5> kBrush = {{
  { 0,  0, kBrushCenter},
  { 1,  0, kBrushNeighbor},
  {-1,  0, kBrushNeighbor},
  { 0,  1, kBrushNeighbor},
  { 0, -1, kBrushNeighbor},
}};

} // namespace

InputSurface::InputSurface(int dim) {
  Resize(dim);
}

void InputSurface::Resize(int dim) {
  if (dim <= 0 || dim > kMaxGridSize) {
    throw std::invalid_argument("InputSurface::Resize: grid size must be in [1, " +
                                std::to_string(kMaxGridSize) + "], got " + std::to_string(dim));
  }
  grid_ = Matrix(dim);
}

void InputSurface::Clear() {
  std::fill(grid_.data.begin(), grid_.data.end(), 0.0f);
}

void InputSurface::AddClamped_(int x, int y, float amount) {
  if (!grid_.Contains(x, y)) return;
  float& cell = grid_.At(x, y);
  cell = std::min(kMaxIntensity, cell + amount);
}

void InputSurface::Paint(int x, int y) {
  if (!grid_.Contains(x, y)) return;
  for (const auto& tap : kBrush) {
    AddClamped_(x + tap.dx, y + tap.dy, tap.amount);
  }
}

void InputSurface::LoadRgba(const std::vector<std::uint8_t>& rgba, int dim) {
  if (dim <= 0) {
    throw std::invalid_argument("InputSurface::LoadRgba: grid size must be positive");
  }
  const std::size_t pixels = static_cast<std::size_t>(dim) * static_cast<std::size_t>(dim);
  if (rgba.size() != pixels * 4) {
    throw std::invalid_argument("InputSurface::LoadRgba: expected " + std::to_string(pixels * 4) +
                                " bytes, got " + std::to_string(rgba.size()));
  }

  Matrix next(dim);
  for (std::size_t i = 0; i < pixels; ++i) {
    const std::size_t p = i * 4;
    const float rgb = static_cast<float>(rgba[p]) + static_cast<float>(rgba[p + 1]) +
                      static_cast<float>(rgba[p + 2]);
    next.data[i] = rgb / 3.0f / 255.0f;
  }
  grid_ = std::move(next);
}

void InputSurface::SetMatrix(const Matrix& m) {
  m.Validate("InputSurface::SetMatrix");
  if (m.dim != grid_.dim) {
    throw std::invalid_argument("InputSurface::SetMatrix: dimension " + std::to_string(m.dim) +
                                " does not match grid size " + std::to_string(grid_.dim));
  }
  grid_ = m;
}

} // namespace cl
