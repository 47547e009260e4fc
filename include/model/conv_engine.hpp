#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/constants.hpp"
#include "common/matrix.hpp"
#include "model/activation.hpp"
#include "model/kernel_bank.hpp"

namespace cl {

struct ConvConfig {
  int        stride     = kDefaultStride;
  int        padding    = kDefaultPadding;
  Activation activation = Activation::kReLU;

  // Throws std::invalid_argument for stride <= 0 or padding < 0.
  void Validate() const;
};

struct FeatureMap {
  std::string        name;
  KernelKind         kind = KernelKind::kHorizontalEdge;
  int                dim  = 0;
  std::vector<float> data;

  float At(int x, int y) const { return data[Matrix::Index(x, y, dim)]; }
  bool  empty() const { return dim == 0; }
};

// floor((in + 2*pad - kernel) / stride) + 1, clamped to 0 when no window fits.
// Throws std::invalid_argument for stride <= 0, pad < 0 or kernel <= 0.
int DeriveOutDim(int in, int pad, int kernel, int stride);

// Top-left input coordinate of the window for output index o.
inline int WindowOrigin(int o, int stride, int padding) {
  return o * stride - padding;
}

// Visits the kernel taps of output (ox, oy) in row-major (ky, kx) order.
// fn(ky, kx, input_value, weight, is_padding); input_value is 0 outside the grid.
template <typename Fn>
void VisitWindow(const Matrix& input, const Kernel& kernel, const ConvConfig& config,
                 int ox, int oy, Fn&& fn) {
  const int k   = kernel.size();
  const int iy0 = WindowOrigin(oy, config.stride, config.padding);
  const int ix0 = WindowOrigin(ox, config.stride, config.padding);
  for (int ky = 0; ky < k; ++ky) {
    for (int kx = 0; kx < k; ++kx) {
      const int iy = iy0 + ky;
      const int ix = ix0 + kx;
      const bool is_padding = !input.Contains(ix, iy);
      const float value = is_padding ? 0.0f : input.At(ix, iy);
      fn(ky, kx, value, kernel.Weight(kx, ky), is_padding);
    }
  }
}

// Pre-activation multiply-accumulate for one output coordinate.
float WindowSum(const Matrix& input, const Kernel& kernel, const ConvConfig& config,
                int ox, int oy);

// Unflipped cross-correlation of one kernel over the input. A degenerate
// geometry (no window fits) returns an empty map, not an error.
FeatureMap Convolve(const Matrix& input, const Kernel& kernel, const ConvConfig& config);

// One map per kernel, in KernelKind order.
std::vector<FeatureMap> ConvolveAll(const Matrix& input, const KernelSet& kernels,
                                    const ConvConfig& config);

} // namespace cl
