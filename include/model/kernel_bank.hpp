#pragma once

#include <array>
#include <map>
#include <string>

#include "common/matrix.hpp"

namespace cl {

enum class KernelKind { kHorizontalEdge, kVerticalEdge, kSharpen, kEmboss };

inline constexpr std::array<KernelKind, 4> kAllKernelKinds = {
  KernelKind::kHorizontalEdge,
  KernelKind::kVerticalEdge,
  KernelKind::kSharpen,
  KernelKind::kEmboss,
};

/**
 * Kernel
 *
 * Immutable square weight grid of odd side length. Weights are addressed
 * (kx, ky) with the same row-major layout as the input Matrix.
 */
class Kernel {
public:
  Kernel(KernelKind kind, std::string name, Matrix weights);

  KernelKind         kind()    const { return kind_; }
  const std::string& name()    const { return name_; }
  const Matrix&      weights() const { return weights_; }
  int                size()    const { return weights_.dim; }

  float Weight(int kx, int ky) const { return weights_.At(kx, ky); }

  // Sum of all weights (zero for the edge kernels at size 3).
  float WeightSum() const;

private:
  KernelKind  kind_;
  std::string name_;
  Matrix      weights_;
};

// Ordered by KernelKind; iteration order is the display order.
using KernelSet = std::map<KernelKind, Kernel>;

class KernelBank {
public:
  // Builds all four kernels for k_size. Throws std::invalid_argument unless
  // k_size is odd and >= 3.
  static KernelSet Generate(int k_size);

  // Builds a single kernel. Same contract as Generate.
  static Kernel Make(KernelKind kind, int k_size);

  static void CheckKernelSize(int k_size);

private:
  static Matrix HorizontalEdge(int k_size);
  static Matrix VerticalEdge(int k_size);
  static Matrix Sharpen(int k_size);
  static Matrix Emboss(int k_size);
};

// Display label, e.g. "Horizontal Edge".
const char* KernelDisplayName(KernelKind kind);

// Config key, e.g. "horizontal".
const char* KernelKindToString(KernelKind kind);

// Accepts the config key or the display label (case-insensitive).
// Throws std::invalid_argument for anything else.
KernelKind ParseKernelKind(const std::string& name);

// Throws std::out_of_range if the set has no kernel of that kind.
const Kernel& FindKernel(const KernelSet& set, KernelKind kind);

} // namespace cl
