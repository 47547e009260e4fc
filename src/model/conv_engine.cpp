#include "model/conv_engine.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace cl {

void ConvConfig::Validate() const {
  if (stride <= 0) {
    throw std::invalid_argument("ConvConfig: stride must be positive, got " + std::to_string(stride));
  }
  if (padding < 0 || padding > kMaxPadding) {
    throw std::invalid_argument("ConvConfig: padding must be in [0, " + std::to_string(kMaxPadding) +
                                "], got " + std::to_string(padding));
  }
}

int DeriveOutDim(int in, int pad, int kernel, int stride) {
  if (stride <= 0) throw std::invalid_argument("DeriveOutDim: stride must be positive, got " + std::to_string(stride));
  if (pad < 0)     throw std::invalid_argument("DeriveOutDim: padding must be non-negative, got " + std::to_string(pad));
  if (kernel <= 0) throw std::invalid_argument("DeriveOutDim: kernel size must be positive, got " + std::to_string(kernel));
  if (in < 0)      throw std::invalid_argument("DeriveOutDim: input size must be non-negative, got " + std::to_string(in));

  const std::int64_t numer = static_cast<std::int64_t>(in) + 2 * static_cast<std::int64_t>(pad) -
                             static_cast<std::int64_t>(kernel);
  if (numer < 0) return 0;
  const std::int64_t out = numer / stride + 1;
  if (out > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("DeriveOutDim: output size " + std::to_string(out) + " does not fit in int");
  }
  return static_cast<int>(out);
}

float WindowSum(const Matrix& input, const Kernel& kernel, const ConvConfig& config,
                int ox, int oy) {
  float sum = 0.0f;
  VisitWindow(input, kernel, config, ox, oy,
              [&sum](int, int, float value, float weight, bool) { sum += value * weight; });
  return sum;
}

FeatureMap Convolve(const Matrix& input, const Kernel& kernel, const ConvConfig& config) {
  config.Validate();
  input.Validate("Convolve");

  FeatureMap out;
  out.name = kernel.name();
  out.kind = kernel.kind();
  out.dim  = DeriveOutDim(input.dim, config.padding, kernel.size(), config.stride);
  if (out.dim <= 0) {
    out.dim = 0;
    return out;
  }

  out.data.resize(static_cast<std::size_t>(out.dim) * static_cast<std::size_t>(out.dim));
  for (int oy = 0; oy < out.dim; ++oy) {
    for (int ox = 0; ox < out.dim; ++ox) {
      const float sum = WindowSum(input, kernel, config, ox, oy);
      out.data[Matrix::Index(ox, oy, out.dim)] = Apply(config.activation, sum);
    }
  }
  return out;
}

std::vector<FeatureMap> ConvolveAll(const Matrix& input, const KernelSet& kernels,
                                    const ConvConfig& config) {
  std::vector<FeatureMap> maps;
  maps.reserve(kernels.size());
  for (const auto& [kind, kernel] : kernels) {
    (void)kind;
    maps.push_back(Convolve(input, kernel, config));
  }
  return maps;
}

} // namespace cl
