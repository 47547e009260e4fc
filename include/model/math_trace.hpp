#pragma once
#include <string>
#include <vector>

#include "common/matrix.hpp"
#include "model/conv_engine.hpp"
#include "model/kernel_bank.hpp"

namespace cl {

struct TraceTerm {
  float input_value = 0.0f;
  float weight      = 0.0f;
  float product     = 0.0f;
  bool  is_padding  = false;
};

struct MathTrace {
  std::string            filter_name;
  int                    x = 0;
  int                    y = 0;
  std::vector<TraceTerm> terms;      // row-major over (ky, kx)
  float                  sum = 0.0f;
  float                  activated_value = 0.0f;
};

/**
 * Rebuilds the multiply-accumulate for one output coordinate, keeping every
 * term. Walks the window with VisitWindow, so sum and activated_value match
 * the value Convolve stores for (out_x, out_y).
 *
 * Throws std::out_of_range if (out_x, out_y) is outside the feature map and
 * std::invalid_argument for an invalid config.
 */
MathTrace Explain(const Matrix& input, const Kernel& kernel, const ConvConfig& config,
                  int out_x, int out_y);

// Terms worth listing: all of them for grids up to kTraceFullGridLimit wide,
// otherwise only the non-zero products. Order is preserved.
std::vector<TraceTerm> DisplayTerms(const MathTrace& trace, int input_dim);

} // namespace cl
