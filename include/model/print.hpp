#pragma once
#include <cstddef>
#include <string>

#include "common/constants.hpp"
#include "common/matrix.hpp"
#include "model/activation.hpp"
#include "model/conv_engine.hpp"
#include "model/kernel_bank.hpp"
#include "model/math_trace.hpp"

namespace cl {
namespace model {

// Grid of values with fixed precision, one row per line.
std::string FormatMatrix(const Matrix& m, int precision = 2);

// Kernel header plus integer weights.
std::string FormatKernel(const Kernel& k);

// Feature map header ("Sharpen 12x12") plus grid; "(empty)" for dim 0.
std::string FormatFeatureMap(const FeatureMap& fm, int precision = 2);

/**
 * Pretty-print a MathTrace the way the explainer panel shows it:
 *   Analyzing: Sharpen at (x, y)
 *   (0)   0.00 x -1 = -0.00
 *   ...and N more
 *   Sum: 1.00
 *   RELU(Sum): 1.00
 * Padding cells print as "0 (pad)". At most max_terms terms are listed.
 */
std::string FormatTrace(const MathTrace& trace, Activation activation, int input_dim,
                        std::size_t max_terms = kTraceDisplayTerms);

} // namespace model
} // namespace cl
