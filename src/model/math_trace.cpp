#include "model/math_trace.hpp"

#include <stdexcept>

#include "common/constants.hpp"

namespace cl {

MathTrace Explain(const Matrix& input, const Kernel& kernel, const ConvConfig& config,
                  int out_x, int out_y) {
  config.Validate();
  input.Validate("Explain");

  const int out_dim = DeriveOutDim(input.dim, config.padding, kernel.size(), config.stride);
  if (out_x < 0 || out_x >= out_dim || out_y < 0 || out_y >= out_dim) {
    throw std::out_of_range("Explain: coordinate (" + std::to_string(out_x) + ", " +
                            std::to_string(out_y) + ") outside " + std::to_string(out_dim) +
                            "x" + std::to_string(out_dim) + " feature map");
  }

  MathTrace trace;
  trace.filter_name = kernel.name();
  trace.x = out_x;
  trace.y = out_y;
  trace.terms.reserve(static_cast<std::size_t>(kernel.size()) * static_cast<std::size_t>(kernel.size()));

  VisitWindow(input, kernel, config, out_x, out_y,
              [&trace](int, int, float value, float weight, bool is_padding) {
                TraceTerm t;
                t.input_value = value;
                t.weight      = weight;
                t.product     = value * weight;
                t.is_padding  = is_padding;
                trace.sum += t.product;
                trace.terms.push_back(t);
              });

  trace.activated_value = Apply(config.activation, trace.sum);
  return trace;
}

std::vector<TraceTerm> DisplayTerms(const MathTrace& trace, int input_dim) {
  if (input_dim <= kTraceFullGridLimit) return trace.terms;

  std::vector<TraceTerm> out;
  for (const auto& t : trace.terms) {
    if (t.product != 0.0f) out.push_back(t);
  }
  return out;
}

} // namespace cl
