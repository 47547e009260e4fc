#include "model/print.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace cl {
namespace model {

std::string FormatMatrix(const Matrix& m, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision);
  for (int y = 0; y < m.dim; ++y) {
    for (int x = 0; x < m.dim; ++x) {
      if (x) oss << ' ';
      oss << std::setw(precision + 4) << m.At(x, y);
    }
    oss << '\n';
  }
  return oss.str();
}

std::string FormatKernel(const Kernel& k) {
  std::ostringstream oss;
  oss << k.name() << " [" << k.size() << "x" << k.size() << "]\n";
  for (int y = 0; y < k.size(); ++y) {
    for (int x = 0; x < k.size(); ++x) {
      if (x) oss << ' ';
      oss << std::setw(3) << static_cast<int>(std::lround(k.Weight(x, y)));
    }
    oss << '\n';
  }
  return oss.str();
}

std::string FormatFeatureMap(const FeatureMap& fm, int precision) {
  std::ostringstream oss;
  oss << fm.name << " " << fm.dim << "x" << fm.dim << "\n";
  if (fm.empty()) {
    oss << "(empty)\n";
    return oss.str();
  }
  Matrix view(fm.dim);
  view.data = fm.data;
  oss << FormatMatrix(view, precision);
  return oss.str();
}

std::string FormatTrace(const MathTrace& trace, Activation activation, int input_dim,
                        std::size_t max_terms) {
  const auto terms = DisplayTerms(trace, input_dim);

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  oss << "Analyzing: " << trace.filter_name << " at (" << trace.x << ", " << trace.y << ")\n";
  for (std::size_t i = 0; i < terms.size() && i < max_terms; ++i) {
    const auto& t = terms[i];
    oss << "(" << i << ") ";
    if (t.is_padding) {
      oss << std::setw(8) << "0 (pad)";
    } else {
      oss << std::setw(8) << t.input_value;
    }
    oss << " x " << std::setw(3) << static_cast<int>(std::lround(t.weight))
        << " = " << t.product << '\n';
  }
  if (terms.size() > max_terms) {
    oss << "...and " << (terms.size() - max_terms) << " more\n";
  }
  oss << "Sum: " << trace.sum << '\n';
  oss << ActivationLabel(activation) << "(Sum): " << trace.activated_value << '\n';
  return oss.str();
}

} // namespace model
} // namespace cl
