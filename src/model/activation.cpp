#include "model/activation.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace cl {

float Apply(Activation a, float x) {
  switch (a) {
    case Activation::kReLU:    return std::max(0.0f, x);
    case Activation::kSigmoid: return 1.0f / (1.0f + std::exp(-x));
    case Activation::kTanh:    return std::tanh(x);
    case Activation::kNone:    return x;
  }
  throw std::invalid_argument("Apply: unknown activation");
}

const char* ActivationName(Activation a) {
  switch (a) {
    case Activation::kReLU:    return "relu";
    case Activation::kSigmoid: return "sigmoid";
    case Activation::kTanh:    return "tanh";
    case Activation::kNone:    return "none";
    default:                   return "unknown";
  }
}

std::string ActivationLabel(Activation a) {
  std::string out = ActivationName(a);
  for (char& ch : out) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return out;
}

Activation ParseActivation(const std::string& name) {
  std::string key;
  key.reserve(name.size());
  for (char ch : name) {
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if (key == "relu")    return Activation::kReLU;
  if (key == "sigmoid") return Activation::kSigmoid;
  if (key == "tanh")    return Activation::kTanh;
  if (key == "none")    return Activation::kNone;
  throw std::invalid_argument("ParseActivation: unknown activation '" + name + "'");
}

std::vector<std::pair<float, float>> SampleActivation(Activation a, float range, int steps) {
  if (steps <= 0) throw std::invalid_argument("SampleActivation: steps must be positive");
  if (!(range > 0.0f)) throw std::invalid_argument("SampleActivation: range must be positive");

  std::vector<std::pair<float, float>> pts;
  pts.reserve(static_cast<std::size_t>(steps) + 1);
  const float step = (2.0f * range) / static_cast<float>(steps);
  for (int i = 0; i <= steps; ++i) {
    const float x = -range + step * static_cast<float>(i);
    pts.emplace_back(x, Apply(a, x));
  }
  return pts;
}

} // namespace cl
