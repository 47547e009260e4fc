#pragma once
#include <string>
#include <utility>
#include <vector>

namespace cl {

enum class Activation { kReLU, kSigmoid, kTanh, kNone };

// Scalar nonlinearity; total on all finite inputs.
float Apply(Activation a, float x);

// Canonical lowercase name: "relu", "sigmoid", "tanh", "none".
const char* ActivationName(Activation a);

// Uppercase label used in trace output, e.g. "RELU".
std::string ActivationLabel(Activation a);

// Case-insensitive. Throws std::invalid_argument for unknown names.
Activation ParseActivation(const std::string& name);

// Samples the curve at steps+1 evenly spaced points across [-range, range].
// Throws std::invalid_argument if steps <= 0 or range <= 0.
std::vector<std::pair<float, float>> SampleActivation(Activation a,
                                                      float range = 10.0f,
                                                      int steps = 20);

} // namespace cl
