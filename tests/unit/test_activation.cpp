// tests/unit/test_activation.cpp
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include "model/activation.hpp"

// Simple helper macro to check exceptions
#define EXPECT_THROW(stmt, type)              \
    do {                                      \
        bool threw = false;                   \
        try { (void)(stmt); }                 \
        catch (const type&) { threw = true; } \
        assert(threw && "Expected exception was not thrown"); \
    } while(0)

static bool Near(float a, float b, float eps = 1e-6f) {
    return std::fabs(a - b) <= eps;
}

static void Test_ReLU() {
    using cl::Activation;
    assert(cl::Apply(Activation::kReLU, -3.5f) == 0.0f);
    assert(cl::Apply(Activation::kReLU, 0.0f) == 0.0f);
    assert(cl::Apply(Activation::kReLU, 2.25f) == 2.25f);
}

static void Test_Sigmoid() {
    using cl::Activation;
    assert(cl::Apply(Activation::kSigmoid, 0.0f) == 0.5f);
    // 1 / (1 + e^-2) = 0.8807971
    assert(Near(cl::Apply(Activation::kSigmoid, 2.0f), 0.8807971f));
    assert(Near(cl::Apply(Activation::kSigmoid, -2.0f), 1.0f - 0.8807971f));
    // Saturates without overflow.
    assert(Near(cl::Apply(Activation::kSigmoid, 100.0f), 1.0f));
    assert(Near(cl::Apply(Activation::kSigmoid, -100.0f), 0.0f));
}

static void Test_Tanh_And_None() {
    using cl::Activation;
    assert(cl::Apply(Activation::kTanh, 0.0f) == 0.0f);
    assert(Near(cl::Apply(Activation::kTanh, 1.0f), 0.7615942f));
    assert(Near(cl::Apply(Activation::kTanh, -1.0f), -0.7615942f));
    assert(cl::Apply(Activation::kNone, -7.25f) == -7.25f);
    assert(cl::Apply(Activation::kNone, 3.0f) == 3.0f);
}

static void Test_Names() {
    using cl::Activation;
    assert(cl::ParseActivation("relu") == Activation::kReLU);
    assert(cl::ParseActivation("Sigmoid") == Activation::kSigmoid);
    assert(cl::ParseActivation("TANH") == Activation::kTanh);
    assert(cl::ParseActivation("none") == Activation::kNone);
    assert(std::string(cl::ActivationName(Activation::kSigmoid)) == "sigmoid");
    assert(cl::ActivationLabel(Activation::kReLU) == "RELU");
    EXPECT_THROW(cl::ParseActivation("softmax"), std::invalid_argument);
    EXPECT_THROW(cl::ParseActivation(""), std::invalid_argument);
}

static void Test_SampleActivation() {
    using cl::Activation;
    const auto pts = cl::SampleActivation(Activation::kReLU, 10.0f, 20);
    assert(pts.size() == 21u);
    assert(pts.front().first == -10.0f);
    assert(Near(pts.back().first, 10.0f));
    assert(pts.front().second == 0.0f);
    assert(Near(pts.back().second, 10.0f));
    // Midpoint is x = 0.
    assert(Near(pts[10].first, 0.0f));

    EXPECT_THROW(cl::SampleActivation(Activation::kTanh, 10.0f, 0), std::invalid_argument);
    EXPECT_THROW(cl::SampleActivation(Activation::kTanh, 0.0f, 10), std::invalid_argument);
}

int main() {
    Test_ReLU();
    Test_Sigmoid();
    Test_Tanh_And_None();
    Test_Names();
    Test_SampleActivation();
    std::cout << "[OK] Activation tests passed.\n";
    return 0;
}
