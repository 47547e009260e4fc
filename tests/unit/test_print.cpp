#include "model/print.hpp"
#include <iostream>
#include <string>

/* All comments are in English.
 * Minimal test harness:
 *  - Use CHECK(cond, msg) to record failures without stopping the run.
 *  - Each test is a function; main() aggregates results.
 */

using namespace cl;

namespace {
int g_failures = 0;

void CHECK(bool cond, const std::string& msg) {
    if (!cond) {
        ++g_failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

bool Has(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

ConvConfig NoneCfg(int padding = 0) {
    ConvConfig c;
    c.padding = padding;
    c.activation = Activation::kNone;
    return c;
}

void TEST_FormatKernel() {
    std::cout << "[RUN ] FormatKernel\n";
    const std::string s = model::FormatKernel(KernelBank::Make(KernelKind::kSharpen, 3));
    CHECK(Has(s, "Sharpen [3x3]"), "header names kernel and size");
    CHECK(Has(s, " -1   5  -1"), "middle row printed as integers");
    std::cout << "[DONE] FormatKernel\n";
}

void TEST_FormatFeatureMap() {
    std::cout << "[RUN ] FormatFeatureMap\n";
    const FeatureMap fm = Convolve(Matrix(3, 1.0f), KernelBank::Make(KernelKind::kSharpen, 3), NoneCfg());
    const std::string s = model::FormatFeatureMap(fm);
    CHECK(Has(s, "Sharpen 1x1"), "header with dims");
    CHECK(Has(s, "1.00"), "value printed with 2 decimals");

    const FeatureMap empty = Convolve(Matrix(3, 1.0f), KernelBank::Make(KernelKind::kSharpen, 5), NoneCfg());
    CHECK(Has(model::FormatFeatureMap(empty), "(empty)"), "empty maps are labelled");
    std::cout << "[DONE] FormatFeatureMap\n";
}

void TEST_FormatTrace() {
    std::cout << "[RUN ] FormatTrace\n";
    const MathTrace t = Explain(Matrix(3, 1.0f), KernelBank::Make(KernelKind::kSharpen, 3), NoneCfg(), 0, 0);
    const std::string s = model::FormatTrace(t, Activation::kNone, 3);
    CHECK(Has(s, "Analyzing: Sharpen at (0, 0)"), "headline");
    CHECK(Has(s, "(8) "), "all nine terms listed");
    CHECK(!Has(s, "more"), "no overflow line for nine terms");
    CHECK(Has(s, "Sum: 1.00"), "sum line");
    CHECK(Has(s, "NONE(Sum): 1.00"), "activation line uses the uppercase label");
    std::cout << "[DONE] FormatTrace\n";
}

void TEST_FormatTraceTruncatesAndMarksPadding() {
    std::cout << "[RUN ] FormatTraceTruncatesAndMarksPadding\n";
    const MathTrace t = Explain(Matrix(5, 0.5f), KernelBank::Make(KernelKind::kEmboss, 5), NoneCfg(2), 0, 0);
    CHECK(t.terms.size() == 25, "25 terms for 5x5");
    const std::string s = model::FormatTrace(t, Activation::kReLU, 5);
    CHECK(Has(s, "0 (pad)"), "padding cells are marked");
    CHECK(!Has(s, "(9) "), "only nine terms listed");
    CHECK(Has(s, "...and 16 more"), "overflow count");
    CHECK(Has(s, "RELU(Sum):"), "relu label");
    std::cout << "[DONE] FormatTraceTruncatesAndMarksPadding\n";
}

} // namespace

int main() {
    std::cout << "=== Print Unit Tests ===\n";
    TEST_FormatKernel();
    TEST_FormatFeatureMap();
    TEST_FormatTrace();
    TEST_FormatTraceTruncatesAndMarksPadding();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
