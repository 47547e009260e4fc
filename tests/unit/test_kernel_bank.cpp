#include "model/kernel_bank.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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

bool KernelEquals(const Kernel& k, const std::vector<std::vector<float>>& rows) {
    return k.weights() == Matrix::FromRows(rows);
}

void TEST_GenerateReturnsFourKernels() {
    std::cout << "[RUN ] GenerateReturnsFourKernels\n";
    for (int k : {3, 5}) {
        const KernelSet set = KernelBank::Generate(k);
        CHECK(set.size() == 4, "Generate must return 4 kernels for k=" + std::to_string(k));
        for (KernelKind kind : kAllKernelKinds) {
            CHECK(set.count(kind) == 1, "missing kind " + std::string(KernelKindToString(kind)));
            CHECK(FindKernel(set, kind).size() == k, "kernel side should equal k");
            CHECK(FindKernel(set, kind).kind() == kind, "kernel kind should round-trip");
        }
    }
    std::cout << "[DONE] GenerateReturnsFourKernels\n";
}

void TEST_EdgeKernels3() {
    std::cout << "[RUN ] EdgeKernels3\n";
    const KernelSet set = KernelBank::Generate(3);
    CHECK(KernelEquals(FindKernel(set, KernelKind::kHorizontalEdge),
                       {{-1, -1, -1}, {2, 2, 2}, {-1, -1, -1}}),
          "horizontal edge 3x3 layout");
    CHECK(KernelEquals(FindKernel(set, KernelKind::kVerticalEdge),
                       {{-1, 2, -1}, {-1, 2, -1}, {-1, 2, -1}}),
          "vertical edge 3x3 layout");
    CHECK(FindKernel(set, KernelKind::kHorizontalEdge).WeightSum() == 0.0f, "horizontal 3x3 sums to zero");
    CHECK(FindKernel(set, KernelKind::kVerticalEdge).WeightSum() == 0.0f, "vertical 3x3 sums to zero");
    std::cout << "[DONE] EdgeKernels3\n";
}

void TEST_EdgeKernels5() {
    std::cout << "[RUN ] EdgeKernels5\n";
    const Kernel h = KernelBank::Make(KernelKind::kHorizontalEdge, 5);
    const Kernel v = KernelBank::Make(KernelKind::kVerticalEdge, 5);
    for (int y = 0; y < 5; ++y) {
        for (int x = 0; x < 5; ++x) {
            CHECK(h.Weight(x, y) == (y == 2 ? 2.0f : -1.0f), "horizontal 5x5 cell");
            CHECK(v.Weight(x, y) == (x == 2 ? 2.0f : -1.0f), "vertical 5x5 cell");
        }
    }
    // 5 * 2 - 20 * 1: not zero-sum at this size.
    CHECK(h.WeightSum() == -10.0f, "horizontal 5x5 weight sum should be -10");
    std::cout << "[DONE] EdgeKernels5\n";
}

void TEST_Sharpen() {
    std::cout << "[RUN ] Sharpen\n";
    CHECK(KernelEquals(KernelBank::Make(KernelKind::kSharpen, 3),
                       {{0, -1, 0}, {-1, 5, -1}, {0, -1, 0}}),
          "sharpen 3x3 is a cross around 5");

    const Kernel s5 = KernelBank::Make(KernelKind::kSharpen, 5);
    CHECK(s5.Weight(2, 2) == 9.0f, "sharpen 5x5 center must be 9");
    int non_zero = 0;
    for (float w : s5.weights().data) non_zero += (w != 0.0f);
    CHECK(non_zero == 1, "sharpen 5x5 has only the center set");
    std::cout << "[DONE] Sharpen\n";
}

void TEST_Emboss() {
    std::cout << "[RUN ] Emboss\n";
    CHECK(KernelEquals(KernelBank::Make(KernelKind::kEmboss, 3),
                       {{-2, -1, 0}, {-1, 1, 1}, {0, 1, 2}}),
          "emboss 3x3 literal");

    const Kernel e5 = KernelBank::Make(KernelKind::kEmboss, 5);
    for (int y = 0; y < 5; ++y) {
        for (int x = 0; x < 5; ++x) {
            CHECK(e5.Weight(x, y) == ((x == 2 && y == 2) ? 1.0f : 0.0f), "emboss 5x5 is identity");
        }
    }
    CHECK(e5.name() == "Emboss (3x3)", "emboss keeps its label at every size");
    std::cout << "[DONE] Emboss\n";
}

void TEST_Names() {
    std::cout << "[RUN ] Names\n";
    CHECK(ParseKernelKind("horizontal") == KernelKind::kHorizontalEdge, "parse config key");
    CHECK(ParseKernelKind("Vertical Edge") == KernelKind::kVerticalEdge, "parse display name");
    CHECK(ParseKernelKind("SHARPEN") == KernelKind::kSharpen, "parse is case-insensitive");
    CHECK(ParseKernelKind("emboss (3x3)") == KernelKind::kEmboss, "parse emboss label");
    bool threw = false;
    try { (void)ParseKernelKind("blur"); } catch (const std::invalid_argument&) { threw = true; }
    CHECK(threw, "unknown filter name should throw");
    std::cout << "[DONE] Names\n";
}

void TEST_InvalidSizes() {
    std::cout << "[RUN ] InvalidSizes\n";
    for (int k : {-3, 0, 1, 2, 4, 6}) {
        bool threw = false;
        try { (void)KernelBank::Generate(k); } catch (const std::invalid_argument&) { threw = true; }
        CHECK(threw, "Generate should reject k=" + std::to_string(k));
    }
    // Odd sizes beyond 5 are accepted.
    CHECK(KernelBank::Generate(7).size() == 4, "k=7 should generate");
    std::cout << "[DONE] InvalidSizes\n";
}

void TEST_RegenerationIsDeterministic() {
    std::cout << "[RUN ] RegenerationIsDeterministic\n";
    const KernelSet a = KernelBank::Generate(5);
    const KernelSet b = KernelBank::Generate(5);
    for (KernelKind kind : kAllKernelKinds) {
        CHECK(FindKernel(a, kind).weights() == FindKernel(b, kind).weights(), "same size, same weights");
    }
    std::cout << "[DONE] RegenerationIsDeterministic\n";
}

} // namespace

int main() {
    std::cout << "=== KernelBank Unit Tests ===\n";
    TEST_GenerateReturnsFourKernels();
    TEST_EdgeKernels3();
    TEST_EdgeKernels5();
    TEST_Sharpen();
    TEST_Emboss();
    TEST_Names();
    TEST_InvalidSizes();
    TEST_RegenerationIsDeterministic();
    if (g_failures == 0) {
        std::cout << "[PASS] All tests passed.\n";
        return 0;
    } else {
        std::cout << "[FAIL] " << g_failures << " test(s) failed.\n";
        return 1;
    }
}
