// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>

namespace cl {

// -----------------------------------------------------------------------------
// Input surface
// -----------------------------------------------------------------------------
inline constexpr int   kDefaultGridSize   = 14;
inline constexpr int   kMaxGridSize       = 256;
inline constexpr float kBrushCenter       = 1.0f;
inline constexpr float kBrushNeighbor     = 0.5f;
inline constexpr float kMaxIntensity      = 1.0f;

// -----------------------------------------------------------------------------
// Kernels / convolution
// -----------------------------------------------------------------------------
inline constexpr int kDefaultKernelSize = 3;
inline constexpr int kDefaultStride     = 1;
inline constexpr int kDefaultPadding    = 0;   // "valid"
inline constexpr int kMaxPadding        = 16;
inline constexpr int kNumKernelKinds    = 4;

// -----------------------------------------------------------------------------
// Math trace display
// -----------------------------------------------------------------------------
inline constexpr std::size_t kTraceDisplayTerms   = 9;
inline constexpr int         kTraceFullGridLimit  = 14;  // keep zero products up to this grid size

// -----------------------------------------------------------------------------
// Scan animation
// -----------------------------------------------------------------------------
inline constexpr int kScanIntervalMs = 200;

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(kDefaultGridSize > 0,            "kDefaultGridSize must be positive");
static_assert(kDefaultKernelSize % 2 == 1,     "kDefaultKernelSize must be odd");
static_assert(kDefaultStride > 0,              "kDefaultStride must be positive");
static_assert(kDefaultGridSize <= kMaxGridSize, "kDefaultGridSize exceeds kMaxGridSize");
static_assert(kDefaultPadding <= kMaxPadding,   "kDefaultPadding exceeds kMaxPadding");
static_assert(kTraceDisplayTerms > 0,          "kTraceDisplayTerms must be positive");
static_assert(kScanIntervalMs > 0,             "kScanIntervalMs must be positive");

} // namespace cl
