// All comments are in English.
#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/constants.hpp"
#include "common/matrix.hpp"
#include "model/activation.hpp"
#include "model/conv_engine.hpp"
#include "model/kernel_bank.hpp"
#include "model/math_trace.hpp"
#include "surface/input_surface.hpp"

namespace cl {

struct TraceRequest {
  KernelKind kind = KernelKind::kHorizontalEdge;
  int x = 0;
  int y = 0;
};

struct ScanRequest {
  KernelKind kind        = KernelKind::kHorizontalEdge;
  int        steps       = 0;
  int        interval_ms = kScanIntervalMs;
};

struct SessionConfig {
  int        grid_size   = kDefaultGridSize;
  int        kernel_size = kDefaultKernelSize;
  ConvConfig conv{};

  // Initial input; empty means a zero grid.
  std::optional<Matrix> input;

  // Brush strokes (x, y) applied after the initial input, in order.
  std::vector<std::pair<int, int>> strokes;

  std::optional<TraceRequest> trace;
  std::optional<ScanRequest>  scan;

  std::string output_dir;  // empty: no CSV export
  bool        verbose = false;
};

// Throws std::runtime_error if the file cannot be read, std::invalid_argument
// for malformed or out-of-contract values.
SessionConfig ParseSessionConfig(const std::string& json_path);
SessionConfig ParseSessionConfigText(const std::string& json_text);

/**
 * Session
 *
 * Caller-side owner of the settings, the input surface and the current
 * kernel set. Feature maps are a derived value: any setter invalidates them
 * and FeatureMaps() recomputes from scratch on the next read.
 */
class Session {
public:
  Session();
  explicit Session(const SessionConfig& cfg);

  void SetGridSize(int n);
  void SetKernelSize(int k);
  void SetStride(int stride);
  void SetPadding(int padding);
  void SetActivation(Activation a);

  void Paint(int x, int y);
  void LoadRgba(const std::vector<std::uint8_t>& rgba);
  void SetInput(const Matrix& m);
  void ClearInput();

  const std::vector<FeatureMap>& FeatureMaps();

  // Trace for one kernel of the current set against the current input.
  MathTrace Explain(KernelKind kind, int x, int y) const;

  // Shared output size of every map under the current settings.
  int OutDim() const;

  const InputSurface& surface()     const { return surface_; }
  const KernelSet&    kernels()     const { return kernels_; }
  const ConvConfig&   conv()        const { return conv_; }
  int                 kernel_size() const { return kernel_size_; }

  std::uint64_t recompute_count() const { return recompute_count_; }

private:
  void Invalidate_() { dirty_ = true; }

  InputSurface            surface_;
  int                     kernel_size_ = kDefaultKernelSize;
  KernelSet               kernels_;
  ConvConfig              conv_{};

  std::vector<FeatureMap> maps_;
  bool                    dirty_ = true;
  std::uint64_t           recompute_count_ = 0;
};

// Prints kernels, maps, the requested trace and scan steps to `os`, and
// writes the CSV export when cfg.output_dir is set. Returns the CSV path or
// an empty string.
std::string RunSession(const SessionConfig& cfg, std::ostream& os);

} // namespace cl
