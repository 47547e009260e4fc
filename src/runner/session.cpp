// All comments are in English.
#include "runner/session.hpp"

#include <chrono>
#include <cstdint>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "model/print.hpp"
#include "runner/scan_cursor.hpp"
#include "stats/feature_map_csv.hpp"

using nlohmann::json;

namespace cl {

namespace {

std::string ReadAllText_(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error("ParseSessionConfig: cannot open json file: " + path);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
}

// Floats, strings and values outside int range are rejected.
int ToInt(const json& v, const std::string& what) {
  if (!v.is_number_integer()) {
    throw std::invalid_argument("ParseSessionConfig: " + what + " must be an integer, got " + v.dump());
  }
  const bool too_big = v.is_number_unsigned()
      ? v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
      : (v.get<std::int64_t>() < std::numeric_limits<int>::min() ||
         v.get<std::int64_t>() > std::numeric_limits<int>::max());
  if (too_big) {
    throw std::invalid_argument("ParseSessionConfig: " + what + " out of range, got " + v.dump());
  }
  return static_cast<int>(v.get<std::int64_t>());
}

int ReadInt(const json& j, const char* key, int fallback) {
  if (!j.contains(key)) return fallback;
  return ToInt(j.at(key), std::string("'") + key + "'");
}

KernelKind ParseFilterField(const json& j) {
  if (!j.contains("filter")) return KernelKind::kHorizontalEdge;
  return ParseKernelKind(j.at("filter").get<std::string>());
}

Matrix ParseInputGrid(const json& ji, int grid_size) {
  if (!ji.is_array()) {
    throw std::invalid_argument("ParseSessionConfig: 'input' must be \"zeros\" or a nested array");
  }
  std::vector<std::vector<float>> rows;
  rows.reserve(ji.size());
  for (const auto& jr : ji) {
    if (!jr.is_array()) {
      throw std::invalid_argument("ParseSessionConfig: 'input' rows must be arrays");
    }
    rows.push_back(jr.get<std::vector<float>>());
  }
  Matrix m = Matrix::FromRows(rows);
  if (m.dim != grid_size) {
    throw std::invalid_argument("ParseSessionConfig: 'input' is " + std::to_string(m.dim) + "x" +
                                std::to_string(m.dim) + " but grid_size is " +
                                std::to_string(grid_size));
  }

  int out_of_range = 0;
  for (float v : m.data) {
    if (!std::isfinite(v)) {
      throw std::invalid_argument("ParseSessionConfig: 'input' contains a non-finite value");
    }
    if (v < 0.0f || v > kMaxIntensity) ++out_of_range;
  }
  if (out_of_range > 0) {
    std::cerr << "[ParseSessionConfig][Warn] " << out_of_range
              << " input value(s) outside [0, 1]. Proceeding with provided values.\n";
  }
  return m;
}

std::filesystem::path BuildCsvPath(const std::string& output_dir, const Session& session) {
  std::filesystem::path dir(output_dir);
  std::filesystem::path file =
      std::string("feature_maps_k") + std::to_string(session.kernel_size()) +
      "_s" + std::to_string(session.conv().stride) +
      "_p" + std::to_string(session.conv().padding) +
      "_" + ActivationName(session.conv().activation) + ".csv";
  return dir / file;
}

SessionConfig ParseFields_(const json& j) {
  SessionConfig cfg;
  cfg.grid_size    = ReadInt(j, "grid_size", kDefaultGridSize);
  cfg.kernel_size  = ReadInt(j, "kernel_size", kDefaultKernelSize);
  cfg.conv.stride  = ReadInt(j, "stride", kDefaultStride);
  cfg.conv.padding = ReadInt(j, "padding", kDefaultPadding);
  cfg.conv.activation = ParseActivation(j.value("activation", std::string("relu")));
  cfg.verbose    = j.value("verbose", false);
  cfg.output_dir = j.value("output_dir", std::string());

  // Basic sanity checks to fail fast
  if (cfg.grid_size <= 0 || cfg.grid_size > kMaxGridSize) {
    throw std::invalid_argument("ParseSessionConfig: grid_size must be in [1, " +
                                std::to_string(kMaxGridSize) + "], got " +
                                std::to_string(cfg.grid_size));
  }
  KernelBank::CheckKernelSize(cfg.kernel_size);
  cfg.conv.Validate();
  if (cfg.conv.padding != 0) {
    std::cerr << "[ParseSessionConfig][Warn] padding=" << cfg.conv.padding
              << " (the visualizer normally runs with valid padding).\n";
  }

  if (j.contains("input")) {
    const auto& ji = j.at("input");
    if (ji.is_string()) {
      if (ji.get<std::string>() != "zeros") {
        throw std::invalid_argument("ParseSessionConfig: unknown input preset '" +
                                    ji.get<std::string>() + "'");
      }
    } else {
      cfg.input = ParseInputGrid(ji, cfg.grid_size);
    }
  }

  if (j.contains("strokes")) {
    const auto& jstrokes = j.at("strokes");
    if (!jstrokes.is_array()) {
      throw std::invalid_argument("ParseSessionConfig: 'strokes' must be an array");
    }
    for (const auto& js : jstrokes) {
      if (!js.is_array() || js.size() != 2) {
        throw std::invalid_argument("ParseSessionConfig: each stroke must be [x, y]");
      }
      cfg.strokes.emplace_back(ToInt(js.at(0), "stroke x"), ToInt(js.at(1), "stroke y"));
    }
  }

  if (j.contains("trace")) {
    const auto& jt = j.at("trace");
    if (!jt.is_object()) {
      throw std::invalid_argument("ParseSessionConfig: 'trace' must be an object");
    }
    TraceRequest t;
    t.kind = ParseFilterField(jt);
    t.x = ReadInt(jt, "x", 0);
    t.y = ReadInt(jt, "y", 0);
    cfg.trace = t;
  }

  if (j.contains("scan")) {
    const auto& js = j.at("scan");
    if (!js.is_object()) {
      throw std::invalid_argument("ParseSessionConfig: 'scan' must be an object");
    }
    ScanRequest s;
    s.kind        = ParseFilterField(js);
    s.steps       = ReadInt(js, "steps", 0);
    s.interval_ms = ReadInt(js, "interval_ms", kScanIntervalMs);
    if (s.steps < 0 || s.interval_ms < 0) {
      throw std::invalid_argument("ParseSessionConfig: scan steps and interval_ms must be non-negative");
    }
    cfg.scan = s;
  }

  return cfg;
}

} // namespace

SessionConfig ParseSessionConfigText(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument(std::string("ParseSessionConfig: malformed JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw std::invalid_argument("ParseSessionConfig: top-level value must be an object");
  }

  // Remaining type mismatches (strings where numbers belong, non-string names).
  try {
    return ParseFields_(j);
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("ParseSessionConfig: wrong value type: ") + e.what());
  }
}

SessionConfig ParseSessionConfig(const std::string& json_path) {
  return ParseSessionConfigText(ReadAllText_(json_path));
}

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------

Session::Session()
  : surface_(kDefaultGridSize),
    kernel_size_(kDefaultKernelSize),
    kernels_(KernelBank::Generate(kDefaultKernelSize)) {}

Session::Session(const SessionConfig& cfg)
  : surface_(cfg.grid_size),
    kernel_size_(cfg.kernel_size),
    kernels_(KernelBank::Generate(cfg.kernel_size)),
    conv_(cfg.conv) {
  conv_.Validate();
  if (cfg.input) surface_.SetMatrix(*cfg.input);
  for (const auto& [x, y] : cfg.strokes) surface_.Paint(x, y);
}

void Session::SetGridSize(int n) {
  surface_.Resize(n);
  Invalidate_();
}

void Session::SetKernelSize(int k) {
  // Replace the whole set; kernels from the old size are not kept.
  kernels_ = KernelBank::Generate(k);
  kernel_size_ = k;
  Invalidate_();
}

void Session::SetStride(int stride) {
  ConvConfig next = conv_;
  next.stride = stride;
  next.Validate();
  conv_ = next;
  Invalidate_();
}

void Session::SetPadding(int padding) {
  ConvConfig next = conv_;
  next.padding = padding;
  next.Validate();
  conv_ = next;
  Invalidate_();
}

void Session::SetActivation(Activation a) {
  conv_.activation = a;
  Invalidate_();
}

void Session::Paint(int x, int y) {
  surface_.Paint(x, y);
  Invalidate_();
}

void Session::LoadRgba(const std::vector<std::uint8_t>& rgba) {
  surface_.LoadRgba(rgba, surface_.dim());
  Invalidate_();
}

void Session::SetInput(const Matrix& m) {
  surface_.SetMatrix(m);
  Invalidate_();
}

void Session::ClearInput() {
  surface_.Clear();
  Invalidate_();
}

const std::vector<FeatureMap>& Session::FeatureMaps() {
  if (dirty_) {
    maps_ = ConvolveAll(surface_.matrix(), kernels_, conv_);
    dirty_ = false;
    ++recompute_count_;
  }
  return maps_;
}

MathTrace Session::Explain(KernelKind kind, int x, int y) const {
  return cl::Explain(surface_.matrix(), FindKernel(kernels_, kind), conv_, x, y);
}

int Session::OutDim() const {
  return DeriveOutDim(surface_.dim(), conv_.padding, kernel_size_, conv_.stride);
}

// -----------------------------------------------------------------------------
// RunSession
// -----------------------------------------------------------------------------

std::string RunSession(const SessionConfig& cfg, std::ostream& os) {
  Session session(cfg);

  os << "[Session] grid=" << session.surface().dim()
     << " kernel=" << session.kernel_size() << "x" << session.kernel_size()
     << " stride=" << session.conv().stride
     << " padding=" << session.conv().padding
     << " activation=" << ActivationName(session.conv().activation) << "\n";

  if (cfg.verbose) {
    os << "Input\n" << model::FormatMatrix(session.surface().matrix());
  }

  for (const auto& [kind, kernel] : session.kernels()) {
    (void)kind;
    os << model::FormatKernel(kernel);
  }

  const auto& maps = session.FeatureMaps();
  for (const auto& fm : maps) {
    os << model::FormatFeatureMap(fm);
    if (cfg.verbose) {
      os << "[Session] " << fm.name << ": " << fm.data.size() << " values\n";
    }
  }
  if (session.OutDim() == 0) {
    os << "[Session] Kernel does not fit the input; feature maps are empty.\n";
  }

  if (cfg.trace) {
    const auto& t = *cfg.trace;
    const MathTrace trace = session.Explain(t.kind, t.x, t.y);
    os << model::FormatTrace(trace, session.conv().activation, session.surface().dim());
  }

  if (cfg.scan && cfg.scan->steps > 0) {
    const auto& s = *cfg.scan;
    ScanCursor cursor(session.OutDim());
    if (!cursor.HasCoordinates()) {
      std::cerr << "[Scan][Warn] nothing to scan: feature maps are empty.\n";
    } else {
      for (int i = 0; i < s.steps; ++i) {
        const OutputCoord c = cursor.Next();
        const MathTrace trace = session.Explain(s.kind, c.x, c.y);
        os << "[Scan] step " << i << ": " << trace.filter_name
           << " at (" << c.x << ", " << c.y << ") sum=" << trace.sum
           << " out=" << trace.activated_value << "\n";
        if (s.interval_ms > 0 && i + 1 < s.steps) {
          std::this_thread::sleep_for(std::chrono::milliseconds(s.interval_ms));
        }
      }
    }
  }

  if (cfg.output_dir.empty()) return std::string();

  const auto csv_path = BuildCsvPath(cfg.output_dir, session);
  std::filesystem::create_directories(csv_path.parent_path());
  FeatureMapCsvWriter writer(csv_path.string());
  writer.AppendAll(maps);
  os << "[Session] Feature map CSV written to " << csv_path << "\n";
  return csv_path.string();
}

} // namespace cl
