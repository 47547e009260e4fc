#include "model/kernel_bank.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace cl {

namespace {

std::string ToLower(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (char ch : in) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

} // namespace

Kernel::Kernel(KernelKind kind, std::string name, Matrix weights)
  : kind_(kind), name_(std::move(name)), weights_(std::move(weights)) {
  weights_.Validate("Kernel");
  if (weights_.dim <= 0 || weights_.dim % 2 == 0) {
    throw std::invalid_argument("Kernel: side length must be odd and positive");
  }
}

float Kernel::WeightSum() const {
  float sum = 0.0f;
  for (float w : weights_.data) sum += w;
  return sum;
}

void KernelBank::CheckKernelSize(int k_size) {
  if (k_size < 3) {
    throw std::invalid_argument("KernelBank: kernel size must be >= 3, got " + std::to_string(k_size));
  }
  if (k_size % 2 == 0) {
    throw std::invalid_argument("KernelBank: kernel size must be odd, got " + std::to_string(k_size));
  }
}

Matrix KernelBank::HorizontalEdge(int k_size) {
  const int center = k_size / 2;
  Matrix m(k_size, -1.0f);
  for (int x = 0; x < k_size; ++x) m.At(x, center) = 2.0f;
  return m;
}

Matrix KernelBank::VerticalEdge(int k_size) {
  const int center = k_size / 2;
  Matrix m(k_size, -1.0f);
  for (int y = 0; y < k_size; ++y) m.At(center, y) = 2.0f;
  return m;
}

Matrix KernelBank::Sharpen(int k_size) {
  const int center = k_size / 2;
  Matrix m(k_size, 0.0f);
  m.At(center, center) = (k_size == 3) ? 5.0f : 9.0f;
  // Only the 3x3 variant gets the cross of -1 around the center.
  if (k_size == 3) {
    m.At(1, 0) = -1.0f;
    m.At(0, 1) = -1.0f;
    m.At(2, 1) = -1.0f;
    m.At(1, 2) = -1.0f;
  }
  return m;
}

Matrix KernelBank::Emboss(int k_size) {
  if (k_size == 3) {
    return Matrix::FromRows({{-2.0f, -1.0f, 0.0f},
                             {-1.0f,  1.0f, 1.0f},
                             { 0.0f,  1.0f, 2.0f}});
  }
  // Larger sizes fall back to identity.
  const int center = k_size / 2;
  Matrix m(k_size, 0.0f);
  m.At(center, center) = 1.0f;
  return m;
}

Kernel KernelBank::Make(KernelKind kind, int k_size) {
  CheckKernelSize(k_size);
  switch (kind) {
    case KernelKind::kHorizontalEdge: return Kernel(kind, KernelDisplayName(kind), HorizontalEdge(k_size));
    case KernelKind::kVerticalEdge:   return Kernel(kind, KernelDisplayName(kind), VerticalEdge(k_size));
    case KernelKind::kSharpen:        return Kernel(kind, KernelDisplayName(kind), Sharpen(k_size));
    case KernelKind::kEmboss:         return Kernel(kind, KernelDisplayName(kind), Emboss(k_size));
  }
  throw std::invalid_argument("KernelBank::Make: unknown kernel kind");
}

KernelSet KernelBank::Generate(int k_size) {
  CheckKernelSize(k_size);
  KernelSet set;
  for (KernelKind kind : kAllKernelKinds) {
    set.emplace(kind, Make(kind, k_size));
  }
  return set;
}

const char* KernelDisplayName(KernelKind kind) {
  switch (kind) {
    case KernelKind::kHorizontalEdge: return "Horizontal Edge";
    case KernelKind::kVerticalEdge:   return "Vertical Edge";
    case KernelKind::kSharpen:        return "Sharpen";
    case KernelKind::kEmboss:         return "Emboss (3x3)";
    default:                          return "unknown";
  }
}

const char* KernelKindToString(KernelKind kind) {
  switch (kind) {
    case KernelKind::kHorizontalEdge: return "horizontal";
    case KernelKind::kVerticalEdge:   return "vertical";
    case KernelKind::kSharpen:        return "sharpen";
    case KernelKind::kEmboss:         return "emboss";
    default:                          return "unknown";
  }
}

KernelKind ParseKernelKind(const std::string& name) {
  const std::string key = ToLower(name);
  for (KernelKind kind : kAllKernelKinds) {
    if (key == KernelKindToString(kind) || key == ToLower(KernelDisplayName(kind))) {
      return kind;
    }
  }
  throw std::invalid_argument("ParseKernelKind: unknown filter '" + name + "'");
}

const Kernel& FindKernel(const KernelSet& set, KernelKind kind) {
  auto it = set.find(kind);
  if (it == set.end()) {
    throw std::out_of_range(std::string("FindKernel: no kernel of kind ") + KernelKindToString(kind));
  }
  return it->second;
}

} // namespace cl
