#pragma once
#include <stdexcept>

namespace cl {

struct OutputCoord {
  int x = 0;
  int y = 0;
};

/**
 * ScanCursor
 *
 * Animation driver for the scan mode: walks the output coordinates of an
 * out_dim x out_dim feature map in row-major order and wraps around.
 * Holds no timer; the caller decides the cadence.
 */
class ScanCursor {
public:
  ScanCursor() = default;
  explicit ScanCursor(int out_dim) { Reset(out_dim); }

  void Reset(int out_dim) {
    out_dim_ = out_dim > 0 ? out_dim : 0;
    index_   = 0;
  }

  bool HasCoordinates() const { return out_dim_ > 0; }
  int  out_dim() const { return out_dim_; }
  long long index() const { return index_; }

  // Returns the current coordinate and advances.
  OutputCoord Next() {
    if (!HasCoordinates()) throw std::out_of_range("ScanCursor::Next: empty feature map");
    const long long total = static_cast<long long>(out_dim_) * out_dim_;
    if (index_ >= total) index_ = 0;
    OutputCoord c{static_cast<int>(index_ % out_dim_), static_cast<int>(index_ / out_dim_)};
    ++index_;
    return c;
  }

private:
  int out_dim_ = 0;
  long long index_ = 0;
};

} // namespace cl
