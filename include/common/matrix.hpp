// All comments are in English.
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace cl {

// Square row-major matrix: value(x, y) lives at data[y * dim + x].
struct Matrix {
  int dim = 0;
  std::vector<float> data;

  Matrix() = default;
  explicit Matrix(int d, float fill = 0.0f)
    : dim(d), data(static_cast<std::size_t>(d < 0 ? 0 : d) * static_cast<std::size_t>(d < 0 ? 0 : d), fill) {
    if (d < 0) throw std::invalid_argument("Matrix: negative dimension");
  }

  static std::size_t Index(int x, int y, int dim) {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(dim) +
           static_cast<std::size_t>(x);
  }

  bool Contains(int x, int y) const {
    return x >= 0 && x < dim && y >= 0 && y < dim;
  }

  float  At(int x, int y) const { return data[Index(x, y, dim)]; }
  float& At(int x, int y)       { return data[Index(x, y, dim)]; }

  // Zero outside the grid.
  float ValueOrZero(int x, int y) const {
    return Contains(x, y) ? At(x, y) : 0.0f;
  }

  std::size_t size() const { return data.size(); }
  bool empty() const { return data.empty(); }

  // Throws if data.size() != dim*dim.
  void Validate(const std::string& who) const;

  // Builds a matrix from nested rows; every row must have rows.size() entries.
  static Matrix FromRows(const std::vector<std::vector<float>>& rows);
};

bool operator==(const Matrix& a, const Matrix& b);
inline bool operator!=(const Matrix& a, const Matrix& b) { return !(a == b); }

} // namespace cl
