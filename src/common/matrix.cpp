#include "common/matrix.hpp"

namespace cl {

void Matrix::Validate(const std::string& who) const {
  if (dim < 0) {
    throw std::invalid_argument(who + ": negative matrix dimension");
  }
  const std::size_t expect = static_cast<std::size_t>(dim) * static_cast<std::size_t>(dim);
  if (data.size() != expect) {
    throw std::invalid_argument(who + ": matrix holds " + std::to_string(data.size()) +
                                " values, expected " + std::to_string(expect));
  }
}

Matrix Matrix::FromRows(const std::vector<std::vector<float>>& rows) {
  const int n = static_cast<int>(rows.size());
  Matrix m(n);
  for (int y = 0; y < n; ++y) {
    if (static_cast<int>(rows[static_cast<std::size_t>(y)].size()) != n) {
      throw std::invalid_argument("Matrix::FromRows: row " + std::to_string(y) +
                                  " is not " + std::to_string(n) + " wide");
    }
    for (int x = 0; x < n; ++x) {
      m.At(x, y) = rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
    }
  }
  return m;
}

bool operator==(const Matrix& a, const Matrix& b) {
  return a.dim == b.dim && a.data == b.data;
}

} // namespace cl
