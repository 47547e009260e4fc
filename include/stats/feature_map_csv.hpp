// All comments are in English.
#pragma once
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/matrix.hpp"
#include "model/conv_engine.hpp"

namespace cl {

// Writes one row per feature map cell: filter,dim,y,x,value.
class FeatureMapCsvWriter {
public:
  explicit FeatureMapCsvWriter(const std::string& path, bool append = false)
  : path_(path)
  {
    std::ios_base::openmode mode = std::ios::out;
    mode |= (append ? std::ios::app : std::ios::trunc);
    file_.open(path_, mode);
    if (!file_.is_open()) {
      throw std::runtime_error("FeatureMapCsvWriter: failed to open file: " + path_);
    }
    if (!append) {
      WriteHeader_();
    } else {
      file_.seekp(0, std::ios::end);
      if (file_.tellp() == 0) {
        WriteHeader_();
      }
    }
    file_ << std::fixed << std::setprecision(6);
  }

  // Empty maps contribute no rows.
  void AppendMap(const FeatureMap& fm) {
    for (int y = 0; y < fm.dim; ++y) {
      for (int x = 0; x < fm.dim; ++x) {
        file_ << std::quoted(fm.name) << ','
              << fm.dim << ','
              << y << ','
              << x << ','
              << fm.At(x, y) << '\n';
      }
    }
    file_.flush();
  }

  void AppendAll(const std::vector<FeatureMap>& maps) {
    for (const auto& fm : maps) AppendMap(fm);
  }

  const std::string& path() const { return path_; }

private:
  void WriteHeader_() {
    file_ << "filter,dim,y,x,value\n";
  }

  std::string path_;
  std::ofstream file_;
};

} // namespace cl
