// All comments are in English.
#include <exception>
#include <iostream>
#include <string>

#include "runner/session.hpp"

namespace {

// Diagonal stroke plus a horizontal bar, traced with the sharpen kernel.
cl::SessionConfig DemoConfig() {
  cl::SessionConfig cfg;
  for (int i = 2; i < 12; ++i) cfg.strokes.emplace_back(i, i);
  for (int x = 3; x < 11; ++x) cfg.strokes.emplace_back(x, 4);
  cl::TraceRequest trace;
  trace.kind = cl::KernelKind::kSharpen;
  trace.x = 3;
  trace.y = 3;
  cfg.trace = trace;
  return cfg;
}

} // namespace

int main(int argc, char** argv) {
  // Usage: ./convlens <session.json> | --demo
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <session.json>\n"
              << "       " << argv[0] << " --demo\n";
    return 1;
  }

  const std::string arg = argv[1];

  try {
    const cl::SessionConfig cfg =
        (arg == "--demo") ? DemoConfig() : cl::ParseSessionConfig(arg);

    cl::RunSession(cfg, std::cout);

    std::cout << "[convlens] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[convlens] Error: " << ex.what() << "\n";
    return 2;
  }
}
