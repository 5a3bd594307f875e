#pragma once

namespace nport {

struct PassivityOptions {
  /// Slack allowed on the per-row power sum (passive while sum <= 1 + tol)
  double tolerance = 0.0;

  /// Report the first offending row (and frequency) to stderr
  bool verbose = false;
};

/// Options for operations that align two frequency sweeps (arithmetic, dot).
struct AlignOptions {
  /// Print the size and bounds of the common frequency grid to stderr
  bool verbose = false;
};

} // namespace nport
