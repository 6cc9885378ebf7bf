#include "cotuong/engine/lmr_red.hpp"

#include <limits>

namespace cotuong::engine {

// atanh series for ln(x), x near 1.
constexpr double ct_log_near_one(double x) {
  const double y = (x - 1.0) / (x + 1.0);
  const double y2 = y * y;
  double term = y;
  double sum = 0.0;
  for (int n = 1; n <= 49; n += 2) {
    sum += term / static_cast<double>(n);
    term *= y2;
  }
  return 2.0 * sum;
}

// ln usable in constant evaluation; halves x into [1, 2) first.
constexpr double ct_log(double x) {
  if (!(x > 0.0)) return -std::numeric_limits<double>::infinity();
  int k = 0;
  while (x >= 2.0) {
    x /= 2.0;
    ++k;
  }
  return k * ct_log_near_one(2.0) + ct_log_near_one(x);
}

// r = 1 + ln(d) * ln(m) / 1.5 from depth 3 and the fifth move on, never below depth 1.
consteval LMRTable build_LMR_RED(double base = 1.0, double scale = 1.5) {
  LMRTable table{};
  for (int d = 0; d <= LMR_MAX_D; ++d) {
    for (int m = 0; m <= LMR_MAX_M; ++m) {
      if (d < 3 || m < 4) {
        table[d][m] = 0;
        continue;
      }
      const double rd =
          base + ct_log(static_cast<double>(d)) * ct_log(static_cast<double>(m)) / scale;
      int r = static_cast<int>(rd);
      if (r > d - 1) r = d - 1;
      table[d][m] = r;
    }
  }
  return table;
}

alignas(64) constexpr LMRTable LMR_RED = build_LMR_RED();

}  // namespace cotuong::engine
