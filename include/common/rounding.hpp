#pragma once
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace carcost {

// 金额展示统一用“四舍五入到整数”（.5 向上）
inline std::int64_t RoundHalfUp(double v) {
  if (!std::isfinite(v)) return 0;
  return static_cast<std::int64_t>(std::floor(v + 0.5));
}

inline std::string FormatFixed2(double v) {
  if (!std::isfinite(v)) v = 0.0;
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << v;
  return oss.str();
}

} // namespace carcost
