#pragma once
#include <vector>

#include "common/types.hpp"

namespace loan {

// 贷款月供的基础公式。No IO, no rounding: 取整由 FinancingStage 负责。

struct Terms {
  double principal = 0.0;       // 贷款本金 = 价格 - 首付
  double annual_rate_pct = 0.0; // 年利率 %
  int months = 0;
};

inline double MonthlyRate(double annual_rate_pct) {
  return annual_rate_pct / 100.0 / 12.0;
}

// 尾款（气球）贷款：
//   每月摊还 = max(0, principal - residual) / months
//   每月利息 = monthly_rate * (principal + residual) / 2   （按平均余额计息）
// months <= 0 返回 0。
double ResidualInstallment(const Terms& t, double residual);

// 等额本息：P * r(1+r)^n / ((1+r)^n - 1)，r == 0 时为 P / n。
double AnnuityInstallment(const Terms& t);

// 等额本息逐月明细（installment 未取整；最后一期余额应回到 ~0）
std::vector<carcost::AmortizationRow> AnnuitySchedule(const Terms& t);

} // namespace loan
