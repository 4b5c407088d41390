#include "stages/loan_math.h"

#include <algorithm>
#include <cmath>

namespace loan {

double ResidualInstallment(const Terms& t, double residual) {
  if (t.months <= 0) return 0.0;
  const double r = MonthlyRate(t.annual_rate_pct);
  const double amortize = std::max(0.0, t.principal - residual);
  const double monthly_amortization = amortize / static_cast<double>(t.months);
  const double average_balance = (t.principal + residual) / 2.0;
  return monthly_amortization + average_balance * r;
}

double AnnuityInstallment(const Terms& t) {
  if (t.months <= 0) return 0.0;
  const double r = MonthlyRate(t.annual_rate_pct);
  const double n = static_cast<double>(t.months);
  if (r <= 0.0) return t.principal / n; // 避免公式 0/0
  const double factor = std::pow(1.0 + r, n);
  return t.principal * (r * factor) / (factor - 1.0);
}

std::vector<carcost::AmortizationRow> AnnuitySchedule(const Terms& t) {
  std::vector<carcost::AmortizationRow> rows;
  if (t.months <= 0) return rows;

  const double r = MonthlyRate(t.annual_rate_pct);
  const double installment = AnnuityInstallment(t);
  double balance = t.principal;
  rows.reserve(static_cast<std::size_t>(t.months));

  for (int m = 1; m <= t.months; ++m) {
    carcost::AmortizationRow row;
    row.month = m;
    row.installment = installment;
    row.interest = balance * r;
    row.principal = installment - row.interest;
    balance -= row.principal;
    row.balance = balance;
    rows.push_back(row);
  }
  return rows;
}

} // namespace loan
