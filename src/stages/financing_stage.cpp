#include "stages/financing_stage.hpp"

#include <algorithm>
#include <variant>

#include "common/rounding.hpp"
#include "stages/loan_math.h"

namespace carcost {

namespace {

void RunLoan(const LoanFinancing& lf, double price, int max_years, FinancingResult* out) {
  if (lf.term_years <= 0) return;
  const int years = std::min(lf.term_years, max_years);

  loan::Terms terms;
  terms.principal = price - price * (lf.down_payment_percent / 100.0);
  terms.annual_rate_pct = lf.interest_rate_percent;
  terms.months = years * 12;
  out->principal = terms.principal;

  double installment = 0.0;
  if (lf.type == LoanType::kResidual) {
    out->residual = price * (lf.residual_value_percent / 100.0);
    installment = loan::ResidualInstallment(terms, out->residual);
  } else {
    installment = loan::AnnuityInstallment(terms);
    out->schedule = loan::AnnuitySchedule(terms);
  }
  out->monthly_installment = RoundHalfUp(installment);
}

} // namespace

void FinancingStage::Run(CostContext& ctx) {
  ctx.financing = {};

  const auto& plan = ctx.input.financing;
  if (const auto* lease = std::get_if<LeasingFinancing>(&plan)) {
    ctx.financing.monthly_installment = RoundHalfUp(lease->monthly_fee);
  } else if (const auto* lf = std::get_if<LoanFinancing>(&plan)) {
    RunLoan(*lf, ctx.input.purchase_price, k_.max_horizon_years, &ctx.financing);
  }
  // CashFinancing：保持 0

  ctx.annual.financing = static_cast<double>(ctx.financing.monthly_installment * 12);
}

} // namespace carcost
