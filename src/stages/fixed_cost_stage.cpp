#include "stages/fixed_cost_stage.hpp"

#include <variant>

namespace carcost {

bool FixedCostStage::InsuranceBundledInLease(const FinancingPlan& plan) {
  const auto* lease = std::get_if<LeasingFinancing>(&plan);
  return lease != nullptr && lease->includes_insurance;
}

void FixedCostStage::Run(CostContext& ctx) {
  const auto& in = ctx.input;

  ctx.annual.tax = in.annual_tax + (in.has_malus_tax ? in.malus_tax_amount : 0.0);
  ctx.annual.insurance = InsuranceBundledInLease(in.financing) ? 0.0 : in.insurance_monthly * 12.0;
  ctx.annual.parking = in.parking_monthly * 12.0;
  ctx.annual.ancillary_care = in.ancillary_care_monthly * 12.0;
}

} // namespace carcost
