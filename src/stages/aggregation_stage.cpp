#include "stages/aggregation_stage.hpp"

#include "common/rounding.hpp"

namespace carcost {

void AggregationStage::Run(CostContext& ctx) {
  const AnnualCosts& a = ctx.annual;
  CostBreakdown& b = ctx.breakdown;
  b = {};

  b.fuel = RoundHalfUp(a.fuel);
  b.depreciation = RoundHalfUp(a.depreciation);
  b.tax = RoundHalfUp(a.tax);
  b.maintenance = RoundHalfUp(a.maintenance);
  b.tires = RoundHalfUp(a.tires);
  b.insurance = RoundHalfUp(a.insurance);
  b.parking = RoundHalfUp(a.parking);
  b.ancillary_care = RoundHalfUp(a.ancillary_care);
  // 融资在 FinancingStage 已按月取整
  b.monthly_installment = ctx.financing.monthly_installment;
  b.financing = ctx.financing.monthly_installment * 12;

  const double variable = a.fuel + a.maintenance + a.tires;
  const double fixed = a.tax + a.insurance + a.parking + a.ancillary_care + a.financing + a.depreciation;
  b.variable_costs = RoundHalfUp(variable);
  b.fixed_costs = RoundHalfUp(fixed);
  b.total_annual = b.variable_costs + b.fixed_costs;

  const double total = static_cast<double>(b.total_annual);
  const double mil = ctx.input.annual_mileage_mil;
  const double km = mil * k_.km_per_mil;
  b.cost_per_mil = (mil > 0.0) ? RoundHalfUp(total / mil) : 0;
  b.cost_per_km = FormatFixed2((km > 0.0) ? total / km : 0.0);
  b.monthly_total = RoundHalfUp(total / 12.0);
}

} // namespace carcost
