#include "stages/fuel_cost_stage.hpp"

namespace carcost {

void FuelCostStage::Run(CostContext& ctx) {
  const auto& in = ctx.input;
  const double annual_km = in.annual_mileage_mil * k_.km_per_mil;

  double blended_price = in.primary_fuel_price;
  if (in.has_secondary_fuel) {
    const double share = in.secondary_fuel_share_percent / 100.0;
    blended_price = in.primary_fuel_price * (1.0 - share) + in.secondary_fuel_price * share;
  }

  // 油耗单位是“每 mil”，换算到每 km
  ctx.fuel_cost_per_km = (k_.km_per_mil > 0.0) ? in.fuel_consumption * blended_price / k_.km_per_mil : 0.0;
  ctx.annual.fuel = ctx.fuel_cost_per_km * annual_km;
}

} // namespace carcost
