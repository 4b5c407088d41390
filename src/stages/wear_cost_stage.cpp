#include "stages/wear_cost_stage.hpp"

#include <algorithm>

namespace carcost {

double WearCostStage::TireIntervalYears(const EngineConstants& k, double annual_km) {
  if (annual_km <= 0.0) return k.tire_max_interval_years;
  return std::max(k.tire_min_interval_years, std::min(k.tire_max_interval_years, k.tire_lifetime_km / annual_km));
}

void WearCostStage::Run(CostContext& ctx) {
  const auto& in = ctx.input;

  // 保养
  double base = 0.0;
  const auto cls = k_.maintenance_cost.find(in.vehicle_class);
  if (cls != k_.maintenance_cost.end()) base = LookupOr(cls->second, in.maintenance_level, 0.0);
  const double mileage_factor =
      (k_.maintenance_reference_mil > 0.0) ? in.annual_mileage_mil / k_.maintenance_reference_mil : 0.0;
  ctx.annual.maintenance = base * mileage_factor;

  // 轮胎
  if (in.annual_tire_cost_override > 0.0) {
    ctx.tire_interval_years = 0.0;
    ctx.annual.tires = in.annual_tire_cost_override;
    return;
  }
  const double annual_km = in.annual_mileage_mil * k_.km_per_mil;
  ctx.tire_interval_years = TireIntervalYears(k_, annual_km);
  const double set_cost = LookupOr(k_.tire_set_cost, in.vehicle_class, 0.0);
  ctx.annual.tires = (ctx.tire_interval_years > 0.0) ? set_cost / ctx.tire_interval_years : 0.0;
}

} // namespace carcost
