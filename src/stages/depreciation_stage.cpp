#include "stages/depreciation_stage.hpp"

#include <algorithm>

namespace carcost {

int DepreciationStage::HorizonYears(const EngineConstants& k, const NormalizedComputationInput& in) {
  return std::min(in.ownership_years, k.max_horizon_years);
}

double DepreciationStage::RateForAge(const std::vector<DepreciationBracket>& curve, double age) {
  if (curve.empty()) return 0.0;
  for (const auto& bracket : curve) {
    if (age < bracket.max_age) return bracket.rate;
  }
  return curve.back().rate;
}

double DepreciationStage::EffectiveRate(const EngineConstants& k, const NormalizedComputationInput& in, int year_index) {
  double rate = 0.0;
  if (k.depreciation_model == DepreciationModel::kFlatTwoTier) {
    const TwoTierRate tiers = LookupOr(k.two_tier_rates, in.depreciation_level, TwoTierRate{});
    rate = (year_index == 0) ? tiers.first_year : tiers.later_years;
  } else {
    const int start_age = in.vehicle_age_years.value_or(0) + year_index;
    const double base = RateForAge(k.age_depreciation_curve, static_cast<double>(start_age));
    const double fuel_mult = LookupOr(k.fuel_depreciation_multiplier, in.fuel_type, 1.0);
    const double override_factor = LookupOr(k.depreciation_override_factor, in.depreciation_level, 1.0);
    rate = base * fuel_mult * override_factor;
  }
  return std::min(1.0, std::max(0.0, rate));
}

std::vector<DepreciationYear> DepreciationStage::BuildSchedule(const EngineConstants& k,
                                                               const NormalizedComputationInput& in) {
  std::vector<DepreciationYear> rows;
  const int years = HorizonYears(k, in);
  if (years <= 0) return rows;
  rows.reserve(static_cast<std::size_t>(years));

  const int start_age = in.vehicle_age_years.value_or(0);
  double value = in.purchase_price;
  for (int year = 0; year < years; ++year) {
    DepreciationYear row;
    row.year_index = year;
    row.start_age = start_age + year;
    row.effective_rate = EffectiveRate(k, in, year);
    row.value_start = value;
    row.loss = value * row.effective_rate;
    value -= row.loss;
    row.value_end = value;
    rows.push_back(row);
  }
  return rows;
}

void DepreciationStage::Run(CostContext& ctx) {
  ctx.depreciation_schedule = BuildSchedule(k_, ctx.input);

  double total = 0.0;
  for (const auto& row : ctx.depreciation_schedule) total += row.loss;

  const int years = HorizonYears(k_, ctx.input);
  ctx.annual.depreciation = (years > 0) ? total / static_cast<double>(years) : 0.0;
}

} // namespace carcost
