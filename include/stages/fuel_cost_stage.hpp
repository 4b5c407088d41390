#pragma once
#include "common/constants.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：燃料费用
//
// 输入：
//   ctx.input.fuel_consumption（每 mil）
//   ctx.input.primary_fuel_price / secondary_fuel_price / secondary_fuel_share_percent
//   ctx.input.annual_mileage_mil
//
// 输出：
//   ctx.fuel_cost_per_km
//   ctx.annual.fuel
//
// 插混按占比混合两种能源价格：consumption * (p1 * (1 - s) + p2 * s)。
// ======================
class FuelCostStage final : public IStage {
public:
  explicit FuelCostStage(const EngineConstants& k) : k_(k) {}
  void Run(CostContext& ctx) override;

private:
  const EngineConstants& k_;
};

} // namespace carcost
