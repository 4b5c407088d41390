#pragma once
#include "common/constants.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：保养 + 轮胎（随里程与车型等级变化的损耗费用）
//
// 输入：
//   ctx.input.vehicle_class / maintenance_level / annual_mileage_mil
//   ctx.input.annual_tire_cost_override（> 0 时直接使用）
//
// 输出：
//   ctx.annual.maintenance = 表值 * 里程 / 1500 mil
//   ctx.annual.tires       = 一套胎价格 / 更换间隔（年）
//   ctx.tire_interval_years（使用手动覆盖时为 0）
// ======================
class WearCostStage final : public IStage {
public:
  explicit WearCostStage(const EngineConstants& k) : k_(k) {}
  void Run(CostContext& ctx) override;

  // 更换间隔 = 轮胎寿命 / 年公里数，夹在 [min, max]；里程为 0 时取 max
  static double TireIntervalYears(const EngineConstants& k, double annual_km);

private:
  const EngineConstants& k_;
};

} // namespace carcost
