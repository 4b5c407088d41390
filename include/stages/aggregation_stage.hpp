#pragma once
#include "common/constants.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：汇总 + 取整
// 流程位置：各分项 Stage -> 汇总 -> CostBreakdown
//
// 输入：ctx.annual（各分项未取整的年费用）
// 输出：ctx.breakdown
//
//   variable = fuel + maintenance + tires
//   fixed    = tax + insurance + parking + ancillary_care + financing + depreciation
//   total    = variable + fixed（取整后的两项相加，保证展示上严格相等）
//   per_mil  = total / 年 mil（里程为 0 时为 0）
//   monthly  = round(total / 12)
// ======================
class AggregationStage final : public IStage {
public:
  explicit AggregationStage(const EngineConstants& k) : k_(k) {}
  void Run(CostContext& ctx) override;

private:
  const EngineConstants& k_;
};

} // namespace carcost
