#pragma once
#include <vector>

#include "common/constants.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：折旧（价值损失）
//
// 输入：
//   ctx.input.purchase_price / fuel_type / depreciation_level
//   ctx.input.vehicle_age_years（为空时按 age=0，即最高费率的分段）
//   ctx.input.ownership_years
//
// 输出：
//   ctx.depreciation_schedule（每个持有年一行）
//   ctx.annual.depreciation = 总损失 / 持有年数
//
// 折旧按余额递减：每年 value -= value * rate，rate 由“该年开始时的车龄”查表，
// 再乘燃料系数和用户调整系数，夹在 [0, 1]。
// kFlatTwoTier 模型只区分第 1 年与之后各年，公式形状相同。
// ======================
class DepreciationStage final : public IStage {
public:
  explicit DepreciationStage(const EngineConstants& k) : k_(k) {}
  void Run(CostContext& ctx) override;

  // 车龄分段查表：第一个满足 age < max_age 的分段；超出全部分段时用最后一段
  static double RateForAge(const std::vector<DepreciationBracket>& curve, double age);

  // 第 year_index 个持有年（0-based）的实际费率，已夹在 [0, 1]
  static double EffectiveRate(const EngineConstants& k, const NormalizedComputationInput& in, int year_index);

  // 实际计算的持有年数：ownership_years 截断到 k.max_horizon_years
  static int HorizonYears(const EngineConstants& k, const NormalizedComputationInput& in);

  static std::vector<DepreciationYear> BuildSchedule(const EngineConstants& k, const NormalizedComputationInput& in);

private:
  const EngineConstants& k_;
};

} // namespace carcost
