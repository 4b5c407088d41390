#pragma once
#include "common/constants.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：融资费用
//
// 输入：
//   ctx.input.purchase_price
//   ctx.input.financing（Cash / Loan / Leasing 三选一）
//
// 输出：
//   ctx.financing.monthly_installment（已取整）
//   ctx.financing.principal / residual / schedule（等额本息时）
//   ctx.annual.financing = monthly_installment * 12
//
// 约定（非常重要）：
//   1) 月供先取整，年费用只由取整后的月供 * 12 得到，保证展示的月/年一致。
//   2) 贷款的每月管理费视为已包含在实际年利率中，不再加到月供上。
//   3) 贷款年限 <= 0 时不产生融资费用；超过 k.max_horizon_years 时按上限计算。
// ======================
class FinancingStage final : public IStage {
public:
  explicit FinancingStage(const EngineConstants& k) : k_(k) {}
  void Run(CostContext& ctx) override;

private:
  const EngineConstants& k_;
};

} // namespace carcost
