#pragma once
#include "stages/stage_base.hpp"

namespace carcost {

// ======================
// 环节：固定费用（税、保险、停车、洗车养护）
//
// 输入：
//   ctx.input.annual_tax / has_malus_tax / malus_tax_amount
//   ctx.input.insurance_monthly / parking_monthly / ancillary_care_monthly
//   ctx.input.financing（租赁含保险时保险项清零，避免重复计费）
//
// 输出：
//   ctx.annual.tax / insurance / parking / ancillary_care
// ======================
class FixedCostStage final : public IStage {
public:
  void Run(CostContext& ctx) override;

  static bool InsuranceBundledInLease(const FinancingPlan& plan);
};

} // namespace carcost
