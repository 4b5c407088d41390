#pragma once
#include <memory>
#include <vector>

#include "common/constants.hpp"
#include "common/types.hpp"
#include "stages/stage_base.hpp"

namespace carcost {

// Pipeline 负责把各计算 Stage 按固定顺序串起来：
//   燃料 -> 折旧 -> 保养/轮胎 -> 固定费用 -> 融资 -> 汇总
// 只要 Stage 的接口不变，可以单独替换某个环节的模型。
//
// constants 的生命周期必须长于 Pipeline（默认常量是进程内静态对象）。
class Pipeline {
public:
  explicit Pipeline(const EngineConstants& constants = DefaultEngineConstants());
  void Run(CostContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

// Cost Calculator：纯函数，每次调用新建 CostContext
CostBreakdown Calculate(const NormalizedComputationInput& input,
                        const EngineConstants& constants = DefaultEngineConstants());

// 装配 + 计算 + 明细（depreciation / amortization schedule）
CostEstimate Estimate(const VehicleFacts& facts,
                      const OwnershipConfiguration& config,
                      int current_year,
                      const EngineConstants& constants = DefaultEngineConstants());

CostEstimate EstimateFromInput(const NormalizedComputationInput& input,
                               const EngineConstants& constants = DefaultEngineConstants());

} // namespace carcost
