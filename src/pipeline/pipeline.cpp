#include "pipeline/pipeline.hpp"

#include <utility>

#include "assembler/input_assembler.hpp"

// 具体 Stage
#include "stages/aggregation_stage.hpp"
#include "stages/depreciation_stage.hpp"
#include "stages/financing_stage.hpp"
#include "stages/fixed_cost_stage.hpp"
#include "stages/fuel_cost_stage.hpp"
#include "stages/wear_cost_stage.hpp"

namespace carcost {

Pipeline::Pipeline(const EngineConstants& constants) {
  stages_.emplace_back(std::make_unique<FuelCostStage>(constants));
  stages_.emplace_back(std::make_unique<DepreciationStage>(constants));
  stages_.emplace_back(std::make_unique<WearCostStage>(constants));
  stages_.emplace_back(std::make_unique<FixedCostStage>());
  // 融资必须在汇总之前；FixedCostStage 只读 financing plan，不依赖融资结果
  stages_.emplace_back(std::make_unique<FinancingStage>(constants));
  stages_.emplace_back(std::make_unique<AggregationStage>(constants));
}

void Pipeline::Run(CostContext& ctx) {
  for (auto& stage : stages_) {
    stage->Run(ctx);
  }
}

namespace {

CostContext RunFresh(const NormalizedComputationInput& input, const EngineConstants& constants) {
  CostContext ctx;
  ctx.input = input;
  Pipeline pipe(constants);
  pipe.Run(ctx);
  return ctx;
}

} // namespace

CostBreakdown Calculate(const NormalizedComputationInput& input, const EngineConstants& constants) {
  return RunFresh(input, constants).breakdown;
}

CostEstimate EstimateFromInput(const NormalizedComputationInput& input, const EngineConstants& constants) {
  CostContext ctx = RunFresh(input, constants);
  CostEstimate est;
  est.input = std::move(ctx.input);
  est.breakdown = std::move(ctx.breakdown);
  est.depreciation_schedule = std::move(ctx.depreciation_schedule);
  est.amortization_schedule = std::move(ctx.financing.schedule);
  est.loan_principal = ctx.financing.principal;
  est.loan_residual = ctx.financing.residual;
  return est;
}

CostEstimate Estimate(const VehicleFacts& facts,
                      const OwnershipConfiguration& config,
                      int current_year,
                      const EngineConstants& constants) {
  return EstimateFromInput(Assemble(facts, config, current_year, constants), constants);
}

} // namespace carcost
