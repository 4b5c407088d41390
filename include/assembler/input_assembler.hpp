#pragma once
#include <optional>
#include <string>

#include "common/constants.hpp"
#include "common/types.hpp"

namespace carcost {

// ======================
// 环节：输入装配（Input Assembler）
// 流程位置：页面抽取 VehicleFacts + 用户配置 -> 装配 -> NormalizedComputationInput -> 成本计算
//
// 输入：
//   VehicleFacts（价格、燃料文本、可选的油耗/年份/税…）
//   OwnershipConfiguration（里程、油价、融资方式…，财务子字段可缺省）
//
// 输出：
//   NormalizedComputationInput：除 vehicle_age_years 外全部是具体值
//
// 这里不报错：所有缺省字段都补默认值。结构性错误（负价格等）由 ValidateInputs
// 在系统边界检查，Assemble 本身不调用它。
// ======================
class InputAssembler {
public:
  explicit InputAssembler(const EngineConstants& constants = DefaultEngineConstants());

  NormalizedComputationInput Assemble(const VehicleFacts& facts,
                                      const OwnershipConfiguration& config,
                                      int current_year) const;

  // 大小写不敏感的子串匹配；未命中回落到汽油
  FuelType NormalizeFuelType(const std::string& raw) const;

  // 实测值 > 燃料估算表 > 汽油估算值
  double ResolveConsumption(const std::optional<double>& measured, FuelType fuel) const;

  // 广告上的税 > 用户改过的通用税 > 按燃料的默认税
  double ResolveTax(const std::optional<double>& extracted, double configured, FuelType fuel) const;

  FinancingPlan ResolveFinancing(const VehicleFacts& facts, const OwnershipConfiguration& config) const;

private:
  const EngineConstants& k_;
};

// 便捷入口：current_year 显式给出时为纯函数
NormalizedComputationInput Assemble(const VehicleFacts& facts,
                                    const OwnershipConfiguration& config,
                                    int current_year,
                                    const EngineConstants& constants = DefaultEngineConstants());

// 使用系统时钟的当前年份
NormalizedComputationInput Assemble(const VehicleFacts& facts, const OwnershipConfiguration& config);

int CurrentYear();

// 车龄：年份未知时返回空
std::optional<int> ComputeVehicleAge(const std::optional<int>& model_year, int current_year);

// 根据品牌 / 车型 / 功率推断尺寸等级（抽取层拿不到等级时使用）
VehicleClass InferVehicleClass(const std::string& brand,
                               const std::string& model,
                               const std::optional<double>& power_hp);

// 系统边界的结构性检查：任何违规都会抛 std::invalid_argument（消息列出全部问题）
// 持有年数与贷款年限必须在 [0, constants.max_horizon_years] 内。
void ValidateInputs(const VehicleFacts& facts,
                    const OwnershipConfiguration& config,
                    const EngineConstants& constants = DefaultEngineConstants());

} // namespace carcost
