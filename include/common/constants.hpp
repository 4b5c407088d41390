#pragma once
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace carcost {

// ========================
// 计算引擎的全部常量表
// ========================
//
// 所有查表数据集中在 EngineConstants 一处，并显式传入 Assemble / Calculate，
// 不使用全局可变状态。测试可以复制一份默认值再修改个别条目。

// 年龄分段折旧曲线：age < max_age 时使用 rate（按“持有年开始时的车龄”查表）
struct DepreciationBracket {
  double max_age{std::numeric_limits<double>::infinity()};
  double rate{0.0};
};

// 旧版两段式折旧：第 1 年 / 之后每年
struct TwoTierRate {
  double first_year{0.0};
  double later_years{0.0};
};

enum class DepreciationModel {
  kAgeBracketed, // 车龄分段 × 燃料系数 × 用户调整（默认）
  kFlatTwoTier,  // 旧模型：不考虑车龄 / 燃料
};

// 燃料识别词表：按顺序匹配，第一个命中的子串决定类型
struct FuelSynonyms {
  FuelType type{FuelType::kGasoline};
  std::vector<std::string> substrings;
};

struct EngineConstants {
  double km_per_mil{10.0};

  // 保养费用表以 1500 mil/年 为基准
  double maintenance_reference_mil{1500.0};

  // 轮胎：一套胎的总寿命（km），更换间隔夹在 [min, max] 年
  double tire_lifetime_km{60000.0};
  double tire_min_interval_years{2.0};
  double tire_max_interval_years{5.0};

  // 用户配置里“通用车船税”的出厂默认值；用户改过才视为自定义
  double generic_default_tax{2000.0};

  FuelType fallback_fuel{FuelType::kGasoline};

  // 持有年数 / 贷款年限的上限：边界校验拒绝超出的输入，计算引擎按上限截断
  int max_horizon_years{50};

  DepreciationModel depreciation_model{DepreciationModel::kAgeBracketed};
  std::vector<DepreciationBracket> age_depreciation_curve;
  std::map<FuelType, double> fuel_depreciation_multiplier;
  std::map<DepreciationLevel, double> depreciation_override_factor;
  std::map<DepreciationLevel, TwoTierRate> two_tier_rates;

  std::map<VehicleClass, std::map<MaintenanceLevel, double>> maintenance_cost;
  std::map<VehicleClass, double> tire_set_cost;
  std::map<FuelType, double> default_tax;
  std::map<FuelType, double> estimated_consumption;

  std::vector<FuelSynonyms> fuel_vocabulary;
};

// 默认常量（进程内只构造一次，只读）
const EngineConstants& DefaultEngineConstants();

// 配置存储层在缺省时使用的用户配置
OwnershipConfiguration DefaultConfiguration();

// 财务子字段的静态默认值（贷款 / 租赁）
LoanFinancing DefaultLoanFinancing();
LeasingFinancing DefaultLeasingFinancing();

// map 查表：缺失时返回 fallback
template <typename K, typename V>
inline V LookupOr(const std::map<K, V>& table, const K& key, V fallback) {
  const auto it = table.find(key);
  return it == table.end() ? fallback : it->second;
}

} // namespace carcost
