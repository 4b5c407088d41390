#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace carcost {

// ========================
// 1) 枚举（封闭集合）
// ========================

// 归一化后的燃料类型（原始文本由 InputAssembler 归一化）
enum class FuelType {
  kGasoline,
  kDiesel,
  kPluginHybrid,
  kHybrid,
  kElectric,
  kEthanol,
  kBiogas,
};

// 车辆尺寸等级：决定保养/轮胎成本表
enum class VehicleClass { kSimple, kNormal, kLarge, kLuxury };

enum class MaintenanceLevel { kLow, kNormal, kHigh };

// 用户对折旧风险的主观调整（low/normal/high）
enum class DepreciationLevel { kLow, kNormal, kHigh };

enum class FinancingMode { kCash, kLoan, kLeasing };

// residual = 尾款（气球）贷款；annuity = 等额本息
enum class LoanType { kResidual, kAnnuity };

enum class LeasingType { kPrivate, kBusiness };

// ========================
// 2) 车辆数据（来自页面抽取，输入）
// ========================

struct EstimatedFlags {
  bool fuel_consumption{false};
  bool vehicle_class{false};
};

struct VehicleFacts {
  double purchase_price{0.0};
  std::string fuel_type;                      // 原样文本，例如 "Bensin+El" / "Diesel"
  std::optional<double> fuel_consumption;     // 每 mil（10 km）的 l / kWh / kg
  std::optional<int> model_year;
  std::optional<double> mileage_mil;          // 里程表读数
  std::optional<double> engine_power_hp;
  std::optional<double> co2_g_per_km;
  VehicleClass vehicle_class{VehicleClass::kNormal};
  std::optional<double> effective_interest_rate; // 广告上给出的实际年利率 %
  std::optional<double> annual_tax;
  EstimatedFlags is_estimated;

  // 仅用于展示 / 车型等级推断
  std::string name;
  std::string brand;
  std::string model;
};

// ========================
// 3) 用户配置（输入）
// ========================

// 贷款相关字段都允许缺省，由 InputAssembler 补默认值
struct LoanTerms {
  std::optional<LoanType> type;
  std::optional<double> down_payment_percent;
  std::optional<double> residual_value_percent;
  std::optional<double> interest_rate_percent;
  std::optional<int> term_years;
  std::optional<double> monthly_admin_fee;
};

struct LeasingTerms {
  std::optional<LeasingType> type;
  std::optional<double> monthly_fee;
  std::optional<bool> includes_insurance;
};

struct OwnershipConfiguration {
  double annual_mileage_mil{1500.0};
  double primary_fuel_price{18.5};
  double secondary_fuel_price{2.5};           // 电价（约定：电作为“第二燃料”）
  double secondary_fuel_share_percent{50.0};  // 插混的纯电占比 0..100
  std::optional<VehicleClass> vehicle_class;  // 若设置则覆盖 VehicleFacts
  MaintenanceLevel maintenance_level{MaintenanceLevel::kNormal};
  DepreciationLevel depreciation_level{DepreciationLevel::kNormal};
  int ownership_years{5};

  // 月度费用
  double insurance_monthly{500.0};
  double parking_monthly{0.0};
  double ancillary_care_monthly{250.0};       // 洗车 & 养护

  FinancingMode financing_mode{FinancingMode::kCash};
  LoanTerms loan;
  LeasingTerms leasing;

  double annual_tax{2000.0};
  bool has_malus_tax{false};
  double malus_tax_amount{0.0};
  std::optional<double> annual_tire_cost;     // 手动覆盖轮胎年费
};

// ========================
// 4) 归一化后的计算输入（Calculator 的唯一契约）
// ========================

struct CashFinancing {};

struct LoanFinancing {
  LoanType type{LoanType::kResidual};
  double down_payment_percent{20.0};
  double residual_value_percent{50.0};
  double interest_rate_percent{5.0};
  int term_years{3};
  double monthly_admin_fee{60.0}; // 视为已包含在实际利率中，不计入月供
};

struct LeasingFinancing {
  LeasingType type{LeasingType::kPrivate};
  double monthly_fee{3500.0};
  bool includes_insurance{false};
};

using FinancingPlan = std::variant<CashFinancing, LoanFinancing, LeasingFinancing>;

struct InputEstimates {
  bool fuel_consumption{false};
  bool vehicle_class{false};
  bool vehicle_age_unknown{false};
};

struct NormalizedComputationInput {
  double purchase_price{0.0};
  FuelType fuel_type{FuelType::kGasoline};
  double fuel_consumption{0.0};     // 每 mil

  double primary_fuel_price{0.0};
  bool has_secondary_fuel{false};
  double secondary_fuel_price{0.0};
  double secondary_fuel_share_percent{0.0};

  double annual_mileage_mil{0.0};
  VehicleClass vehicle_class{VehicleClass::kNormal};
  MaintenanceLevel maintenance_level{MaintenanceLevel::kNormal};
  DepreciationLevel depreciation_level{DepreciationLevel::kNormal};

  // 车型年份未知时保持为空：折旧按 age=0 处理（最保守）
  std::optional<int> vehicle_age_years;
  int ownership_years{0};

  double insurance_monthly{0.0};
  double parking_monthly{0.0};
  double ancillary_care_monthly{0.0};

  FinancingPlan financing{CashFinancing{}};

  double annual_tax{0.0};
  bool has_malus_tax{false};
  double malus_tax_amount{0.0};
  double annual_tire_cost_override{0.0}; // <= 0 表示按里程推算

  InputEstimates estimates;
};

// ========================
// 5) 输出
// ========================

// 金额全部取整到整数货币单位；cost_per_km 保留两位小数字符串
struct CostBreakdown {
  std::int64_t fuel{0};
  std::int64_t depreciation{0};
  std::int64_t tax{0};
  std::int64_t maintenance{0};
  std::int64_t tires{0};
  std::int64_t insurance{0};
  std::int64_t parking{0};
  std::int64_t ancillary_care{0};
  std::int64_t financing{0};
  std::int64_t monthly_installment{0};

  std::int64_t variable_costs{0};
  std::int64_t fixed_costs{0};
  std::int64_t total_annual{0};
  std::int64_t cost_per_mil{0};
  std::string cost_per_km{"0.00"};
  std::int64_t monthly_total{0};
};

// 折旧逐年明细（depreciation.csv）
struct DepreciationYear {
  int year_index{0};     // 0-based 持有年
  int start_age{0};
  double effective_rate{0.0};
  double value_start{0.0};
  double loss{0.0};
  double value_end{0.0};
};

// 等额本息逐月明细（amortization.csv）
struct AmortizationRow {
  int month{0};          // 1-based
  double installment{0.0};
  double interest{0.0};
  double principal{0.0};
  double balance{0.0};
};

// ========================
// 6) 一次完整计算的上下文（各 Stage 之间传递的接口载体）
// ========================

// 各项“未取整”的年度中间量，由各 Stage 写入，AggregationStage 统一取整
struct AnnualCosts {
  double fuel{0.0};
  double depreciation{0.0};
  double tax{0.0};
  double maintenance{0.0};
  double tires{0.0};
  double insurance{0.0};
  double parking{0.0};
  double ancillary_care{0.0};
  double financing{0.0};     // = monthly_installment * 12（已按月取整）
};

struct FinancingResult {
  std::int64_t monthly_installment{0};
  double principal{0.0};
  double residual{0.0};
  std::vector<AmortizationRow> schedule; // 只有等额本息贷款才填
};

struct CostContext {
  NormalizedComputationInput input;

  AnnualCosts annual;
  double fuel_cost_per_km{0.0};
  double tire_interval_years{0.0};
  std::vector<DepreciationYear> depreciation_schedule;
  FinancingResult financing;

  CostBreakdown breakdown;
};

// 对外的完整结果：归一化输入 + 分项 + 明细
struct CostEstimate {
  NormalizedComputationInput input;
  CostBreakdown breakdown;
  std::vector<DepreciationYear> depreciation_schedule;
  std::vector<AmortizationRow> amortization_schedule;

  // 贷款本金（价格 - 首付）与尾款；非贷款时为 0
  double loan_principal{0.0};
  double loan_residual{0.0};
};

} // namespace carcost
