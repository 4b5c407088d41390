#include "common/constants.hpp"

namespace carcost {

namespace {

EngineConstants BuildDefaults() {
  EngineConstants k;

  // 瑞典二手车市场 2025-2026 的经验曲线
  k.age_depreciation_curve = {
      {1.0, 0.25},  // 0 -> 1 年
      {3.0, 0.15},  // 1 -> 3 年
      {5.0, 0.10},  // 3 -> 5 年
      {8.0, 0.06},  // 5 -> 8 年
      {std::numeric_limits<double>::infinity(), 0.04},
  };

  // > 1.0 折旧更快；电车掉价最快，汽油车最保值
  k.fuel_depreciation_multiplier = {
      {FuelType::kGasoline, 0.75},
      {FuelType::kDiesel, 1.00},
      {FuelType::kHybrid, 0.80},
      {FuelType::kPluginHybrid, 0.90},
      {FuelType::kElectric, 1.25},
      {FuelType::kEthanol, 1.10},
      {FuelType::kBiogas, 1.10},
  };

  k.depreciation_override_factor = {
      {DepreciationLevel::kLow, 0.75},
      {DepreciationLevel::kNormal, 1.00},
      {DepreciationLevel::kHigh, 1.30},
  };

  k.two_tier_rates = {
      {DepreciationLevel::kLow, {0.10, 0.08}},
      {DepreciationLevel::kNormal, {0.15, 0.12}},
      {DepreciationLevel::kHigh, {0.20, 0.15}},
  };

  // 每年 1500 mil 时的保养费用
  k.maintenance_cost = {
      {VehicleClass::kSimple,
       {{MaintenanceLevel::kLow, 3000.0}, {MaintenanceLevel::kNormal, 5000.0}, {MaintenanceLevel::kHigh, 8000.0}}},
      {VehicleClass::kNormal,
       {{MaintenanceLevel::kLow, 5000.0}, {MaintenanceLevel::kNormal, 8000.0}, {MaintenanceLevel::kHigh, 12000.0}}},
      {VehicleClass::kLarge,
       {{MaintenanceLevel::kLow, 8000.0}, {MaintenanceLevel::kNormal, 12000.0}, {MaintenanceLevel::kHigh, 18000.0}}},
      {VehicleClass::kLuxury,
       {{MaintenanceLevel::kLow, 12000.0}, {MaintenanceLevel::kNormal, 20000.0}, {MaintenanceLevel::kHigh, 35000.0}}},
  };

  k.tire_set_cost = {
      {VehicleClass::kSimple, 4000.0},
      {VehicleClass::kNormal, 6000.0},
      {VehicleClass::kLarge, 10000.0},
      {VehicleClass::kLuxury, 15000.0},
  };

  k.default_tax = {
      {FuelType::kGasoline, 2000.0},
      {FuelType::kDiesel, 2500.0},
      {FuelType::kElectric, 360.0},
      {FuelType::kHybrid, 1500.0},
      {FuelType::kPluginHybrid, 1200.0},
      {FuelType::kEthanol, 1800.0},
      {FuelType::kBiogas, 1500.0},
  };

  // l / kWh / kg 每 mil
  k.estimated_consumption = {
      {FuelType::kGasoline, 0.7},
      {FuelType::kDiesel, 0.6},
      {FuelType::kElectric, 2.0},
      {FuelType::kHybrid, 0.5},
      {FuelType::kPluginHybrid, 0.4},
      {FuelType::kEthanol, 0.9},
      {FuelType::kBiogas, 0.8},
  };

  // 顺序很重要："laddhybrid" 必须先于 "hybrid"，"diesel" 必须先于 "el"
  k.fuel_vocabulary = {
      {FuelType::kGasoline, {"bensin", "gasoline", "petrol"}},
      {FuelType::kDiesel, {"diesel"}},
      {FuelType::kPluginHybrid, {"laddhybrid", "plug-in", "plugin", "phev"}},
      {FuelType::kHybrid, {"hybrid", "elhybrid"}},
      {FuelType::kElectric, {"el", "electric"}},
      {FuelType::kEthanol, {"e85", "etanol", "ethanol"}},
      {FuelType::kBiogas, {"biogas", "fordonsgas", "cng", "gas"}},
  };

  return k;
}

} // namespace

const EngineConstants& DefaultEngineConstants() {
  static const EngineConstants k = BuildDefaults();
  return k;
}

OwnershipConfiguration DefaultConfiguration() {
  // 成员初始值即默认配置；财务子字段留空，由 InputAssembler 补齐
  return OwnershipConfiguration{};
}

LoanFinancing DefaultLoanFinancing() {
  LoanFinancing loan;
  loan.type = LoanType::kResidual; // 车商网站最常见的是尾款贷
  loan.down_payment_percent = 20.0;
  loan.residual_value_percent = 50.0;
  loan.interest_rate_percent = 5.0;
  loan.term_years = 3;
  loan.monthly_admin_fee = 60.0;
  return loan;
}

LeasingFinancing DefaultLeasingFinancing() {
  LeasingFinancing lease;
  lease.type = LeasingType::kPrivate;
  lease.monthly_fee = 3500.0;
  lease.includes_insurance = false;
  return lease;
}

} // namespace carcost
