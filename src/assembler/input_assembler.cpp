#include "assembler/input_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace carcost {

namespace {

std::string ToLowerTrim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  std::string out = s.substr(b, e - b);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (haystack.find(n) != std::string::npos) return true;
  }
  return false;
}

// 车型等级推断用的品牌 / 车型清单
const std::vector<std::string>& LuxuryBrands() {
  static const std::vector<std::string> v = {
      "porsche", "bmw", "mercedes", "audi", "lexus", "jaguar", "maserati",
      "bentley", "rolls", "ferrari", "lamborghini", "aston martin", "tesla"};
  return v;
}

const std::vector<std::string>& LargeModels() {
  static const std::vector<std::string> v = {
      "xc90", "xc60", "q7", "q8", "x5", "x6", "x7", "gle", "gls", "cayenne",
      "touareg", "land cruiser", "bigster", "discovery", "range rover",
      "defender", "navigator", "escalade", "tahoe", "suburban"};
  return v;
}

const std::vector<std::string>& SimpleModels() {
  static const std::vector<std::string> v = {
      "up", "mii", "citigo", "aygo", "c1", "108", "twingo", "smart", "i10",
      "picanto", "spark", "sandero", "spring", "logan", "ka", "fiesta",
      "500", "panda", "alto", "celerio"};
  return v;
}

const std::vector<std::string>& BudgetBrands() {
  static const std::vector<std::string> v = {"dacia", "seat", "skoda", "fiat", "suzuki"};
  return v;
}

bool IsBad(double v) { return !std::isfinite(v); }

} // namespace

InputAssembler::InputAssembler(const EngineConstants& constants) : k_(constants) {}

FuelType InputAssembler::NormalizeFuelType(const std::string& raw) const {
  const std::string s = ToLowerTrim(raw);
  if (s.empty()) return k_.fallback_fuel;
  for (const auto& entry : k_.fuel_vocabulary) {
    if (ContainsAny(s, entry.substrings)) return entry.type;
  }
  return k_.fallback_fuel;
}

double InputAssembler::ResolveConsumption(const std::optional<double>& measured, FuelType fuel) const {
  if (measured.has_value()) return *measured;
  const auto it = k_.estimated_consumption.find(fuel);
  if (it != k_.estimated_consumption.end()) return it->second;
  return LookupOr(k_.estimated_consumption, k_.fallback_fuel, 0.0);
}

double InputAssembler::ResolveTax(const std::optional<double>& extracted, double configured, FuelType fuel) const {
  if (extracted.has_value() && *extracted > 0.0) return *extracted;
  // 用户改过通用税额（与出厂默认不同）即视为自定义
  if (configured != k_.generic_default_tax) return configured;
  return LookupOr(k_.default_tax, fuel, k_.generic_default_tax);
}

FinancingPlan InputAssembler::ResolveFinancing(const VehicleFacts& facts, const OwnershipConfiguration& config) const {
  switch (config.financing_mode) {
    case FinancingMode::kCash:
      return CashFinancing{};

    case FinancingMode::kLoan: {
      const LoanFinancing d = DefaultLoanFinancing();
      const LoanTerms& t = config.loan;
      LoanFinancing loan;
      loan.type = t.type.value_or(d.type);
      loan.down_payment_percent = t.down_payment_percent.value_or(d.down_payment_percent);
      loan.residual_value_percent = t.residual_value_percent.value_or(d.residual_value_percent);
      loan.interest_rate_percent = t.interest_rate_percent.value_or(d.interest_rate_percent);
      loan.term_years = t.term_years.value_or(d.term_years);
      loan.monthly_admin_fee = t.monthly_admin_fee.value_or(d.monthly_admin_fee);
      // 广告上给出的实际年利率优先于用户配置
      if (facts.effective_interest_rate.has_value() && *facts.effective_interest_rate > 0.0) {
        loan.interest_rate_percent = *facts.effective_interest_rate;
      }
      return loan;
    }

    case FinancingMode::kLeasing: {
      const LeasingFinancing d = DefaultLeasingFinancing();
      const LeasingTerms& t = config.leasing;
      LeasingFinancing lease;
      lease.type = t.type.value_or(d.type);
      lease.monthly_fee = t.monthly_fee.value_or(d.monthly_fee);
      lease.includes_insurance = t.includes_insurance.value_or(d.includes_insurance);
      return lease;
    }
  }
  return CashFinancing{};
}

NormalizedComputationInput InputAssembler::Assemble(const VehicleFacts& facts,
                                                    const OwnershipConfiguration& config,
                                                    int current_year) const {
  NormalizedComputationInput in;

  const FuelType fuel = NormalizeFuelType(facts.fuel_type);
  in.purchase_price = facts.purchase_price;
  in.fuel_type = fuel;
  in.fuel_consumption = ResolveConsumption(facts.fuel_consumption, fuel);

  // 电价在配置里按约定放在 secondary_fuel_price
  const bool is_electric = (fuel == FuelType::kElectric);
  const bool is_plugin = (fuel == FuelType::kPluginHybrid);
  in.primary_fuel_price = is_electric ? config.secondary_fuel_price : config.primary_fuel_price;
  in.has_secondary_fuel = is_plugin;
  in.secondary_fuel_price = config.secondary_fuel_price;
  in.secondary_fuel_share_percent = is_plugin ? config.secondary_fuel_share_percent : 0.0;

  in.annual_mileage_mil = config.annual_mileage_mil;
  in.vehicle_class = config.vehicle_class.value_or(facts.vehicle_class);
  in.maintenance_level = config.maintenance_level;
  in.depreciation_level = config.depreciation_level;
  in.vehicle_age_years = ComputeVehicleAge(facts.model_year, current_year);
  in.ownership_years = config.ownership_years;

  in.insurance_monthly = config.insurance_monthly;
  in.parking_monthly = config.parking_monthly;
  in.ancillary_care_monthly = config.ancillary_care_monthly;

  in.financing = ResolveFinancing(facts, config);

  in.annual_tax = ResolveTax(facts.annual_tax, config.annual_tax, fuel);
  in.has_malus_tax = config.has_malus_tax;
  in.malus_tax_amount = config.malus_tax_amount;
  in.annual_tire_cost_override = config.annual_tire_cost.value_or(0.0);

  in.estimates.fuel_consumption = !facts.fuel_consumption.has_value() || facts.is_estimated.fuel_consumption;
  in.estimates.vehicle_class = !config.vehicle_class.has_value() && facts.is_estimated.vehicle_class;
  in.estimates.vehicle_age_unknown = !in.vehicle_age_years.has_value();
  return in;
}

NormalizedComputationInput Assemble(const VehicleFacts& facts,
                                    const OwnershipConfiguration& config,
                                    int current_year,
                                    const EngineConstants& constants) {
  return InputAssembler(constants).Assemble(facts, config, current_year);
}

NormalizedComputationInput Assemble(const VehicleFacts& facts, const OwnershipConfiguration& config) {
  return Assemble(facts, config, CurrentYear());
}

int CurrentYear() {
  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  return tm.tm_year + 1900;
}

std::optional<int> ComputeVehicleAge(const std::optional<int>& model_year, int current_year) {
  if (!model_year.has_value()) return std::nullopt;
  return std::max(0, current_year - *model_year);
}

VehicleClass InferVehicleClass(const std::string& brand,
                               const std::string& model,
                               const std::optional<double>& power_hp) {
  const std::string b = ToLowerTrim(brand);
  const std::string m = ToLowerTrim(model);
  const bool has_power = power_hp.has_value() && *power_hp > 0.0;
  const double power = has_power ? *power_hp : 0.0;

  if (!b.empty() && ContainsAny(b, LuxuryBrands())) {
    return (has_power && power > 300.0) ? VehicleClass::kLuxury : VehicleClass::kLarge;
  }
  if (!m.empty() && ContainsAny(m, LargeModels())) return VehicleClass::kLarge;
  if (!m.empty() && ContainsAny(m, SimpleModels())) return VehicleClass::kSimple;
  if (!b.empty() && ContainsAny(b, BudgetBrands()) && (!has_power || power < 150.0)) {
    return VehicleClass::kSimple;
  }
  if (has_power) {
    if (power > 300.0) return VehicleClass::kLarge;
    if (power < 100.0) return VehicleClass::kSimple;
  }
  return VehicleClass::kNormal;
}

void ValidateInputs(const VehicleFacts& facts,
                    const OwnershipConfiguration& config,
                    const EngineConstants& constants) {
  std::vector<std::string> issues;
  const int max_years = constants.max_horizon_years;
  auto require_years = [&](int v, const char* name) {
    if (v < 0 || v > max_years) {
      issues.emplace_back(std::string(name) + " must be within [0, " + std::to_string(max_years) + "]");
    }
  };
  auto require_non_negative = [&](double v, const char* name) {
    if (IsBad(v) || v < 0.0) issues.emplace_back(std::string(name) + " must be a finite value >= 0");
  };

  if (IsBad(facts.purchase_price) || facts.purchase_price <= 0.0) {
    issues.emplace_back("purchase_price must be > 0");
  }
  if (ToLowerTrim(facts.fuel_type).empty()) issues.emplace_back("fuel_type is empty");
  if (facts.fuel_consumption.has_value()) require_non_negative(*facts.fuel_consumption, "fuel_consumption");
  if (facts.annual_tax.has_value()) require_non_negative(*facts.annual_tax, "vehicle annual_tax");
  if (facts.effective_interest_rate.has_value()) {
    require_non_negative(*facts.effective_interest_rate, "effective_interest_rate");
  }

  require_non_negative(config.annual_mileage_mil, "annual_mileage");
  require_non_negative(config.primary_fuel_price, "primary_fuel_price");
  require_non_negative(config.secondary_fuel_price, "secondary_fuel_price");
  if (IsBad(config.secondary_fuel_share_percent) || config.secondary_fuel_share_percent < 0.0 ||
      config.secondary_fuel_share_percent > 100.0) {
    issues.emplace_back("secondary_fuel_share must be within [0, 100]");
  }
  require_years(config.ownership_years, "ownership_years");
  require_non_negative(config.insurance_monthly, "insurance");
  require_non_negative(config.parking_monthly, "parking");
  require_non_negative(config.ancillary_care_monthly, "ancillary_care");
  require_non_negative(config.annual_tax, "annual_tax");
  require_non_negative(config.malus_tax_amount, "malus_tax_amount");
  if (config.annual_tire_cost.has_value()) require_non_negative(*config.annual_tire_cost, "annual_tire_cost");

  const LoanTerms& loan = config.loan;
  if (loan.down_payment_percent.has_value()) require_non_negative(*loan.down_payment_percent, "down_payment_percent");
  if (loan.residual_value_percent.has_value()) {
    require_non_negative(*loan.residual_value_percent, "residual_value_percent");
  }
  if (loan.interest_rate_percent.has_value()) require_non_negative(*loan.interest_rate_percent, "interest_rate");
  if (loan.monthly_admin_fee.has_value()) require_non_negative(*loan.monthly_admin_fee, "monthly_admin_fee");
  if (loan.term_years.has_value()) require_years(*loan.term_years, "loan_years");
  if (config.leasing.monthly_fee.has_value()) require_non_negative(*config.leasing.monthly_fee, "monthly_leasing_fee");

  if (issues.empty()) return;

  std::ostringstream oss;
  oss << "Invalid input: ";
  for (std::size_t i = 0; i < issues.size(); ++i) {
    if (i) oss << "; ";
    oss << issues[i];
  }
  throw std::invalid_argument(oss.str());
}

} // namespace carcost
