#include "io/scenario_io.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "assembler/input_assembler.hpp"
#include "common/constants.hpp"
#include "common/enum_strings.hpp"

namespace fs = std::filesystem;

namespace carcost::io {

using json = nlohmann::json;

static std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// key 缺失或为 null 时返回空
template <typename T>
static std::optional<T> OptionalValue(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  return it->get<T>();
}

// 枚举字段：缺失时保持原值，未知 key 直接报错（不静默回落）
template <typename E, typename ParseFn>
static std::optional<E> OptionalEnum(const json& j, const char* key, ParseFn parse, const std::string& hint) {
  const auto raw = OptionalValue<std::string>(j, key);
  if (!raw.has_value()) return std::nullopt;
  const std::optional<E> v = parse(*raw);
  if (!v.has_value()) {
    throw std::runtime_error("Unknown value for " + hint + "." + key + ": \"" + *raw + "\"");
  }
  return v;
}

template <typename T>
static void AssignIfPresent(const json& j, const char* key, T* dst) {
  if (const auto v = OptionalValue<T>(j, key)) *dst = *v;
}

static VehicleFacts VehicleFactsFromJson(const json& root, const std::string& hint) {
  if (!root.is_object()) throw std::runtime_error(hint + ": expected a JSON object");
  if (!root.contains("purchase_price")) throw std::runtime_error(hint + ": missing purchase_price");
  if (!root.contains("fuel_type")) throw std::runtime_error(hint + ": missing fuel_type");

  VehicleFacts f;
  f.purchase_price = root.at("purchase_price").get<double>();
  f.fuel_type = root.at("fuel_type").get<std::string>();
  f.fuel_consumption = OptionalValue<double>(root, "fuel_consumption");
  f.model_year = OptionalValue<int>(root, "model_year");
  f.mileage_mil = OptionalValue<double>(root, "mileage");
  f.engine_power_hp = OptionalValue<double>(root, "engine_power");
  f.co2_g_per_km = OptionalValue<double>(root, "co2_emissions");
  f.effective_interest_rate = OptionalValue<double>(root, "effective_interest_rate");
  f.annual_tax = OptionalValue<double>(root, "annual_tax");
  f.name = root.value("name", f.name);
  f.brand = root.value("brand", f.brand);
  f.model = root.value("model", f.model);

  const json est = root.value("is_estimated", json::object());
  f.is_estimated.fuel_consumption = est.value("fuel_consumption", !f.fuel_consumption.has_value());
  f.is_estimated.vehicle_class = est.value("vehicle_class", false);

  // 抽取层没给等级：按品牌/车型/功率推断，并标记为估算
  const auto cls = OptionalEnum<VehicleClass>(root, "vehicle_class", ParseVehicleClass, hint);
  if (cls.has_value()) {
    f.vehicle_class = *cls;
  } else {
    f.vehicle_class = InferVehicleClass(f.brand, f.model, f.engine_power_hp);
    f.is_estimated.vehicle_class = true;
  }
  return f;
}

static OwnershipConfiguration ConfigurationFromJson(const json& root, const std::string& hint) {
  if (!root.is_object()) throw std::runtime_error(hint + ": expected a JSON object");

  OwnershipConfiguration c = DefaultConfiguration();
  AssignIfPresent(root, "annual_mileage", &c.annual_mileage_mil);
  AssignIfPresent(root, "primary_fuel_price", &c.primary_fuel_price);
  AssignIfPresent(root, "secondary_fuel_price", &c.secondary_fuel_price);
  AssignIfPresent(root, "secondary_fuel_share", &c.secondary_fuel_share_percent);
  AssignIfPresent(root, "ownership_years", &c.ownership_years);
  AssignIfPresent(root, "insurance", &c.insurance_monthly);
  AssignIfPresent(root, "parking", &c.parking_monthly);
  AssignIfPresent(root, "ancillary_care", &c.ancillary_care_monthly);
  AssignIfPresent(root, "annual_tax", &c.annual_tax);
  AssignIfPresent(root, "has_malus_tax", &c.has_malus_tax);
  AssignIfPresent(root, "malus_tax_amount", &c.malus_tax_amount);
  c.annual_tire_cost = OptionalValue<double>(root, "annual_tire_cost");

  if (const auto v = OptionalEnum<VehicleClass>(root, "vehicle_class", ParseVehicleClass, hint)) c.vehicle_class = v;
  if (const auto v = OptionalEnum<MaintenanceLevel>(root, "maintenance_level", ParseMaintenanceLevel, hint)) {
    c.maintenance_level = *v;
  }
  if (const auto v = OptionalEnum<DepreciationLevel>(root, "depreciation_level", ParseDepreciationLevel, hint)) {
    c.depreciation_level = *v;
  }
  if (const auto v = OptionalEnum<FinancingMode>(root, "financing_type", ParseFinancingMode, hint)) {
    c.financing_mode = *v;
  }

  const json loan = root.value("loan", json::object());
  c.loan.type = OptionalEnum<LoanType>(loan, "type", ParseLoanType, hint + ".loan");
  c.loan.down_payment_percent = OptionalValue<double>(loan, "down_payment_percent");
  c.loan.residual_value_percent = OptionalValue<double>(loan, "residual_value_percent");
  c.loan.interest_rate_percent = OptionalValue<double>(loan, "interest_rate");
  c.loan.term_years = OptionalValue<int>(loan, "loan_years");
  c.loan.monthly_admin_fee = OptionalValue<double>(loan, "monthly_admin_fee");

  const json leasing = root.value("leasing", json::object());
  c.leasing.type = OptionalEnum<LeasingType>(leasing, "type", ParseLeasingType, hint + ".leasing");
  c.leasing.monthly_fee = OptionalValue<double>(leasing, "monthly_fee");
  c.leasing.includes_insurance = OptionalValue<bool>(leasing, "includes_insurance");
  return c;
}

VehicleFacts ScenarioIO::ParseVehicleFacts(const std::string& json_text, const std::string& hint) {
  const json root = ParseJson(json_text, hint);
  try {
    return VehicleFactsFromJson(root, hint);
  } catch (const json::exception& e) {
    throw std::runtime_error("Bad field type in " + hint + ": " + std::string(e.what()));
  }
}

OwnershipConfiguration ScenarioIO::ParseConfiguration(const std::string& json_text, const std::string& hint) {
  const json root = ParseJson(json_text, hint);
  try {
    return ConfigurationFromJson(root, hint);
  } catch (const json::exception& e) {
    throw std::runtime_error("Bad field type in " + hint + ": " + std::string(e.what()));
  }
}

VehicleFacts ScenarioIO::LoadVehicleFacts(const std::string& path) {
  return ParseVehicleFacts(ReadAllText(path), fs::path(path).filename().string());
}

OwnershipConfiguration ScenarioIO::LoadConfiguration(const std::string& path) {
  if (!fs::exists(path)) return DefaultConfiguration();
  return ParseConfiguration(ReadAllText(path), fs::path(path).filename().string());
}

Scenario ScenarioIO::LoadScenario(const std::string& input_dir) {
  const fs::path dir(input_dir);
  const fs::path vehicle_path = dir / "vehicle.json";
  if (!fs::exists(vehicle_path)) {
    throw std::runtime_error("No vehicle.json found in: " + dir.string());
  }

  Scenario s;
  s.facts = LoadVehicleFacts(vehicle_path.string());
  s.config = LoadConfiguration((dir / "config.json").string());

  // 计算引擎不做校验，系统边界在这里统一检查
  ValidateInputs(s.facts, s.config);
  return s;
}

} // namespace carcost::io
