#include "common/enum_strings.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>

namespace carcost {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

template <typename E>
std::optional<E> ParseByName(const std::string& s, std::initializer_list<E> values) {
  const std::string key = ToLower(s);
  for (const E v : values) {
    if (key == ToString(v)) return v;
  }
  return std::nullopt;
}

} // namespace

const char* ToString(FuelType v) {
  switch (v) {
    case FuelType::kGasoline:     return "gasoline";
    case FuelType::kDiesel:       return "diesel";
    case FuelType::kPluginHybrid: return "plugin_hybrid";
    case FuelType::kHybrid:       return "hybrid";
    case FuelType::kElectric:     return "electric";
    case FuelType::kEthanol:      return "ethanol";
    case FuelType::kBiogas:       return "biogas";
  }
  return "gasoline";
}

const char* ToString(VehicleClass v) {
  switch (v) {
    case VehicleClass::kSimple: return "simple";
    case VehicleClass::kNormal: return "normal";
    case VehicleClass::kLarge:  return "large";
    case VehicleClass::kLuxury: return "luxury";
  }
  return "normal";
}

const char* ToString(MaintenanceLevel v) {
  switch (v) {
    case MaintenanceLevel::kLow:    return "low";
    case MaintenanceLevel::kNormal: return "normal";
    case MaintenanceLevel::kHigh:   return "high";
  }
  return "normal";
}

const char* ToString(DepreciationLevel v) {
  switch (v) {
    case DepreciationLevel::kLow:    return "low";
    case DepreciationLevel::kNormal: return "normal";
    case DepreciationLevel::kHigh:   return "high";
  }
  return "normal";
}

const char* ToString(FinancingMode v) {
  switch (v) {
    case FinancingMode::kCash:    return "cash";
    case FinancingMode::kLoan:    return "loan";
    case FinancingMode::kLeasing: return "leasing";
  }
  return "cash";
}

const char* ToString(LoanType v) {
  switch (v) {
    case LoanType::kResidual: return "residual";
    case LoanType::kAnnuity:  return "annuity";
  }
  return "residual";
}

const char* ToString(LeasingType v) {
  switch (v) {
    case LeasingType::kPrivate:  return "private";
    case LeasingType::kBusiness: return "business";
  }
  return "private";
}

std::optional<VehicleClass> ParseVehicleClass(const std::string& s) {
  return ParseByName(s, {VehicleClass::kSimple, VehicleClass::kNormal, VehicleClass::kLarge, VehicleClass::kLuxury});
}

std::optional<MaintenanceLevel> ParseMaintenanceLevel(const std::string& s) {
  return ParseByName(s, {MaintenanceLevel::kLow, MaintenanceLevel::kNormal, MaintenanceLevel::kHigh});
}

std::optional<DepreciationLevel> ParseDepreciationLevel(const std::string& s) {
  return ParseByName(s, {DepreciationLevel::kLow, DepreciationLevel::kNormal, DepreciationLevel::kHigh});
}

std::optional<FinancingMode> ParseFinancingMode(const std::string& s) {
  return ParseByName(s, {FinancingMode::kCash, FinancingMode::kLoan, FinancingMode::kLeasing});
}

std::optional<LoanType> ParseLoanType(const std::string& s) {
  return ParseByName(s, {LoanType::kResidual, LoanType::kAnnuity});
}

std::optional<LeasingType> ParseLeasingType(const std::string& s) {
  return ParseByName(s, {LeasingType::kPrivate, LeasingType::kBusiness});
}

} // namespace carcost
