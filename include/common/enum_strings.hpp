#pragma once
#include <optional>
#include <string>

#include "common/types.hpp"

namespace carcost {

// 枚举 <-> 稳定的小写字符串 key（JSON 输入/输出使用）
// Parse* 遇到未知 key 返回 std::nullopt，由调用方决定如何报错。

const char* ToString(FuelType v);
const char* ToString(VehicleClass v);
const char* ToString(MaintenanceLevel v);
const char* ToString(DepreciationLevel v);
const char* ToString(FinancingMode v);
const char* ToString(LoanType v);
const char* ToString(LeasingType v);

std::optional<VehicleClass> ParseVehicleClass(const std::string& s);
std::optional<MaintenanceLevel> ParseMaintenanceLevel(const std::string& s);
std::optional<DepreciationLevel> ParseDepreciationLevel(const std::string& s);
std::optional<FinancingMode> ParseFinancingMode(const std::string& s);
std::optional<LoanType> ParseLoanType(const std::string& s);
std::optional<LeasingType> ParseLeasingType(const std::string& s);

} // namespace carcost
