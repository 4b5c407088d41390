#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <variant>

#include "common/enum_strings.hpp"

namespace fs = std::filesystem;

namespace carcost::io {

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

static const char* Bool(bool b) { return b ? "true" : "false"; }

void OutputWriter::WriteAll(const CostEstimate& est, const std::string& output_dir) {
  EnsureDir(output_dir);
  const fs::path dir(output_dir);
  WriteBreakdownJson(est, (dir / "breakdown.json").string());
  WriteDepreciationCsv(est, (dir / "depreciation.csv").string());
  WriteAmortizationCsv(est, (dir / "amortization.csv").string());
}

static void WriteFinancingJson(std::ostream& os, const CostEstimate& est) {
  const FinancingPlan& plan = est.input.financing;
  os << "    \"financing\": {";
  if (const auto* loan = std::get_if<LoanFinancing>(&plan)) {
    os << " \"mode\": \"loan\", \"loan_type\": \"" << ToString(loan->type) << "\""
       << ", \"down_payment_percent\": " << loan->down_payment_percent
       << ", \"residual_value_percent\": " << loan->residual_value_percent
       << ", \"interest_rate\": " << loan->interest_rate_percent
       << ", \"loan_years\": " << loan->term_years
       << ", \"monthly_admin_fee\": " << loan->monthly_admin_fee
       << ", \"principal\": " << est.loan_principal
       << ", \"residual\": " << est.loan_residual << " }";
  } else if (const auto* lease = std::get_if<LeasingFinancing>(&plan)) {
    os << " \"mode\": \"leasing\", \"leasing_type\": \"" << ToString(lease->type) << "\""
       << ", \"monthly_fee\": " << lease->monthly_fee
       << ", \"includes_insurance\": " << Bool(lease->includes_insurance) << " }";
  } else {
    os << " \"mode\": \"cash\" }";
  }
}

void OutputWriter::WriteBreakdownJson(const CostEstimate& est, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);

  const NormalizedComputationInput& in = est.input;
  const CostBreakdown& b = est.breakdown;

  ofs << std::setprecision(12);
  ofs << "{\n";

  // input 摘要
  ofs << "  \"input\": {\n";
  ofs << "    \"purchase_price\": " << in.purchase_price << ",\n";
  ofs << "    \"fuel_type\": \"" << ToString(in.fuel_type) << "\",\n";
  ofs << "    \"fuel_consumption\": " << in.fuel_consumption << ",\n";
  ofs << "    \"annual_mileage\": " << in.annual_mileage_mil << ",\n";
  ofs << "    \"vehicle_class\": \"" << ToString(in.vehicle_class) << "\",\n";
  ofs << "    \"vehicle_age\": ";
  if (in.vehicle_age_years.has_value()) {
    ofs << *in.vehicle_age_years;
  } else {
    ofs << "null";
  }
  ofs << ",\n";
  ofs << "    \"ownership_years\": " << in.ownership_years << ",\n";
  WriteFinancingJson(ofs, est);
  ofs << "\n  },\n";

  // breakdown
  ofs << "  \"breakdown\": {\n";
  ofs << "    \"fuel\": " << b.fuel << ",\n";
  ofs << "    \"depreciation\": " << b.depreciation << ",\n";
  ofs << "    \"tax\": " << b.tax << ",\n";
  ofs << "    \"maintenance\": " << b.maintenance << ",\n";
  ofs << "    \"tires\": " << b.tires << ",\n";
  ofs << "    \"insurance\": " << b.insurance << ",\n";
  ofs << "    \"parking\": " << b.parking << ",\n";
  ofs << "    \"ancillary_care\": " << b.ancillary_care << ",\n";
  ofs << "    \"financing\": " << b.financing << ",\n";
  ofs << "    \"monthly_installment\": " << b.monthly_installment << ",\n";
  ofs << "    \"variable_costs\": " << b.variable_costs << ",\n";
  ofs << "    \"fixed_costs\": " << b.fixed_costs << ",\n";
  ofs << "    \"total_annual\": " << b.total_annual << ",\n";
  ofs << "    \"cost_per_mil\": " << b.cost_per_mil << ",\n";
  ofs << "    \"cost_per_km\": \"" << b.cost_per_km << "\",\n";
  ofs << "    \"monthly_total\": " << b.monthly_total << "\n";
  ofs << "  },\n";

  // 哪些分项基于估算值（展示层据此加 "~"）
  ofs << "  \"estimated\": {\n";
  ofs << "    \"fuel_consumption\": " << Bool(in.estimates.fuel_consumption) << ",\n";
  ofs << "    \"vehicle_class\": " << Bool(in.estimates.vehicle_class) << ",\n";
  ofs << "    \"vehicle_age\": " << Bool(in.estimates.vehicle_age_unknown) << "\n";
  ofs << "  }\n";

  ofs << "}\n";
}

void OutputWriter::WriteDepreciationCsv(const CostEstimate& est, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "year,start_age,rate,value_start,loss,value_end\n";
  for (const auto& r : est.depreciation_schedule) {
    ofs << (r.year_index + 1) << "," << r.start_age << ","
        << std::fixed << std::setprecision(4) << r.effective_rate << ","
        << std::setprecision(2) << r.value_start << "," << r.loss << "," << r.value_end << "\n";
  }
}

void OutputWriter::WriteAmortizationCsv(const CostEstimate& est, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << "month,installment,interest,principal,balance\n";
  ofs << std::fixed << std::setprecision(2);
  for (const auto& r : est.amortization_schedule) {
    ofs << r.month << "," << r.installment << "," << r.interest << "," << r.principal << "," << r.balance << "\n";
  }
}

} // namespace carcost::io
