#include "tests/test_framework.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// =========================
// End-to-end tests: JSON 输入 -> 装配 -> Pipeline -> 输出文件
// =========================
//
// 每个用例在系统临时目录下建一个独立的 input/output 目录，结束时删除。

#include "assembler/input_assembler.hpp"
#include "common/rounding.hpp"
#include "io/output_writer.hpp"
#include "io/scenario_io.hpp"
#include "pipeline/pipeline.hpp"

namespace fs = std::filesystem;

namespace {

using carcost::io::OutputWriter;
using carcost::io::ScenarioIO;

constexpr int kYear = 2025;

// 临时目录（RAII）：析构时递归删除
class ScratchDir {
public:
  explicit ScratchDir(const std::string& tag) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() / ("carcost_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const fs::path& path() const { return path_; }

  void Write(const std::string& name, const std::string& text) const {
    std::ofstream ofs(path_ / name);
    ofs << text;
  }

private:
  fs::path path_;
};

std::string ReadFile(const fs::path& p) {
  std::ifstream ifs(p);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

std::size_t CountLines(const fs::path& p) {
  std::ifstream ifs(p);
  std::size_t n = 0;
  std::string line;
  while (std::getline(ifs, line)) ++n;
  return n;
}

const char* kGasolineVehicle = R"({
  "name": "Test Sedan",
  "brand": "Volvo",
  "model": "V60",
  "purchase_price": 300000,
  "fuel_type": "Bensin",
  "fuel_consumption": 0.7,
  "vehicle_class": "normal"
})";

// ---------------- Scenario loading ----------------

bool Test_LoadScenario_MergesDefaults() {
  ScratchDir dir("merge");
  dir.Write("vehicle.json", kGasolineVehicle);
  dir.Write("config.json", R"({ "insurance": 300, "financing_type": "loan", "loan": { "type": "annuity" } })");

  const auto s = ScenarioIO::LoadScenario(dir.path().string());
  CARCOST_EXPECT_NEAR(s.facts.purchase_price, 300000.0, 1e-9);
  CARCOST_EXPECT_EQ(s.facts.fuel_type, std::string("Bensin"));
  CARCOST_EXPECT_TRUE(!s.facts.model_year.has_value());

  CARCOST_EXPECT_NEAR(s.config.insurance_monthly, 300.0, 1e-9);
  CARCOST_EXPECT_NEAR(s.config.annual_mileage_mil, 1500.0, 1e-9);
  CARCOST_EXPECT_NEAR(s.config.ancillary_care_monthly, 250.0, 1e-9);
  CARCOST_EXPECT_TRUE(s.config.financing_mode == carcost::FinancingMode::kLoan);
  CARCOST_EXPECT_TRUE(s.config.loan.type.has_value());
  CARCOST_EXPECT_TRUE(*s.config.loan.type == carcost::LoanType::kAnnuity);
  CARCOST_EXPECT_TRUE(!s.config.loan.interest_rate_percent.has_value());
  return true;
}

bool Test_LoadScenario_ConfigOptional() {
  ScratchDir dir("noconfig");
  dir.Write("vehicle.json", kGasolineVehicle);

  const auto s = ScenarioIO::LoadScenario(dir.path().string());
  const auto d = carcost::DefaultConfiguration();
  CARCOST_EXPECT_NEAR(s.config.insurance_monthly, d.insurance_monthly, 1e-9);
  CARCOST_EXPECT_TRUE(s.config.financing_mode == carcost::FinancingMode::kCash);
  CARCOST_EXPECT_EQ(s.config.ownership_years, 5);
  return true;
}

bool Test_LoadScenario_InfersVehicleClass() {
  ScratchDir dir("infer");
  dir.Write("vehicle.json", R"({ "purchase_price": 899000, "fuel_type": "El",
                                 "brand": "Porsche", "model": "Taycan", "engine_power": 408 })");

  const auto s = ScenarioIO::LoadScenario(dir.path().string());
  CARCOST_EXPECT_TRUE(s.facts.vehicle_class == carcost::VehicleClass::kLuxury);
  CARCOST_EXPECT_TRUE(s.facts.is_estimated.vehicle_class);
  CARCOST_EXPECT_TRUE(s.facts.is_estimated.fuel_consumption);
  return true;
}

bool Test_LoadScenario_Errors() {
  {
    ScratchDir dir("missing");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::runtime_error);
  }
  {
    ScratchDir dir("badjson");
    dir.Write("vehicle.json", "{ \"purchase_price\": ");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::runtime_error);
  }
  {
    ScratchDir dir("badenum");
    dir.Write("vehicle.json", kGasolineVehicle);
    dir.Write("config.json", R"({ "maintenance_level": "extreme" })");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::runtime_error);
  }
  {
    ScratchDir dir("badtype");
    dir.Write("vehicle.json", R"({ "purchase_price": "cheap", "fuel_type": "Diesel" })");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::runtime_error);
  }
  {
    ScratchDir dir("noprice");
    dir.Write("vehicle.json", R"({ "fuel_type": "Diesel" })");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::runtime_error);
  }
  {
    ScratchDir dir("horizon");
    dir.Write("vehicle.json", kGasolineVehicle);
    dir.Write("config.json", R"({ "ownership_years": 2000000000, "loan": { "loan_years": 200000000 } })");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::invalid_argument);
  }
  {
    // 结构合法但数值非法：边界校验
    ScratchDir dir("negative");
    dir.Write("vehicle.json", R"({ "purchase_price": -5, "fuel_type": "Diesel" })");
    CARCOST_EXPECT_THROWS(ScenarioIO::LoadScenario(dir.path().string()), std::invalid_argument);
  }
  return true;
}

// ---------------- Estimate ----------------

bool Test_Estimate_FromJsonScenario() {
  ScratchDir dir("e2e");
  dir.Write("vehicle.json", kGasolineVehicle);
  dir.Write("config.json", R"({ "insurance": 300 })");

  const auto s = ScenarioIO::LoadScenario(dir.path().string());
  const auto est = carcost::Estimate(s.facts, s.config, kYear);
  const auto& b = est.breakdown;

  CARCOST_EXPECT_EQ(b.fuel, 19425);
  CARCOST_EXPECT_EQ(b.depreciation, 27146);
  CARCOST_EXPECT_EQ(b.tax, 2000);
  CARCOST_EXPECT_EQ(b.maintenance, 8000);
  CARCOST_EXPECT_EQ(b.tires, 1500);
  CARCOST_EXPECT_EQ(b.insurance, 3600);
  CARCOST_EXPECT_EQ(b.ancillary_care, 3000);
  CARCOST_EXPECT_EQ(b.total_annual, 64671);
  CARCOST_EXPECT_EQ(b.cost_per_km, std::string("4.31"));
  CARCOST_EXPECT_EQ(b.monthly_total, 5389);

  CARCOST_EXPECT_TRUE(est.input.estimates.vehicle_age_unknown);
  CARCOST_EXPECT_EQ(est.depreciation_schedule.size(), std::size_t(5));
  CARCOST_EXPECT_TRUE(est.amortization_schedule.empty());
  return true;
}

bool Test_Estimate_MatchesCalculate() {
  carcost::VehicleFacts facts;
  facts.purchase_price = 329900.0;
  facts.fuel_type = "Laddhybrid";
  facts.model_year = 2022;
  facts.effective_interest_rate = 6.45;

  auto cfg = carcost::DefaultConfiguration();
  cfg.financing_mode = carcost::FinancingMode::kLoan;
  cfg.loan.type = carcost::LoanType::kAnnuity;
  cfg.parking_monthly = 600.0;

  const auto est = carcost::Estimate(facts, cfg, kYear);
  const auto direct = carcost::Calculate(carcost::Assemble(facts, cfg, kYear));
  CARCOST_EXPECT_EQ(est.breakdown.total_annual, direct.total_annual);
  CARCOST_EXPECT_EQ(est.breakdown.monthly_installment, direct.monthly_installment);
  CARCOST_EXPECT_EQ(est.breakdown.financing, est.breakdown.monthly_installment * 12);
  CARCOST_EXPECT_EQ(est.breakdown.total_annual, est.breakdown.variable_costs + est.breakdown.fixed_costs);
  CARCOST_EXPECT_EQ(*est.input.vehicle_age_years, 3);
  return true;
}

bool Test_Estimate_Schedules() {
  carcost::VehicleFacts facts;
  facts.purchase_price = 250000.0;
  facts.fuel_type = "Diesel";
  facts.fuel_consumption = 0.55;
  facts.model_year = 2023;

  auto cfg = carcost::DefaultConfiguration();
  cfg.ownership_years = 4;
  cfg.financing_mode = carcost::FinancingMode::kLoan;
  cfg.loan.type = carcost::LoanType::kAnnuity;
  cfg.loan.down_payment_percent = 20.0;
  cfg.loan.interest_rate_percent = 5.0;
  cfg.loan.term_years = 3;

  const auto est = carcost::Estimate(facts, cfg, kYear);

  // 折旧明细：逐年衔接，均值 == 年度折旧
  CARCOST_EXPECT_EQ(est.depreciation_schedule.size(), std::size_t(4));
  double total_loss = 0.0;
  for (std::size_t i = 0; i < est.depreciation_schedule.size(); ++i) {
    const auto& row = est.depreciation_schedule[i];
    CARCOST_EXPECT_EQ(row.start_age, 2 + static_cast<int>(i));
    if (i > 0) CARCOST_EXPECT_NEAR(row.value_start, est.depreciation_schedule[i - 1].value_end, 1e-6);
    total_loss += row.loss;
  }
  CARCOST_EXPECT_EQ(est.breakdown.depreciation, carcost::RoundHalfUp(total_loss / 4.0));

  // 等额本息明细：36 期，本金还清
  CARCOST_EXPECT_EQ(est.amortization_schedule.size(), std::size_t(36));
  CARCOST_EXPECT_NEAR(est.amortization_schedule.back().balance, 0.0, 1e-6);
  CARCOST_EXPECT_EQ(est.breakdown.monthly_installment, 5994);
  CARCOST_EXPECT_NEAR(est.loan_principal, 200000.0, 1e-6);
  CARCOST_EXPECT_NEAR(est.loan_residual, 0.0, 1e-9);
  return true;
}

// ---------------- Output ----------------

bool Test_OutputWriter_WritesAllFiles() {
  ScratchDir in_dir("out_in");
  in_dir.Write("vehicle.json", kGasolineVehicle);
  in_dir.Write("config.json", R"({ "insurance": 300, "financing_type": "loan",
                                   "loan": { "type": "annuity", "interest_rate": 5, "loan_years": 2 } })");

  ScratchDir out_root("out");
  const fs::path out_dir = out_root.path() / "nested" / "result";

  const auto s = ScenarioIO::LoadScenario(in_dir.path().string());
  const auto est = carcost::Estimate(s.facts, s.config, kYear);
  OutputWriter::WriteAll(est, out_dir.string());

  CARCOST_EXPECT_TRUE(fs::exists(out_dir / "breakdown.json"));
  CARCOST_EXPECT_TRUE(fs::exists(out_dir / "depreciation.csv"));
  CARCOST_EXPECT_TRUE(fs::exists(out_dir / "amortization.csv"));

  // header + 每年一行 / 每月一行
  CARCOST_EXPECT_EQ(CountLines(out_dir / "depreciation.csv"), std::size_t(1 + 5));
  CARCOST_EXPECT_EQ(CountLines(out_dir / "amortization.csv"), std::size_t(1 + 24));

  const auto j = nlohmann::json::parse(ReadFile(out_dir / "breakdown.json"));
  CARCOST_EXPECT_EQ(j.at("breakdown").at("total_annual").get<std::int64_t>(), est.breakdown.total_annual);
  CARCOST_EXPECT_EQ(j.at("breakdown").at("monthly_installment").get<std::int64_t>(),
                    est.breakdown.monthly_installment);
  CARCOST_EXPECT_EQ(j.at("breakdown").at("cost_per_km").get<std::string>(), est.breakdown.cost_per_km);
  CARCOST_EXPECT_EQ(j.at("input").at("fuel_type").get<std::string>(), std::string("gasoline"));
  const auto& financing = j.at("input").at("financing");
  CARCOST_EXPECT_EQ(financing.at("mode").get<std::string>(), std::string("loan"));
  CARCOST_EXPECT_NEAR(financing.at("monthly_admin_fee").get<double>(), 60.0, 1e-9);
  CARCOST_EXPECT_NEAR(financing.at("principal").get<double>(), 240000.0, 1e-6);
  CARCOST_EXPECT_NEAR(financing.at("residual").get<double>(), 0.0, 1e-9);
  CARCOST_EXPECT_TRUE(j.at("input").at("vehicle_age").is_null());
  CARCOST_EXPECT_TRUE(j.at("estimated").at("vehicle_age").get<bool>());
  CARCOST_EXPECT_TRUE(!j.at("estimated").at("fuel_consumption").get<bool>());
  return true;
}

bool Test_OutputWriter_CashHasEmptyAmortization() {
  carcost::VehicleFacts facts;
  facts.purchase_price = 180000.0;
  facts.fuel_type = "Hybrid";
  const auto est = carcost::Estimate(facts, carcost::DefaultConfiguration(), kYear);

  ScratchDir out("cash");
  OutputWriter::WriteAll(est, out.path().string());
  CARCOST_EXPECT_EQ(CountLines(out.path() / "amortization.csv"), std::size_t(1));

  const auto j = nlohmann::json::parse(ReadFile(out.path() / "breakdown.json"));
  CARCOST_EXPECT_EQ(j.at("input").at("financing").at("mode").get<std::string>(), std::string("cash"));
  CARCOST_EXPECT_EQ(j.at("breakdown").at("financing").get<std::int64_t>(), std::int64_t(0));
  return true;
}

bool Test_Pipeline_RerunIsDeterministic() {
  ScratchDir dir("rerun");
  dir.Write("vehicle.json", kGasolineVehicle);
  dir.Write("config.json", R"({ "financing_type": "leasing", "leasing": { "monthly_fee": 4199, "includes_insurance": true } })");

  const auto s = ScenarioIO::LoadScenario(dir.path().string());
  const auto a = carcost::Estimate(s.facts, s.config, kYear);
  const auto b = carcost::Estimate(s.facts, s.config, kYear);
  CARCOST_EXPECT_EQ(a.breakdown.total_annual, b.breakdown.total_annual);
  CARCOST_EXPECT_EQ(a.breakdown.financing, 4199 * 12);
  CARCOST_EXPECT_EQ(a.breakdown.insurance, 0);

  // 同一个 Pipeline 对象可以重复 Run：每次 Run 覆盖上一次的输出
  carcost::Pipeline pipe;
  carcost::CostContext ctx;
  ctx.input = carcost::Assemble(s.facts, s.config, kYear);
  pipe.Run(ctx);
  const auto first = ctx.breakdown.total_annual;
  pipe.Run(ctx);
  CARCOST_EXPECT_EQ(ctx.breakdown.total_annual, first);
  CARCOST_EXPECT_EQ(ctx.depreciation_schedule.size(), std::size_t(5));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using carcost::test::TestCase;

  std::vector<TestCase> cases = {
      {"Scenario: config merged over defaults", Test_LoadScenario_MergesDefaults},
      {"Scenario: config.json optional", Test_LoadScenario_ConfigOptional},
      {"Scenario: vehicle class inferred", Test_LoadScenario_InfersVehicleClass},
      {"Scenario: load errors", Test_LoadScenario_Errors},
      {"Estimate: JSON scenario", Test_Estimate_FromJsonScenario},
      {"Estimate: same as Assemble + Calculate", Test_Estimate_MatchesCalculate},
      {"Estimate: schedules", Test_Estimate_Schedules},
      {"Output: all files written", Test_OutputWriter_WritesAllFiles},
      {"Output: cash has empty amortization", Test_OutputWriter_CashHasEmptyAmortization},
      {"Pipeline: rerun deterministic", Test_Pipeline_RerunIsDeterministic},
  };

  return carcost::test::RunAll(cases, argc, argv);
}
