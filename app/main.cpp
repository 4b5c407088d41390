#include <iostream>
#include <string>

#include "assembler/input_assembler.hpp"
#include "common/enum_strings.hpp"
#include "io/output_writer.hpp"
#include "io/scenario_io.hpp"
#include "pipeline/pipeline.hpp"

static void PrintSummary(const carcost::CostEstimate& est) {
  const auto& in = est.input;
  const auto& b = est.breakdown;
  const char* approx = in.estimates.fuel_consumption ? "~" : "";

  std::cout << "Vehicle: " << in.purchase_price << " kr, " << carcost::ToString(in.fuel_type)
            << ", class " << carcost::ToString(in.vehicle_class) << ", age ";
  if (in.vehicle_age_years.has_value()) {
    std::cout << *in.vehicle_age_years;
  } else {
    std::cout << "unknown";
  }
  std::cout << "\n";
  std::cout << "Usage:   " << in.annual_mileage_mil << " mil/year over " << in.ownership_years << " years\n";
  std::cout << "  fuel           " << approx << b.fuel << "\n";
  std::cout << "  depreciation   " << b.depreciation << "\n";
  std::cout << "  tax            " << b.tax << "\n";
  std::cout << "  maintenance    " << b.maintenance << "\n";
  std::cout << "  tires          " << b.tires << "\n";
  std::cout << "  insurance      " << b.insurance << "\n";
  std::cout << "  parking        " << b.parking << "\n";
  std::cout << "  ancillary care " << b.ancillary_care << "\n";
  std::cout << "  financing      " << b.financing << " (" << b.monthly_installment << "/month)\n";
  std::cout << "Total:   " << b.total_annual << " kr/year, " << b.monthly_total << " kr/month, "
            << b.cost_per_mil << " kr/mil (" << b.cost_per_km << " kr/km)\n";
}

int main(int argc, char** argv) {
  // 默认使用 demo/input 和 demo/output
  //   ./carcost_demo
  //   ./carcost_demo /path/to/input /path/to/output [--year 2026]
  std::string input_dir  = "demo/input";
  std::string output_dir = "demo/output";
  std::string year_arg;

  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--year" && i + 1 < argc) {
      year_arg = argv[++i];
    } else if (positional == 0) {
      input_dir = arg;
      ++positional;
    } else if (positional == 1) {
      output_dir = arg;
      ++positional;
    } else {
      std::cerr << "ERROR: unexpected argument: " << arg << "\n";
      return 1;
    }
  }

  try {
    // 1) 读取输入（vehicle.json + config.json），边界校验在这里完成
    const carcost::io::Scenario scenario = carcost::io::ScenarioIO::LoadScenario(input_dir);

    // 2) 装配 + 计算
    const int year = year_arg.empty() ? carcost::CurrentYear() : std::stoi(year_arg);
    const carcost::CostEstimate est = carcost::Estimate(scenario.facts, scenario.config, year);

    // 3) 输出（breakdown.json + csv）
    carcost::io::OutputWriter::WriteAll(est, output_dir);

    PrintSummary(est);
    std::cout << "Done. Output written to: " << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
