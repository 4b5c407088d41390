#pragma once
#include <string>
#include "common/types.hpp"

namespace carcost::io {

// OutputWriter 负责把一次估算的“最终产物”写到 output_dir：
// 1) breakdown.json：输入摘要 + CostBreakdown 全部字段 + 估算标记
// 2) depreciation.csv：逐年折旧明细
// 3) amortization.csv：等额本息逐月明细（其他融资方式只有表头）
class OutputWriter {
public:
  static void WriteAll(const CostEstimate& est, const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static void WriteBreakdownJson(const CostEstimate& est, const std::string& output_path);
  static void WriteDepreciationCsv(const CostEstimate& est, const std::string& output_path);
  static void WriteAmortizationCsv(const CostEstimate& est, const std::string& output_path);
};

} // namespace carcost::io
