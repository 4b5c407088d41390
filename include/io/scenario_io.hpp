#pragma once
#include <string>

#include "common/types.hpp"

namespace carcost::io {

// 一次估算的全部输入：车辆数据 + 用户配置
struct Scenario {
  VehicleFacts facts;
  OwnershipConfiguration config;
};

// ScenarioIO 只负责“把 input_dir 里的 JSON 读进 Scenario”。
//
// input_dir 结构：
//   input_dir/vehicle.json   （必需，页面抽取层的输出）
//   input_dir/config.json    （可选，缺失时使用 DefaultConfiguration()）
//
// config.json 只需给出与默认值不同的字段，其余字段保持默认（浅合并）。
// 文件缺失 / JSON 解析失败 / 未知枚举值：抛 std::runtime_error。
// 结构性错误（负价格等）：LoadScenario 调用 ValidateInputs，抛 std::invalid_argument。
class ScenarioIO {
public:
  static Scenario LoadScenario(const std::string& input_dir);

  static VehicleFacts LoadVehicleFacts(const std::string& path);
  static OwnershipConfiguration LoadConfiguration(const std::string& path);

  // 直接解析 JSON 文本（hint 用于错误信息）
  static VehicleFacts ParseVehicleFacts(const std::string& json_text, const std::string& hint = "vehicle");
  static OwnershipConfiguration ParseConfiguration(const std::string& json_text, const std::string& hint = "config");
};

} // namespace carcost::io
