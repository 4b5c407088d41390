#pragma once
#include "common/types.hpp"

namespace carcost {

// 每个计算“环节”都实现一个 Stage，输入输出都通过 CostContext 传递。
// CostContext 每次 Calculate 都新建，Stage 自身不保存任何跨调用状态，
// 因此同一个 Pipeline 可以被反复调用，也可以在多个线程里各自持有。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(CostContext& ctx) = 0;
};

} // namespace carcost
