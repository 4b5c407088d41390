#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace carcost::test {

struct TestCase {
  std::string name;
  std::function<bool()> fn;
};

// argv[1]（可选）：只运行名字里包含该子串的用例，例如
//   ./calculator_tests Financing
inline int RunAll(const std::vector<TestCase>& cases, int argc = 0, char** argv = nullptr) {
  const std::string filter = (argc >= 2 && argv != nullptr) ? argv[1] : "";

  int failed = 0;
  int ran = 0;
  for (const auto& tc : cases) {
    if (!filter.empty() && tc.name.find(filter) == std::string::npos) continue;
    ++ran;

    bool ok = false;
    try {
      ok = tc.fn();
    } catch (const std::exception& e) {
      std::cerr << "[EXCEPTION] " << tc.name << ": " << e.what() << "\n";
      ok = false;
    }

    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tc.name << "\n";
    if (!ok) failed++;
  }

  if (ran == 0) {
    std::cout << "No test matched filter \"" << filter << "\".\n";
    return 1;
  }
  if (failed == 0) {
    std::cout << "All tests passed (" << ran << ").\n";
    return 0;
  }
  std::cout << failed << " test(s) failed out of " << ran << ".\n";
  return 1;
}

// ----------- Minimal expectation macros -----------

#define CARCOST_EXPECT_TRUE(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "Expectation failed: " << #expr \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define CARCOST_EXPECT_EQ(a, b) \
  do { \
    auto _a = (a); \
    auto _b = (b); \
    if (!(_a == _b)) { \
      std::cerr << "Expectation failed: " << #a << " == " << #b \
                << " (got " << _a << " vs " << _b << ")" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define CARCOST_EXPECT_GE(a, b) \
  do { \
    auto _a = (a); \
    auto _b = (b); \
    if (!(_a >= _b)) { \
      std::cerr << "Expectation failed: " << #a << " >= " << #b \
                << " (got " << _a << " vs " << _b << ")" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define CARCOST_EXPECT_NEAR(a, b, eps) \
  do { \
    auto _a = (a); \
    auto _b = (b); \
    auto _eps = (eps); \
    if ((_a > _b ? _a - _b : _b - _a) > _eps) { \
      std::cerr << "Expectation failed: |" << #a << " - " << #b << "| <= " << #eps \
                << " (got " << _a << " vs " << _b << ")" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

// expr 必须抛出 ex_type（其他异常类型视为失败并继续向上抛给 RunAll）
#define CARCOST_EXPECT_THROWS(expr, ex_type) \
  do { \
    bool _thrown = false; \
    try { \
      (void)(expr); \
    } catch (const ex_type&) { \
      _thrown = true; \
    } \
    if (!_thrown) { \
      std::cerr << "Expectation failed: " << #expr << " throws " << #ex_type \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

} // namespace carcost::test
