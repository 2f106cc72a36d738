/*
 * verify_common.h - 验证程序公共工具
 *
 * 每个 verify_*.cpp 是独立可执行文件，argv[1] 为表目录（默认当前目录），
 * 全部通过返回 0，否则返回 1。
 */

#ifndef VERIFY_COMMON_H
#define VERIFY_COMMON_H

#include "cube_common.h"

inline int g_verifyChecks = 0;
inline int g_verifyFailures = 0;

#define VERIFY(cond, msg)                                                      \
  do {                                                                         \
    g_verifyChecks++;                                                          \
    if (!(cond)) {                                                             \
      g_verifyFailures++;                                                      \
      std::cout << ANSI_RED << "  FAIL: " << msg << ANSI_RESET << " ("         \
                << __FILE__ << ":" << __LINE__ << ")" << std::endl;            \
    }                                                                          \
  } while (0)

inline std::string verify_table_dir(int argc, char **argv) {
  return argc > 1 ? std::string(argv[1]) : std::string(".");
}

inline void verify_section(const std::string &title) {
  std::cout << "\n--- " << title << " ---" << std::endl;
}

inline int verify_report(const std::string &name) {
  std::cout << std::endl;
  if (g_verifyFailures == 0) {
    std::cout << ANSI_GREEN << "=== " << name << ": PASS (" << g_verifyChecks
              << " checks) ===" << ANSI_RESET << std::endl;
    return 0;
  }
  std::cout << ANSI_RED << "=== " << name << ": FAIL (" << g_verifyFailures
            << " of " << g_verifyChecks << " checks failed) ===" << ANSI_RESET
            << std::endl;
  return 1;
}

// 随机合法状态（随机打乱得到）
inline State random_state(std::mt19937 &rng, int length = 30) {
  return State().apply_alg(random_alg(rng, length));
}

#endif // VERIFY_COMMON_H
