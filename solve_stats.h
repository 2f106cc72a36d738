#pragma once
#include <cstdio>
#include <string>

// ========== 命名规范 ==========
// xxxProbes = 检查次数
// xxxCuts   = 剪枝次数
// 剪枝率 = Cuts / Probes * 100%

// 单次求解的搜索统计
struct SolveStats {
  long long phase1Probes = 0;    // Phase 1 访问节点数
  long long phase1Cuts = 0;      // coset 表剪枝（含方向集合去掉的移动）
  long long phase2Probes = 0;    // Phase 2 访问节点数
  long long phase2Cuts = 0;      // subset 表剪枝
  long long cornerProbes = 0;    // corners 表检查
  long long cornerCuts = 0;      // corners 表剪枝
  long long noTwistCuts = 0;     // 方向集合为空
  long long phase1Solutions = 0; // 到达子群的前缀数
  double elapsedSeconds = 0.0;

  SolveStats &operator+=(const SolveStats &o) {
    phase1Probes += o.phase1Probes;
    phase1Cuts += o.phase1Cuts;
    phase2Probes += o.phase2Probes;
    phase2Cuts += o.phase2Cuts;
    cornerProbes += o.cornerProbes;
    cornerCuts += o.cornerCuts;
    noTwistCuts += o.noTwistCuts;
    phase1Solutions += o.phase1Solutions;
    elapsedSeconds += o.elapsedSeconds;
    return *this;
  }

  // 不含耗时的计数比较（确定性检查用）
  bool sameCounters(const SolveStats &o) const {
    return phase1Probes == o.phase1Probes && phase1Cuts == o.phase1Cuts &&
           phase2Probes == o.phase2Probes && phase2Cuts == o.phase2Cuts &&
           cornerProbes == o.cornerProbes && cornerCuts == o.cornerCuts &&
           noTwistCuts == o.noTwistCuts &&
           phase1Solutions == o.phase1Solutions;
  }

  long long totalProbes() const { return phase1Probes + phase2Probes; }
};

// 输出: "名称: 剪枝数/检查数 (剪枝率%)"
inline void print_stat(const char *name, long long cuts, long long probes) {
  printf("  %-8s: %lld/%lld (%.1f%%)\n", name, cuts, probes,
         probes ? 100.0 * cuts / probes : 0.0);
}

inline void print_solve_stats(const SolveStats &s) {
  print_stat("phase1", s.phase1Cuts, s.phase1Probes);
  print_stat("phase2", s.phase2Cuts, s.phase2Probes);
  print_stat("corners", s.cornerCuts, s.cornerProbes);
  print_stat("noTwist", s.noTwistCuts, s.phase1Probes);
  printf("  phase1 solutions: %lld | elapsed: %.3fs\n", s.phase1Solutions,
         s.elapsedSeconds);
}
