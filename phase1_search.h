/*
 * phase1_search.h - Phase 1 搜索（到达子群 <U, D, L2, R2, F2, B2>）
 */

#ifndef PHASE1_SEARCH_H
#define PHASE1_SEARCH_H

#include "cube_common.h"
#include "solve_stats.h"
#include "solver_tables.h"
#include <functional>

class Phase1Search {
public:
  // 每找到一个前缀调用一次，返回 true 表示停止枚举
  using Callback = std::function<bool(const std::vector<int> &)>;

  Phase1Search(const SolverTables &tables, SolveStats &stats);

  // corners 表剪枝的总步数上限，< 0 表示不检查
  void setBudget(int budget) { budget_ = budget; }

  // 枚举恰好 depth 步、到达子群的全部前缀
  // 返回 true 表示回调要求停止
  bool run(const State &s, int depth, const Callback &cb);

private:
  bool search(int c_ori, int e_ori, int slice_loc, int c_prm, int remaining,
              int prev);

  const SolverTables &t_;
  SolveStats &stats_;
  const Callback *cb_ = nullptr;
  std::vector<int> moves_;
  int budget_ = -1;
};

#endif // PHASE1_SEARCH_H
