/*
 * phase2_search.h - Phase 2 搜索（子群内还原）
 */

#ifndef PHASE2_SEARCH_H
#define PHASE2_SEARCH_H

#include "cube_common.h"
#include "solve_stats.h"
#include "solver_tables.h"

class Phase2Search {
public:
  Phase2Search(const SolverTables &tables, SolveStats &stats);

  // 在 limit 步内找最短解，prev 为 Phase 1 最后一步 (MOVE_NONE 表示无)
  bool solve(const State &s, int prev, int limit, std::vector<int> &out);
  bool solve(int c_prm, int non_slice_prm, int slice_prm, int prev, int limit,
             std::vector<int> &out);

private:
  bool search(int c_prm, int non_slice_prm, int slice_prm, int remaining,
              int prev);

  const SolverTables &t_;
  SolveStats &stats_;
  std::vector<int> moves_;
};

#endif // PHASE2_SEARCH_H
