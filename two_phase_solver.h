/*
 * two_phase_solver.h - 两阶段求解器
 */

#ifndef TWO_PHASE_SOLVER_H
#define TWO_PHASE_SOLVER_H

#include "cube_common.h"
#include "solve_stats.h"
#include "solver_tables.h"
#include <memory>

struct SolveOptions {
  int max_length = 20;     // 解长度上限
  int target_length = -1;  // 找到不超过此长度的解即停止; < 0 取 max_length, 0 求最优
  bool use_corners_table = true;
};

struct SolveResult {
  bool found = false;
  std::vector<int> solution;
  SolveStats stats;
  std::string error; // 仅 solve_batch 填写

  int length() const { return found ? (int)solution.size() : -1; }
};

class TwoPhaseSolver {
public:
  explicit TwoPhaseSolver(std::shared_ptr<const SolverTables> tables)
      : tables_(std::move(tables)) {}

  // 非法状态抛出 std::invalid_argument
  // Phase 1 超过子群直径仍无前缀时抛出 std::logic_error
  SolveResult solve(const State &s, const SolveOptions &opt = {}) const;

  const SolverTables &tables() const { return *tables_; }

private:
  std::shared_ptr<const SolverTables> tables_;
};

// 批量求解，结果顺序与输入一致
// NOTE: parallel 时每个 OpenMP 线程持有一个求解器，异常写入 SolveResult::error
std::vector<SolveResult> solve_batch(std::shared_ptr<const SolverTables> tables,
                                     const std::vector<State> &states,
                                     const SolveOptions &opt, bool parallel);

#endif // TWO_PHASE_SOLVER_H
