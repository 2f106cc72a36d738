/*
 * two_phase_solver.cpp - 两阶段求解器实现
 */

#include "two_phase_solver.h"
#include "phase1_search.h"
#include "phase2_search.h"

SolveResult TwoPhaseSolver::solve(const State &s,
                                  const SolveOptions &opt) const {
  std::string err;
  if (!verify_state(s, err))
    throw std::invalid_argument("invalid cube state: " + err);
  if (opt.max_length < 0)
    throw std::invalid_argument("max_length must be non-negative");

  SolveResult res;
  auto t0 = std::chrono::high_resolution_clock::now();
  if (s.is_solved()) {
    res.found = true;
    return res;
  }

  const SolverTables &t = *tables_;
  const bool use_corners = opt.use_corners_table && t.hasCorners();
  const int max_len = opt.max_length;
  const int target = opt.target_length < 0 ? max_len : opt.target_length;

  const int h1 = t.phase1_distance(s.c_ori(), s.e_ori(), s.slice_loc());
  int lower = h1;
  if (use_corners)
    lower = std::max(lower, t.corners_distance(s.c_prm(), s.c_ori()));

  Phase1Search p1(t, res.stats);
  Phase2Search p2(t, res.stats);

  // best_len: 已知最短解长度，未找到时为 max_len + 1
  int best_len = max_len + 1;
  p1.setBudget(use_corners ? best_len - 1 : -1);
  std::vector<int> tail;

  Phase1Search::Callback on_prefix = [&](const std::vector<int> &prefix) {
    const int d = (int)prefix.size();
    const int limit = best_len - 1 - d;
    if (limit < 0)
      return false;
    State mid = s.apply_alg(prefix);
    int prev = prefix.empty() ? MOVE_NONE : prefix.back();
    if (!p2.solve(mid, prev, limit, tail))
      return false;

    res.found = true;
    res.solution = prefix;
    res.solution.insert(res.solution.end(), tail.begin(), tail.end());
    best_len = (int)res.solution.size();
    if (use_corners)
      p1.setBudget(best_len - 1);
    return best_len <= target || best_len == lower;
  };

  for (int d = h1; d <= max_len && d < best_len; ++d) {
    if (p1.run(s, d, on_prefix))
      break;
    if (d >= MAX_PHASE1_DEPTH && res.stats.phase1Solutions == 0 &&
        res.stats.cornerCuts == 0)
      throw std::logic_error("phase 1 found no prefix within depth " +
                             std::to_string(d));
  }

  auto t1 = std::chrono::high_resolution_clock::now();
  res.stats.elapsedSeconds = std::chrono::duration<double>(t1 - t0).count();
  return res;
}

std::vector<SolveResult> solve_batch(std::shared_ptr<const SolverTables> tables,
                                     const std::vector<State> &states,
                                     const SolveOptions &opt, bool parallel) {
  const int total = (int)states.size();
  std::vector<SolveResult> results(total);

#pragma omp parallel if (parallel)
  {
    TwoPhaseSolver solver(tables); // 线程局部

#pragma omp for schedule(dynamic, 1)
    for (int i = 0; i < total; ++i) {
      try {
        results[i] = solver.solve(states[i], opt);
      } catch (const std::exception &e) {
        results[i].found = false;
        results[i].error = e.what();
      }
    }
  }
  return results;
}
