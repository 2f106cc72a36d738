/*
 * phase2_search.cpp - Phase 2 搜索实现
 */

#include "phase2_search.h"

Phase2Search::Phase2Search(const SolverTables &tables, SolveStats &stats)
    : t_(tables), stats_(stats) {
  moves_.reserve(32);
}

bool Phase2Search::solve(const State &s, int prev, int limit,
                         std::vector<int> &out) {
  return solve(s.c_prm(), s.non_slice_prm(), s.slice_prm(), prev, limit, out);
}

bool Phase2Search::solve(int c_prm, int non_slice_prm, int slice_prm, int prev,
                         int limit, std::vector<int> &out) {
  int h = t_.phase2_distance(c_prm, non_slice_prm, slice_prm);
  if (h > limit) {
    stats_.phase2Probes++;
    stats_.phase2Cuts++;
    return false;
  }
  for (int d = h; d <= limit; ++d) {
    moves_.clear();
    if (search(c_prm, non_slice_prm, slice_prm, d, prev)) {
      out = moves_;
      return true;
    }
  }
  return false;
}

bool Phase2Search::search(int c_prm, int non_slice_prm, int slice_prm,
                          int remaining, int prev) {
  stats_.phase2Probes++;
  int h = t_.phase2_distance(c_prm, non_slice_prm, slice_prm);
  if (h > remaining) {
    stats_.phase2Cuts++;
    return false;
  }
  // h == 0 只在还原态成立
  if (remaining == 0)
    return true;

  const int *moves = phase2_moves_flat[prev];
  const int count = phase2_moves_count[prev];
  for (int k = 0; k < count; ++k) {
    int m = moves[k];
    int j = phase2_move_index[m];
    moves_.push_back(m);
    if (search(t_.mt_c_prm[c_prm * N_MOVES + m],
               t_.mt_non_slice_prm[non_slice_prm * N_PHASE2_MOVES + j],
               t_.mt_slice_prm[slice_prm * N_PHASE2_MOVES + j], remaining - 1,
               m))
      return true;
    moves_.pop_back();
  }
  return false;
}
