/*
 * phase1_search.cpp - Phase 1 搜索实现
 */

#include "phase1_search.h"

Phase1Search::Phase1Search(const SolverTables &tables, SolveStats &stats)
    : t_(tables), stats_(stats) {
  moves_.reserve(32);
}

bool Phase1Search::run(const State &s, int depth, const Callback &cb) {
  cb_ = &cb;
  moves_.clear();
  bool stopped = search(s.c_ori(), s.e_ori(), s.slice_loc(), s.c_prm(), depth,
                        MOVE_NONE);
  cb_ = nullptr;
  return stopped;
}

bool Phase1Search::search(int c_ori, int e_ori, int slice_loc, int c_prm,
                          int remaining, int prev) {
  stats_.phase1Probes++;

  // --- coset 表 (flip / twist 取最大值) ---
  const uint64_t fe = t_.dt_flip[e_ori * N_SLICE_LOC + slice_loc];
  const uint64_t te = t_.dt_twist[c_ori * N_SLICE_LOC + slice_loc];
  const int fd = dir_distance(fe);
  const int td = dir_distance(te);
  if (std::max(fd, td) > remaining) {
    stats_.phase1Cuts++;
    return false;
  }

  // --- corners 表 ---
  if (budget_ >= 0 && t_.pt_corners) {
    stats_.cornerProbes++;
    int cd = t_.corners_distance(c_prm, c_ori);
    if ((int)moves_.size() + cd > budget_) {
      stats_.cornerCuts++;
      return false;
    }
  }

  if (remaining == 0) {
    // NOTE: 以 Phase 2 移动结尾的前缀在浅一层已经出现过
    if (!moves_.empty() && is_phase2_move(moves_.back()))
      return false;
    stats_.phase1Solutions++;
    return (*cb_)(moves_);
  }

  uint32_t mask = valid_moves_mask[prev];
#if ENABLE_DIRECTIONS
  if (fd == remaining)
    mask &= dir_less(fe);
  else if (fd == remaining - 1)
    mask &= ~dir_more(fe);
  if (td == remaining)
    mask &= dir_less(te);
  else if (td == remaining - 1)
    mask &= ~dir_more(te);
  // NOTE: 方向集合去掉的移动即子节点会被 coset 表剪掉的分支，计入 phase1Cuts
  stats_.phase1Cuts += __builtin_popcount(valid_moves_mask[prev] & ~mask);
  if (mask == 0) {
    stats_.noTwistCuts++;
    return false;
  }
#endif

  const int *moves = valid_moves_flat[prev];
  const int count = valid_moves_count[prev];
  for (int k = 0; k < count; ++k) {
    int m = moves[k];
    if (!((mask >> m) & 1))
      continue;
    moves_.push_back(m);
    bool stop = search(t_.mt_c_ori[c_ori * N_MOVES + m],
                       t_.mt_e_ori[e_ori * N_MOVES + m],
                       t_.mt_slice_loc[slice_loc * N_MOVES + m],
                       t_.mt_c_prm[c_prm * N_MOVES + m], remaining - 1, m);
    moves_.pop_back();
    if (stop)
      return true;
  }
  return false;
}
