/*
 * solver_tables.h - 求解器共享表（移动表 + 剪枝表）
 */

#ifndef SOLVER_TABLES_H
#define SOLVER_TABLES_H

#include "cube_common.h"
#include "move_tables.h"
#include "prune_tables.h"
#include "table_cache.h"
#include <memory>

// 一次加载、只读共享给所有求解线程
class SolverTables {
public:
  SolverTables(const SolverTables &) = delete;
  SolverTables &operator=(const SolverTables &) = delete;

  // 加载或生成全部表；同一进程内相同参数只生成一次
  // with_corners 为 false 时可能返回已带 corners 表的实例
  // NOTE: 返回时全部表已就绪
  static std::shared_ptr<const SolverTables>
  load_or_build(const std::string &dir, bool persist = true,
                bool with_corners = ENABLE_CORNERS_TABLE);

  const MoveTableManager &moves() const { return mtm_; }
  const PruneTableManager &prunes() const { return ptm_; }
  const TableCache &cache() const { return cache_; }
  bool hasCorners() const { return ptm_.hasCornersTable(); }

  // --- 热路径指针 ---
  const int *mt_c_ori = nullptr;
  const int *mt_c_prm = nullptr;
  const int *mt_e_ori = nullptr;
  const int *mt_slice_loc = nullptr;
  const int *mt_slice_prm = nullptr;
  const int *mt_non_slice_prm = nullptr;
  const unsigned char *pt_corners = nullptr;
  const uint64_t *dt_flip = nullptr;
  const uint64_t *dt_twist = nullptr;
  const unsigned char *pt_subset_corner = nullptr;
  const unsigned char *pt_subset_edge = nullptr;

  // --- 下界 ---
  int corners_distance(int c_prm, int c_ori) const {
    return get_prune_ptr(pt_corners, (long long)c_prm * N_C_ORI + c_ori);
  }
  int phase1_distance(int c_ori, int e_ori, int slice_loc) const {
    int f = dir_distance(dt_flip[e_ori * N_SLICE_LOC + slice_loc]);
    int t = dir_distance(dt_twist[c_ori * N_SLICE_LOC + slice_loc]);
    return std::max(f, t);
  }
  int phase2_distance(int c_prm, int non_slice_prm, int slice_prm) const {
    int c = get_prune_ptr(pt_subset_corner, c_prm * N_SLICE_PRM + slice_prm);
    int e = get_prune_ptr(pt_subset_edge,
                          non_slice_prm * N_SLICE_PRM + slice_prm);
    return std::max(c, e);
  }

private:
  SolverTables(const std::string &dir, bool persist);
  void build(bool with_corners);

  TableCache cache_;
  MoveTableManager mtm_;
  PruneTableManager ptm_;
};

#endif // SOLVER_TABLES_H
