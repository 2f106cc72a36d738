/*
 * solver_tables.cpp - 求解器共享表实现
 */

#include "solver_tables.h"

#include <map>
#include <mutex>

SolverTables::SolverTables(const std::string &dir, bool persist)
    : cache_(dir, persist), mtm_(cache_), ptm_(cache_, mtm_) {}

void SolverTables::build(bool with_corners) {
  init_matrix();
  // NOTE: 剪枝表依赖移动表，按顺序生成；每张表内部并行
  mtm_.initialize();
  ptm_.initialize(with_corners);

  mt_c_ori = mtm_.getCOriTablePtr();
  mt_c_prm = mtm_.getCPrmTablePtr();
  mt_e_ori = mtm_.getEOriTablePtr();
  mt_slice_loc = mtm_.getSliceLocTablePtr();
  mt_slice_prm = mtm_.getSlicePrmTablePtr();
  mt_non_slice_prm = mtm_.getNonSlicePrmTablePtr();
  pt_corners = with_corners ? ptm_.getCornersPrunePtr() : nullptr;
  dt_flip = ptm_.getFlipDirectionsPtr();
  dt_twist = ptm_.getTwistDirectionsPtr();
  pt_subset_corner = ptm_.getSubsetCornerPrunePtr();
  pt_subset_edge = ptm_.getSubsetEdgePrunePtr();
}

std::shared_ptr<const SolverTables>
SolverTables::load_or_build(const std::string &dir, bool persist,
                            bool with_corners) {
  static std::mutex mtx;
  static std::map<std::pair<std::string, bool>,
                  std::shared_ptr<const SolverTables>>
      loaded;

  std::lock_guard<std::mutex> lock(mtx);
  auto key = std::make_pair(dir, with_corners);
  auto it = loaded.find(key);
  if (it != loaded.end())
    return it->second;
  // 已有带 corners 表的实例时直接复用，其余表完全相同
  if (!with_corners) {
    it = loaded.find(std::make_pair(dir, true));
    if (it != loaded.end())
      return it->second;
  }

  std::shared_ptr<SolverTables> tables(new SolverTables(dir, persist));
  tables->build(with_corners);
  loaded[key] = tables;
  return tables;
}
