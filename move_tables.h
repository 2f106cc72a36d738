/*
 * move_tables.h - 移动表管理
 */

#ifndef MOVE_TABLES_H
#define MOVE_TABLES_H

#include "cube_common.h"
#include "table_cache.h"

// 每种坐标的移动表列数
// NOTE: slice_prm / non_slice_prm 仅在 Phase 2 子群内有定义，只生成 10 列
inline int move_table_width(CoordKind kind) {
  return (kind == CoordKind::SlicePrm || kind == CoordKind::NonSlicePrm)
             ? N_PHASE2_MOVES
             : N_MOVES;
}

// 生成单个坐标的移动表: mt[coord * width + k]
// width == 18 时 k 为移动编号; width == 10 时 k 为 phase2_moves 下标
std::vector<int> create_move_table(CoordKind kind);

// 检查移动表每一项都在坐标范围内
bool check_move_table(CoordKind kind, const std::vector<int> &mt,
                      std::string &reason);

// --- 移动表管理器 ---
class MoveTableManager {
public:
  static constexpr int N_KINDS = 6;

  explicit MoveTableManager(const TableCache &cache) : cache_(cache) {}

  // 加载或生成全部 6 张移动表
  void initialize();

  const std::vector<int> &getTable(CoordKind kind) const {
    return tables_[static_cast<int>(kind)];
  }
  const int *getTablePtr(CoordKind kind) const {
    return tables_[static_cast<int>(kind)].data();
  }

  const int *getCOriTablePtr() const { return getTablePtr(CoordKind::CornerOri); }
  const int *getCPrmTablePtr() const { return getTablePtr(CoordKind::CornerPrm); }
  const int *getEOriTablePtr() const { return getTablePtr(CoordKind::EdgeOri); }
  const int *getSliceLocTablePtr() const {
    return getTablePtr(CoordKind::SliceLoc);
  }
  const int *getSlicePrmTablePtr() const {
    return getTablePtr(CoordKind::SlicePrm);
  }
  const int *getNonSlicePrmTablePtr() const {
    return getTablePtr(CoordKind::NonSlicePrm);
  }

  static std::string fileKind(CoordKind kind) {
    return std::string("move_table_") + coordinate_name(kind);
  }

private:
  const TableCache &cache_;
  std::vector<int> tables_[N_KINDS];
};

#endif // MOVE_TABLES_H
