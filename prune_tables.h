/*
 * prune_tables.h - 剪枝表相关功能
 *
 * corners 表: c_prm * 2187 + c_ori, 4-bit, 18 种移动（角块子魔方精确距离）
 * coset 表:   max(flip, twist) 两张方向表, 64-bit 项, 18 种移动
 *             flip  = e_ori * 495 + slice_loc
 *             twist = c_ori * 495 + slice_loc
 * subset 表:  max(corner, edge) 两张 4-bit 表, 10 种 Phase 2 移动
 *             corner = c_prm * 24 + slice_prm
 *             edge   = non_slice_prm * 24 + slice_prm
 */

#ifndef PRUNE_TABLES_H
#define PRUNE_TABLES_H

#include "cube_common.h"
#include "move_tables.h"
#include "table_cache.h"

constexpr long long N_CORNERS_IDX = (long long)N_C_PRM * N_C_ORI;  // 88,179,840
constexpr long long N_FLIP_IDX = (long long)N_E_ORI * N_SLICE_LOC;  // 1,013,760
constexpr long long N_TWIST_IDX = (long long)N_C_ORI * N_SLICE_LOC; // 1,082,565
constexpr long long N_SUBSET_IDX = (long long)N_C_PRM * N_SLICE_PRM; // 967,680

constexpr unsigned char BFS_UNVISITED = 255;
constexpr int PRUNE_UNREACHED = 0xF;
// 4-bit 表能存的最大距离，更远的项按此值存储（仍为下界）
constexpr int PRUNE_SATURATED = 0xE;

// --- 4-bit 剪枝表操作 ---
// NOTE: 偶数下标在低 4 位，0xF 表示未到达
inline void set_prune(std::vector<unsigned char> &table, long long index,
                      int value) {
  int shift = (index & 1) << 2;
  table[index >> 1] &= ~(0xF << shift);
  table[index >> 1] |= (value & 0xF) << shift;
}

inline int get_prune(const std::vector<unsigned char> &table, long long index) {
  return (table[index >> 1] >> ((index & 1) << 2)) & 0xF;
}

inline int get_prune_ptr(const unsigned char *table, long long index) {
  return (table[index >> 1] >> ((index & 1) << 2)) & 0xF;
}

// --- 方向表项 ---
// bits 0..7: 距离; bits 8..25: 通向 d+1 的移动; bits 32..49: 通向 d-1 的移动
inline uint64_t make_direction(int dist, uint32_t less, uint32_t more) {
  return ((uint64_t)less << 32) | ((uint64_t)more << 8) | (uint64_t)dist;
}
inline int dir_distance(uint64_t e) { return (int)(e & 0xFF); }
inline uint32_t dir_more(uint64_t e) { return (uint32_t)(e >> 8) & 0x3FFFF; }
inline uint32_t dir_less(uint64_t e) { return (uint32_t)(e >> 32); }

// 两坐标联合 BFS 的描述: idx = a * size_b + b
// cols_a[k] / cols_b[k] 是第 k 种移动在两张移动表中的列号
struct PairSpace {
  const int *mt_a;
  int width_a;
  int size_a;
  const int *mt_b;
  int width_b;
  int size_b;
  const int *cols_a;
  const int *cols_b;
  const int *moves; // 第 k 种移动的 18 编号（用于方向掩码）
  int n_moves;

  long long size() const { return (long long)size_a * size_b; }
  long long next(long long idx, int k) const {
    long long a = idx / size_b, b = idx % size_b;
    return (long long)mt_a[a * width_a + cols_a[k]] * size_b +
           mt_b[b * width_b + cols_b[k]];
  }
};

// 分层 BFS，返回每个下标的距离（255 = 未到达）
std::vector<unsigned char> create_distance_table(const PairSpace &space,
                                                 long long start,
                                                 const std::string &label,
                                                 std::vector<long long> *layers);

// 字节距离压缩为 4-bit，距离 >= 14 存为 14
std::vector<unsigned char> pack_prune_4bit(const std::vector<unsigned char> &tmp);

// 由字节距离生成方向表
std::vector<uint64_t> create_direction_table(const PairSpace &space,
                                             const std::vector<unsigned char> &tmp);

// 各距离的项数（4-bit 表）
std::vector<long long> prune_distribution(const std::vector<unsigned char> &pt,
                                          long long total);

// 2x2x2 角块子魔方的已知距离分布（半转度量）
const std::vector<long long> &expected_corners_distribution();
bool check_corners_distribution(const std::vector<unsigned char> &pt,
                                std::string &reason);
bool check_direction_table(const std::vector<uint64_t> &dt, long long start,
                           std::string &reason);
bool check_subset_table(const std::vector<unsigned char> &pt, long long total,
                        long long start, std::string &reason);

// --- 剪枝表管理器 ---
class PruneTableManager {
public:
  PruneTableManager(const TableCache &cache, const MoveTableManager &mtm)
      : cache_(cache), mtm_(mtm) {}

  // 加载或生成剪枝表，with_corners 为 false 时跳过 corners 表
  void initialize(bool with_corners);

  bool hasCornersTable() const { return !corners_prune.empty(); }

  const std::vector<unsigned char> &getCornersPrune() const {
    return corners_prune;
  }
  const std::vector<uint64_t> &getFlipDirections() const { return flip_dirs; }
  const std::vector<uint64_t> &getTwistDirections() const { return twist_dirs; }
  const std::vector<unsigned char> &getSubsetCornerPrune() const {
    return subset_corner_prune;
  }
  const std::vector<unsigned char> &getSubsetEdgePrune() const {
    return subset_edge_prune;
  }

  const unsigned char *getCornersPrunePtr() const {
    return corners_prune.data();
  }
  const uint64_t *getFlipDirectionsPtr() const { return flip_dirs.data(); }
  const uint64_t *getTwistDirectionsPtr() const { return twist_dirs.data(); }
  const unsigned char *getSubsetCornerPrunePtr() const {
    return subset_corner_prune.data();
  }
  const unsigned char *getSubsetEdgePrunePtr() const {
    return subset_edge_prune.data();
  }

  // 各表 BFS 空间（生成与验证共用）
  PairSpace cornersSpace() const;
  PairSpace flipSpace() const;
  PairSpace twistSpace() const;
  PairSpace subsetCornerSpace() const;
  PairSpace subsetEdgeSpace() const;

  static long long cornersStart() { return 0; }
  static long long flipStart();
  static long long twistStart();
  static long long subsetStart() { return 0; }

private:
  void generateCornersPrune();
  void generateFlipDirections();
  void generateTwistDirections();
  void generateSubsetCornerPrune();
  void generateSubsetEdgePrune();

  const TableCache &cache_;
  const MoveTableManager &mtm_;

  std::vector<unsigned char> corners_prune;       // corners 表
  std::vector<uint64_t> flip_dirs;                // coset 表 (flip 部分)
  std::vector<uint64_t> twist_dirs;               // coset 表 (twist 部分)
  std::vector<unsigned char> subset_corner_prune; // subset 表 (角块部分)
  std::vector<unsigned char> subset_edge_prune;   // subset 表 (棱块部分)
};

#endif // PRUNE_TABLES_H
