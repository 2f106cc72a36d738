/*
 * prune_tables.cpp - 剪枝表实现
 */

#include "prune_tables.h"

static const int IDENTITY_COLS[N_MOVES] = {0, 1,  2,  3,  4,  5,  6,  7,  8,
                                           9, 10, 11, 12, 13, 14, 15, 16, 17};

// --- BFS 空间 ---
PairSpace PruneTableManager::cornersSpace() const {
  return {mtm_.getCPrmTablePtr(), N_MOVES,       N_C_PRM,
          mtm_.getCOriTablePtr(), N_MOVES,       N_C_ORI,
          IDENTITY_COLS,          IDENTITY_COLS, IDENTITY_COLS,
          N_MOVES};
}

PairSpace PruneTableManager::flipSpace() const {
  return {mtm_.getEOriTablePtr(),     N_MOVES,       N_E_ORI,
          mtm_.getSliceLocTablePtr(), N_MOVES,       N_SLICE_LOC,
          IDENTITY_COLS,              IDENTITY_COLS, IDENTITY_COLS,
          N_MOVES};
}

PairSpace PruneTableManager::twistSpace() const {
  return {mtm_.getCOriTablePtr(),     N_MOVES,       N_C_ORI,
          mtm_.getSliceLocTablePtr(), N_MOVES,       N_SLICE_LOC,
          IDENTITY_COLS,              IDENTITY_COLS, IDENTITY_COLS,
          N_MOVES};
}

PairSpace PruneTableManager::subsetCornerSpace() const {
  return {mtm_.getCPrmTablePtr(),     N_MOVES,        N_C_PRM,
          mtm_.getSlicePrmTablePtr(), N_PHASE2_MOVES, N_SLICE_PRM,
          phase2_moves,               IDENTITY_COLS,  phase2_moves,
          N_PHASE2_MOVES};
}

PairSpace PruneTableManager::subsetEdgeSpace() const {
  return {mtm_.getNonSlicePrmTablePtr(), N_PHASE2_MOVES, N_NON_SLICE_PRM,
          mtm_.getSlicePrmTablePtr(),    N_PHASE2_MOVES, N_SLICE_PRM,
          IDENTITY_COLS,                 IDENTITY_COLS,  phase2_moves,
          N_PHASE2_MOVES};
}

long long PruneTableManager::flipStart() {
  return (long long)State().e_ori() * N_SLICE_LOC + State().slice_loc();
}

long long PruneTableManager::twistStart() {
  return (long long)State().c_ori() * N_SLICE_LOC + State().slice_loc();
}

// --- 初始化 ---
void PruneTableManager::initialize(bool with_corners) {
  if (log_enabled())
    std::cout << TAG_COLOR << "[PruneTable]" << ANSI_RESET
              << " Initializing prune tables..." << std::endl;

  generateFlipDirections();
  generateTwistDirections();
  generateSubsetCornerPrune();
  generateSubsetEdgePrune();
  if (with_corners)
    generateCornersPrune();

  if (log_enabled())
    std::cout << TAG_COLOR << "[PruneTable]" << ANSI_RESET
              << " All prune tables initialized." << std::endl;
}

void PruneTableManager::generateCornersPrune() {
  PairSpace space = cornersSpace();
  corners_prune = cache_.load_or_build<unsigned char>(
      "prune_table_corners", (N_CORNERS_IDX + 1) / 2,
      [&space]() {
        auto tmp = create_distance_table(space, cornersStart(), "Corners",
                                         nullptr);
        return pack_prune_4bit(tmp);
      },
      check_corners_distribution);
}

void PruneTableManager::generateFlipDirections() {
  PairSpace space = flipSpace();
  long long start = flipStart();
  flip_dirs = cache_.load_or_build<uint64_t>(
      "prune_table_coset_flip", N_FLIP_IDX,
      [&space, start]() {
        auto tmp = create_distance_table(space, start, "Coset Flip", nullptr);
        return create_direction_table(space, tmp);
      },
      [start](const std::vector<uint64_t> &dt, std::string &reason) {
        return check_direction_table(dt, start, reason);
      });
}

void PruneTableManager::generateTwistDirections() {
  PairSpace space = twistSpace();
  long long start = twistStart();
  twist_dirs = cache_.load_or_build<uint64_t>(
      "prune_table_coset_twist", N_TWIST_IDX,
      [&space, start]() {
        auto tmp = create_distance_table(space, start, "Coset Twist", nullptr);
        return create_direction_table(space, tmp);
      },
      [start](const std::vector<uint64_t> &dt, std::string &reason) {
        return check_direction_table(dt, start, reason);
      });
}

void PruneTableManager::generateSubsetCornerPrune() {
  PairSpace space = subsetCornerSpace();
  subset_corner_prune = cache_.load_or_build<unsigned char>(
      "prune_table_subset_corner", (N_SUBSET_IDX + 1) / 2,
      [&space]() {
        auto tmp = create_distance_table(space, subsetStart(), "Subset Corner",
                                         nullptr);
        return pack_prune_4bit(tmp);
      },
      [](const std::vector<unsigned char> &pt, std::string &reason) {
        return check_subset_table(pt, N_SUBSET_IDX, subsetStart(), reason);
      });
}

void PruneTableManager::generateSubsetEdgePrune() {
  PairSpace space = subsetEdgeSpace();
  subset_edge_prune = cache_.load_or_build<unsigned char>(
      "prune_table_subset_edge", (N_SUBSET_IDX + 1) / 2,
      [&space]() {
        auto tmp = create_distance_table(space, subsetStart(), "Subset Edge",
                                         nullptr);
        return pack_prune_4bit(tmp);
      },
      [](const std::vector<unsigned char> &pt, std::string &reason) {
        return check_subset_table(pt, N_SUBSET_IDX, subsetStart(), reason);
      });
}

// --- 生成函数 ---
std::vector<unsigned char> create_distance_table(const PairSpace &space,
                                                 long long start,
                                                 const std::string &label,
                                                 std::vector<long long> *layers) {
  const long long total = space.size();
  std::vector<unsigned char> tmp;
  tmp.assign(total, BFS_UNVISITED);
  tmp[start] = 0;
  if (layers)
    layers->clear();

  // NOTE: 同一层内多个线程可能写同一项，写入值相同 (d+1)
  for (int d = 0; d < BFS_UNVISITED - 1; ++d) {
    int nd = d + 1;
    long long cnt = 0;
#pragma omp parallel for reduction(+ : cnt) schedule(static)
    for (long long i = 0; i < total; ++i) {
      if (tmp[i] == d) {
        cnt++;
        for (int k = 0; k < space.n_moves; ++k) {
          long long ni = space.next(i, k);
          if (tmp[ni] == BFS_UNVISITED)
            tmp[ni] = nd;
        }
      }
    }
    if (cnt == 0)
      break;
    if (layers)
      layers->push_back(cnt);
    if (log_enabled())
      std::cout << "  [" << label << "] Depth " << d << ": " << cnt
                << std::endl;
  }
  return tmp;
}

static inline int saturate_4bit(unsigned char d) {
  if (d == BFS_UNVISITED)
    return PRUNE_UNREACHED;
  return d < PRUNE_SATURATED ? d : PRUNE_SATURATED;
}

std::vector<unsigned char>
pack_prune_4bit(const std::vector<unsigned char> &tmp) {
  const long long total = tmp.size();
  const long long bytes = (total + 1) / 2;
  std::vector<unsigned char> pt(bytes, 0xFF);
  // NOTE: 按字节并行，相邻两项共享一个字节
#pragma omp parallel for schedule(static)
  for (long long b = 0; b < bytes; ++b) {
    long long i = b * 2;
    int lo = saturate_4bit(tmp[i]);
    int hi = (i + 1 < total) ? saturate_4bit(tmp[i + 1]) : PRUNE_UNREACHED;
    pt[b] = (unsigned char)(lo | (hi << 4));
  }
  return pt;
}

std::vector<uint64_t>
create_direction_table(const PairSpace &space,
                       const std::vector<unsigned char> &tmp) {
  const long long total = space.size();
  std::vector<uint64_t> dt(total);
#pragma omp parallel for schedule(static)
  for (long long i = 0; i < total; ++i) {
    int d = tmp[i];
    if (d == BFS_UNVISITED) {
      dt[i] = make_direction(0xFF, 0, 0);
      continue;
    }
    uint32_t less = 0, more = 0;
    for (int k = 0; k < space.n_moves; ++k) {
      int nd = tmp[space.next(i, k)];
      if (nd == d - 1)
        less |= 1u << space.moves[k];
      else if (nd == d + 1)
        more |= 1u << space.moves[k];
    }
    dt[i] = make_direction(d, less, more);
  }
  return dt;
}

std::vector<long long> prune_distribution(const std::vector<unsigned char> &pt,
                                          long long total) {
  std::vector<long long> dist(16, 0);
#pragma omp parallel
  {
    long long local[16] = {0};
#pragma omp for schedule(static)
    for (long long i = 0; i < total; ++i)
      local[get_prune(pt, i)]++;
#pragma omp critical
    {
      for (int v = 0; v < 16; ++v)
        dist[v] += local[v];
    }
  }
  return dist;
}

// --- 校验 ---
const std::vector<long long> &expected_corners_distribution() {
  static const std::vector<long long> d = {
      1,       18,       243,      2874,     28000,    205416,
      1168516, 5402628,  20776176, 45391616, 15139616, 64736};
  return d;
}

bool check_corners_distribution(const std::vector<unsigned char> &pt,
                                std::string &reason) {
  if ((long long)pt.size() != (N_CORNERS_IDX + 1) / 2) {
    reason = "corners table has wrong size";
    return false;
  }
  std::vector<long long> dist = prune_distribution(pt, N_CORNERS_IDX);
  const auto &expected = expected_corners_distribution();
  for (int v = 0; v < 16; ++v) {
    long long want = v < (int)expected.size() ? expected[v] : 0;
    if (dist[v] != want) {
      reason = "corners distance " + std::to_string(v) + " has " +
               std::to_string(dist[v]) + " entries, expected " +
               std::to_string(want);
      return false;
    }
  }
  return true;
}

bool check_direction_table(const std::vector<uint64_t> &dt, long long start,
                           std::string &reason) {
  long long zeros = 0;
  for (size_t i = 0; i < dt.size(); ++i) {
    int d = dir_distance(dt[i]);
    if (d == 0xFF) {
      reason = "unreached entry " + std::to_string(i);
      return false;
    }
    if (d == 0)
      zeros++;
    if (d > 0 && dir_less(dt[i]) == 0) {
      reason = "entry " + std::to_string(i) + " has no decreasing move";
      return false;
    }
  }
  if (dir_distance(dt[start]) != 0 || zeros != 1) {
    reason = "target entry is not the unique distance 0";
    return false;
  }
  return true;
}

bool check_subset_table(const std::vector<unsigned char> &pt, long long total,
                        long long start, std::string &reason) {
  std::vector<long long> dist = prune_distribution(pt, total);
  if (dist[PRUNE_UNREACHED] != 0) {
    reason = std::to_string(dist[PRUNE_UNREACHED]) + " unreached entries";
    return false;
  }
  if (dist[0] != 1 || get_prune(pt, start) != 0) {
    reason = "target entry is not the unique distance 0";
    return false;
  }
  return true;
}
