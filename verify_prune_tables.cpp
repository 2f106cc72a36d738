/*
 * verify_prune_tables.cpp - 剪枝表正确性验证
 *
 * coset / subset 表与基于 State 的独立队列 BFS 逐项比较，
 * corners 表检查已知距离分布。
 */

#include "cube_common.h"
#include "prune_tables.h"
#include "solver_tables.h"
#include "verify_common.h"
#include <functional>
#include <queue>

// 由两个坐标拼出一个代表状态
static State compose(CoordKind ka, int a, CoordKind kb, int b) {
  State s = state_from_coordinate(ka, a);
  State o = state_from_coordinate(kb, b);
  switch (kb) {
  case CoordKind::CornerOri:
    s.co = o.co;
    break;
  case CoordKind::CornerPrm:
    s.cp = o.cp;
    break;
  case CoordKind::EdgeOri:
    s.eo = o.eo;
    break;
  case CoordKind::SliceLoc:
    s.ep = o.ep;
    break;
  case CoordKind::SlicePrm:
    for (int i = 0; i < 4; ++i)
      s.ep[i] = o.ep[i];
    break;
  case CoordKind::NonSlicePrm:
    for (int i = 4; i < 12; ++i)
      s.ep[i] = o.ep[i];
    break;
  }
  return s;
}

// 基于 State 的队列 BFS，与表生成代码无关
static std::vector<int> state_bfs(CoordKind ka, CoordKind kb,
                                  const std::vector<int> &moves) {
  const int sa = coordinate_size(ka), sb = coordinate_size(kb);
  std::vector<int> dist((size_t)sa * sb, -1);
  State solved;
  long long start = (long long)coordinate(solved, ka) * sb + coordinate(solved, kb);
  std::queue<long long> q;
  dist[start] = 0;
  q.push(start);
  while (!q.empty()) {
    long long i = q.front();
    q.pop();
    State s = compose(ka, (int)(i / sb), kb, (int)(i % sb));
    for (int m : moves) {
      State n = s.apply_move(m);
      long long ni = (long long)coordinate(n, ka) * sb + coordinate(n, kb);
      if (dist[ni] < 0) {
        dist[ni] = dist[i] + 1;
        q.push(ni);
      }
    }
  }
  return dist;
}

static void verify_directions(const std::string &name,
                              const std::vector<uint64_t> &dt, CoordKind ka,
                              CoordKind kb) {
  verify_section(name);
  std::vector<int> all(N_MOVES);
  for (int m = 0; m < N_MOVES; ++m)
    all[m] = m;
  std::vector<int> bfs = state_bfs(ka, kb, all);
  VERIFY(dt.size() == bfs.size(), name << " size");

  long long distMismatch = 0, maskMismatch = 0, unreached = 0;
  const int sb = coordinate_size(kb);
  for (size_t i = 0; i < bfs.size(); ++i) {
    if (bfs[i] < 0) {
      unreached++;
      continue;
    }
    if (dir_distance(dt[i]) != bfs[i])
      distMismatch++;
    if (i % 101 != 0)
      continue;
    State s = compose(ka, (int)(i / sb), kb, (int)(i % sb));
    uint32_t less = 0, more = 0;
    for (int m = 0; m < N_MOVES; ++m) {
      State n = s.apply_move(m);
      int nd = bfs[(size_t)coordinate(n, ka) * sb + coordinate(n, kb)];
      if (nd == bfs[i] - 1)
        less |= 1u << m;
      else if (nd == bfs[i] + 1)
        more |= 1u << m;
    }
    if (less != dir_less(dt[i]) || more != dir_more(dt[i]))
      maskMismatch++;
  }
  VERIFY(unreached == 0, name << ": " << unreached << " unreachable entries");
  VERIFY(distMismatch == 0, name << ": " << distMismatch << " distance mismatches");
  VERIFY(maskMismatch == 0, name << ": " << maskMismatch << " mask mismatches");
}

static void verify_subset(const std::string &name,
                          const std::vector<unsigned char> &pt, CoordKind ka,
                          CoordKind kb) {
  verify_section(name);
  std::vector<int> p2(phase2_moves, phase2_moves + N_PHASE2_MOVES);
  std::vector<int> bfs = state_bfs(ka, kb, p2);
  long long mismatch = 0, unreached = 0;
  int maxDepth = 0;
  for (size_t i = 0; i < bfs.size(); ++i) {
    if (bfs[i] < 0) {
      unreached++;
      continue;
    }
    maxDepth = std::max(maxDepth, bfs[i]);
    if (get_prune(pt, i) != std::min(bfs[i], PRUNE_SATURATED))
      mismatch++;
  }
  std::cout << "  max depth " << maxDepth << std::endl;
  VERIFY(unreached == 0, name << ": " << unreached << " unreachable entries");
  VERIFY(mismatch == 0, name << ": " << mismatch << " mismatches");
}

int main(int argc, char **argv) {
  std::cout << "=== Prune Table Verification ===" << std::endl;
  init_matrix();
  g_quietLog = true;

  auto tables = SolverTables::load_or_build(verify_table_dir(argc, argv));
  const auto &ptm = tables->prunes();

  verify_directions("Coset table (flip part)", ptm.getFlipDirections(),
                    CoordKind::EdgeOri, CoordKind::SliceLoc);
  verify_directions("Coset table (twist part)", ptm.getTwistDirections(),
                    CoordKind::CornerOri, CoordKind::SliceLoc);
  verify_subset("Subset table (corner part)", ptm.getSubsetCornerPrune(),
                CoordKind::CornerPrm, CoordKind::SlicePrm);
  verify_subset("Subset table (edge part)", ptm.getSubsetEdgePrune(),
                CoordKind::NonSlicePrm, CoordKind::SlicePrm);

  verify_section("Corners table");
  VERIFY(tables->hasCorners(), "corners table loaded");
  std::string reason;
  VERIFY(check_corners_distribution(ptm.getCornersPrune(), reason),
         "known distribution: " << reason);
  std::vector<long long> dist =
      prune_distribution(ptm.getCornersPrune(), N_CORNERS_IDX);
  for (size_t d = 0; d < expected_corners_distribution().size(); ++d)
    std::cout << "  Depth " << d << ": " << dist[d] << std::endl;
  VERIFY(tables->corners_distance(0, 0) == 0, "solved corners at distance 0");
  for (int m = 0; m < N_MOVES; ++m) {
    State s = State().apply_move(m);
    VERIFY(tables->corners_distance(s.c_prm(), s.c_ori()) == 1,
           move_names[m] << " corners at distance 1");
  }

  verify_section("Admissibility along scrambles");
  std::mt19937 rng(31337);
  std::uniform_int_distribution<int> lenDist(1, 10);
  std::uniform_int_distribution<int> pick(0, N_PHASE2_MOVES - 1);
  for (int t = 0; t < 500; ++t) {
    int len = lenDist(rng);
    State s = State().apply_alg(random_alg(rng, len));
    VERIFY(tables->phase1_distance(s.c_ori(), s.e_ori(), s.slice_loc()) <= len,
           "phase 1 bound <= scramble length");
    VERIFY(tables->corners_distance(s.c_prm(), s.c_ori()) <= len,
           "corners bound <= scramble length");

    State h;
    for (int i = 0; i < len; ++i)
      h = h.apply_move(phase2_moves[pick(rng)]);
    VERIFY(tables->phase1_distance(h.c_ori(), h.e_ori(), h.slice_loc()) == 0,
           "subgroup state has phase 1 bound 0");
    VERIFY(tables->phase2_distance(h.c_prm(), h.non_slice_prm(),
                                   h.slice_prm()) <= len,
           "phase 2 bound <= scramble length");
  }

  verify_section("Determinism");
  auto tmp = create_distance_table(ptm.subsetCornerSpace(),
                                   PruneTableManager::subsetStart(), "Subset",
                                   nullptr);
  VERIFY(pack_prune_4bit(tmp) == ptm.getSubsetCornerPrune(),
         "subset corner part identical across builds");
  auto ftmp = create_distance_table(ptm.flipSpace(),
                                    PruneTableManager::flipStart(), "Flip",
                                    nullptr);
  VERIFY(create_direction_table(ptm.flipSpace(), ftmp) ==
             ptm.getFlipDirections(),
         "coset flip part identical across builds");

  verify_section("Corrupt tables rejected");
  std::vector<unsigned char> broken = ptm.getSubsetEdgePrune();
  set_prune(broken, 12345, PRUNE_UNREACHED);
  VERIFY(!check_subset_table(broken, N_SUBSET_IDX, 0, reason),
         "unreached subset entry rejected");
  std::vector<uint64_t> brokenDirs = ptm.getTwistDirections();
  brokenDirs[777] = make_direction(0, 0, 0);
  VERIFY(!check_direction_table(brokenDirs, PruneTableManager::twistStart(),
                                reason),
         "second distance 0 rejected");

  return verify_report("verify_prune_tables");
}
