/*
 * verify_move_tables.cpp - 移动表与魔方模型一致性验证
 *
 * 沿随机移动序列同时追踪移动表坐标和 State，每一步比较。
 */

#include "cube_common.h"
#include "move_tables.h"
#include "table_cache.h"
#include "verify_common.h"

int main(int argc, char **argv) {
  std::cout << "=== Move Table Verification ===" << std::endl;
  init_matrix();
  g_quietLog = true;

  TableCache cache(verify_table_dir(argc, argv));
  MoveTableManager mtm(cache);
  mtm.initialize();

  const CoordKind fullKinds[] = {CoordKind::CornerOri, CoordKind::CornerPrm,
                                 CoordKind::EdgeOri, CoordKind::SliceLoc};
  const CoordKind p2Kinds[] = {CoordKind::CornerPrm, CoordKind::SlicePrm,
                               CoordKind::NonSlicePrm};

  verify_section("Table shapes");
  for (CoordKind kind : fullKinds)
    VERIFY(mtm.getTable(kind).size() == (size_t)coordinate_size(kind) * 18,
           coordinate_name(kind) << " has 18 columns");
  VERIFY(mtm.getTable(CoordKind::SlicePrm).size() == 24 * 10,
         "slice_prm has 10 columns");
  VERIFY(mtm.getTable(CoordKind::NonSlicePrm).size() == 40320 * 10,
         "non_slice_prm has 10 columns");

  verify_section("18-move sequences");
  std::mt19937 rng(2024);
  int mismatches = 0;
  for (int t = 0; t < 300; ++t) {
    std::vector<int> alg = random_alg(rng, 40);
    State s;
    int coord[4] = {0, 0, 0, s.slice_loc()};
    for (int m : alg) {
      s = s.apply_move(m);
      for (int k = 0; k < 4; ++k) {
        coord[k] = mtm.getTablePtr(fullKinds[k])[coord[k] * 18 + m];
        if (coord[k] != coordinate(s, fullKinds[k]))
          mismatches++;
      }
    }
  }
  VERIFY(mismatches == 0, mismatches << " coordinate mismatches");

  verify_section("Phase 2 sequences");
  mismatches = 0;
  std::uniform_int_distribution<int> pick(0, N_PHASE2_MOVES - 1);
  for (int t = 0; t < 300; ++t) {
    State s;
    int coord[3] = {0, 0, 0};
    for (int i = 0; i < 40; ++i) {
      int j = pick(rng);
      int m = phase2_moves[j];
      s = s.apply_move(m);
      coord[0] = mtm.getCPrmTablePtr()[coord[0] * 18 + m];
      coord[1] = mtm.getSlicePrmTablePtr()[coord[1] * 10 + j];
      coord[2] = mtm.getNonSlicePrmTablePtr()[coord[2] * 10 + j];
      for (int k = 0; k < 3; ++k)
        if (coord[k] != coordinate(s, p2Kinds[k]))
          mismatches++;
    }
  }
  VERIFY(mismatches == 0, mismatches << " phase 2 coordinate mismatches");

  verify_section("Inverse moves");
  mismatches = 0;
  for (CoordKind kind : fullKinds) {
    const int *mt = mtm.getTablePtr(kind);
    for (int c = 0; c < coordinate_size(kind); ++c)
      for (int m = 0; m < 18; ++m)
        if (mt[mt[c * 18 + m] * 18 + inverse_move(m)] != c)
          mismatches++;
  }
  VERIFY(mismatches == 0, mismatches << " entries not undone by the inverse");

  verify_section("Determinism");
  const CoordKind smallKinds[] = {CoordKind::CornerOri, CoordKind::EdgeOri,
                                  CoordKind::SliceLoc, CoordKind::SlicePrm};
  for (CoordKind kind : smallKinds) {
    std::vector<int> a = create_move_table(kind);
    std::vector<int> b = create_move_table(kind);
    VERIFY(a == b, coordinate_name(kind) << " identical across builds");
    VERIFY(a == mtm.getTable(kind),
           coordinate_name(kind) << " identical to cached table");
  }

  verify_section("Range check");
  std::string reason;
  std::vector<int> bad = mtm.getTable(CoordKind::SliceLoc);
  VERIFY(check_move_table(CoordKind::SliceLoc, bad, reason), "valid table");
  bad[7] = N_SLICE_LOC;
  VERIFY(!check_move_table(CoordKind::SliceLoc, bad, reason),
         "out of range entry rejected");

  return verify_report("verify_move_tables");
}
