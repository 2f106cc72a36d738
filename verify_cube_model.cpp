/*
 * verify_cube_model.cpp - 魔方模型、坐标与打乱解析验证
 *
 * 不需要任何表文件。
 */

#include "cube_common.h"
#include "verify_common.h"

static void verify_move_matrix() {
  verify_section("Move matrix");
  init_matrix();
  VERIFY(valid_moves_count[MOVE_NONE] == 18, "all 18 moves after MOVE_NONE");
  VERIFY(valid_moves_count[0] == 15, "U bans U face");
  VERIFY(valid_moves_count[3] == 12, "D bans D and U faces");
  VERIFY(valid_moves_count[6] == 15, "L bans L face");
  VERIFY(valid_moves_count[9] == 12, "R bans R and L faces");
  VERIFY(phase2_moves_count[MOVE_NONE] == 10, "10 phase 2 moves at root");
  VERIFY(phase2_moves_count[9] == 8, "R bans R2 and L2 in phase 2");
  for (int prev = 0; prev <= 18; ++prev) {
    for (int k = 0; k < valid_moves_count[prev]; ++k) {
      int m = valid_moves_flat[prev][k];
      VERIFY((valid_moves_mask[prev] >> m) & 1, "mask matches flat list");
    }
  }
  for (int k = 0; k < N_PHASE2_MOVES; ++k) {
    VERIFY(is_phase2_move(phase2_moves[k]), "phase2 move flagged");
    VERIFY(phase2_move_index[phase2_moves[k]] == k, "phase2 index inverse");
  }
  VERIFY(is_phase2_move(0), "U is a phase 2 move");
  VERIFY(!is_phase2_move(9), "R is not a phase 2 move");
}

static void verify_moves() {
  verify_section("Moves");
  std::mt19937 rng(12345);
  for (int m = 0; m < N_MOVES; ++m) {
    std::string err;
    VERIFY(verify_state(move_state(m), err),
           move_names[m] << " is a legal state: " << err);
    State s = State().apply_move(m);
    VERIFY(!s.is_solved(), move_names[m] << " changes the cube");
    VERIFY(s.apply_move(inverse_move(m)).is_solved(),
           move_names[m] << " undone by its inverse");
    State q = State();
    int quarter = m / 3 * 3;
    int turns = m % 3 + 1;
    for (int i = 0; i < turns; ++i)
      q = q.apply_move(quarter);
    VERIFY(q == s, move_names[m] << " equals repeated quarter turns");
    State four = State();
    for (int i = 0; i < 4; ++i)
      four = four.apply_move(m);
    VERIFY(four.is_solved(), move_names[m] << " has order dividing 4");
  }
  for (int t = 0; t < 200; ++t) {
    State s = random_state(rng);
    for (int m = 0; m < N_MOVES; ++m)
      VERIFY(s.apply_move(m).apply_move(inverse_move(m)) == s,
             "random state: " << move_names[m] << " invertible");
  }
  // 对面移动可交换
  State ud = State().apply_move(0).apply_move(3);
  State du = State().apply_move(3).apply_move(0);
  VERIFY(ud == du, "U D == D U");
  // (R U R' U') x 6 = identity
  std::vector<int> sexy;
  std::string err;
  VERIFY(parse_alg("R U R' U'", sexy, err), "parse sexy move");
  State s6 = State();
  for (int i = 0; i < 6; ++i)
    s6 = s6.apply_alg(sexy);
  VERIFY(s6.is_solved(), "(R U R' U')6 is identity");
}

static void verify_math() {
  verify_section("Math");
  VERIFY(factorial(0) == 1 && factorial(8) == 40320 &&
             factorial(12) == 479001600,
         "factorial");
  VERIFY(binomial(12, 4) == 495 && binomial(8, 0) == 1 &&
             binomial(4, 5) == 0 && binomial(12, 6) == 924,
         "binomial");

  int perm[8];
  for (int idx = 0; idx < 40320; idx += 37) {
    nth_permutation(idx, 8, perm);
    VERIFY(permutation_index(perm, 8) == idx, "permutation round trip " << idx);
  }
  int id8[8] = {0, 1, 2, 3, 4, 5, 6, 7};
  VERIFY(permutation_index(id8, 8) == 0, "identity ranks 0");
  int rev4[4] = {3, 2, 1, 0};
  VERIFY(permutation_index(rev4, 4) == 23, "reverse ranks last");

  int comb[4];
  for (int idx = 0; idx < 495; ++idx) {
    nth_combination(12, 4, idx, comb);
    bool ascending = comb[0] < comb[1] && comb[1] < comb[2] && comb[2] < comb[3];
    VERIFY(ascending, "combination ascending " << idx);
    VERIFY(combination_index(12, comb, 4) == idx,
           "combination round trip " << idx);
  }
  int first[4] = {0, 1, 2, 3};
  int last[4] = {8, 9, 10, 11};
  VERIFY(combination_index(12, first, 4) == 0, "first combination");
  VERIFY(combination_index(12, last, 4) == 494, "last combination");

  int swap2[3] = {1, 0, 2};
  int cyc3[3] = {1, 2, 0};
  VERIFY(!is_even_permutation(swap2, 3), "transposition is odd");
  VERIFY(is_even_permutation(cyc3, 3), "3-cycle is even");
}

static void verify_coordinates() {
  verify_section("Coordinates");
  State solved;
  VERIFY(solved.c_ori() == 0 && solved.c_prm() == 0 && solved.e_ori() == 0 &&
             solved.slice_loc() == 0 && solved.slice_prm() == 0 &&
             solved.non_slice_prm() == 0,
         "solved state has all coordinates 0");
  VERIFY(solved.in_subgroup(), "solved state is in the subgroup");

  const CoordKind kinds[] = {CoordKind::CornerOri, CoordKind::CornerPrm,
                             CoordKind::EdgeOri,   CoordKind::SliceLoc,
                             CoordKind::SlicePrm,  CoordKind::NonSlicePrm};
  for (CoordKind kind : kinds) {
    int size = coordinate_size(kind);
    int step = size > 5000 ? 97 : 1;
    int bad = 0;
    for (int v = 0; v < size; v += step) {
      State s = state_from_coordinate(kind, v);
      if (coordinate(s, kind) != v)
        bad++;
    }
    VERIFY(bad == 0, coordinate_name(kind) << " round trip (" << bad
                                           << " mismatches)");
  }

  // 六个坐标确定整个状态
  std::mt19937 rng(777);
  for (int t = 0; t < 100; ++t) {
    State a = random_state(rng);
    State b = random_state(rng);
    bool same_coords = a.c_ori() == b.c_ori() && a.c_prm() == b.c_prm() &&
                       a.e_ori() == b.e_ori() &&
                       a.slice_loc() == b.slice_loc() &&
                       a.slice_prm() == b.slice_prm() &&
                       a.non_slice_prm() == b.non_slice_prm();
    VERIFY(same_coords == (a == b), "coordinates identify the state");
  }

  // 子群
  for (int t = 0; t < 100; ++t) {
    State s;
    std::uniform_int_distribution<int> pick(0, N_PHASE2_MOVES - 1);
    for (int i = 0; i < 25; ++i)
      s = s.apply_move(phase2_moves[pick(rng)]);
    VERIFY(s.in_subgroup(), "phase 2 moves stay in the subgroup");
  }
  VERIFY(!State().apply_move(9).in_subgroup(), "R leaves the subgroup");
  VERIFY(!State().apply_move(12).in_subgroup(), "F leaves the subgroup");
  VERIFY(State().apply_move(12).e_ori() != 0, "F flips edges");
  VERIFY(State().apply_move(9).e_ori() == 0, "R does not flip edges");
}

static void verify_state_checks() {
  verify_section("State validation");
  std::string err;
  std::mt19937 rng(99);
  for (int t = 0; t < 50; ++t)
    VERIFY(verify_state(random_state(rng), err), "scrambled state is legal");

  State twist;
  twist.co[0] = 1;
  VERIFY(!verify_state(twist, err), "single twisted corner rejected");

  State flip;
  flip.eo[5] = 1;
  VERIFY(!verify_state(flip, err), "single flipped edge rejected");

  State swap;
  std::swap(swap.ep[4], swap.ep[5]);
  VERIFY(!verify_state(swap, err), "single edge swap rejected (parity)");

  State dup;
  dup.cp[1] = 0;
  VERIFY(!verify_state(dup, err), "duplicate corner rejected");

  State range;
  range.ep[0] = 12;
  VERIFY(!verify_state(range, err), "edge out of range rejected");

  State both;
  std::swap(both.ep[4], both.ep[5]);
  std::swap(both.cp[0], both.cp[1]);
  VERIFY(verify_state(both, err), "corner + edge swap is legal: " << err);
}

static void verify_parser() {
  verify_section("Scramble parser");
  std::vector<int> alg;
  std::string err;

  VERIFY(parse_alg("R U R' U'", alg, err), "standard notation");
  VERIFY((alg == std::vector<int>{9, 0, 11, 2}), "standard notation moves");

  VERIFY(parse_alg("R1 U3 F2 B2'", alg, err), "numeric notation");
  VERIFY((alg == std::vector<int>{9, 2, 13, 16}), "numeric notation moves");

  VERIFY(parse_alg("  D  L2\tB' ", alg, err), "extra whitespace");
  VERIFY((alg == std::vector<int>{3, 7, 17}), "whitespace moves");

  VERIFY(parse_alg("", alg, err) && alg.empty(), "empty text is empty alg");

  VERIFY(!parse_alg("R X", alg, err), "unknown face rejected");
  VERIFY(!err.empty(), "error text set");
  VERIFY(!parse_alg("R4", alg, err), "unknown power rejected");
  VERIFY(!parse_alg("r", alg, err), "lower case rejected");
  VERIFY(!parse_alg("R''", alg, err), "double prime rejected");

  std::vector<int> all(N_MOVES);
  for (int m = 0; m < N_MOVES; ++m)
    all[m] = m;
  std::string text = alg_to_string(all);
  VERIFY(text == "U U2 U' D D2 D' L L2 L' R R2 R' F F2 F' B B2 B'",
         "move names: " << text);
  VERIFY(parse_alg(text, alg, err) && alg == all, "format then parse");

  std::mt19937 rng(4242);
  for (int t = 0; t < 50; ++t) {
    std::vector<int> a = random_alg(rng, 25);
    State s = State().apply_alg(a).apply_alg(inverse_alg(a));
    VERIFY(s.is_solved(), "inverse_alg undoes the scramble");
  }
}

static void verify_random_alg() {
  verify_section("Random scrambles");
  std::mt19937 a(181086), b(181086);
  std::vector<int> x = random_alg(a, 40);
  std::vector<int> y = random_alg(b, 40);
  VERIFY(x == y, "same seed gives same scramble");
  VERIFY(x.size() == 40, "requested length");

  std::mt19937 rng(5);
  for (int t = 0; t < 200; ++t) {
    std::vector<int> alg = random_alg(rng, 30);
    int prev = MOVE_NONE;
    for (int m : alg) {
      VERIFY((valid_moves_mask[prev] >> m) & 1,
             "scramble has no redundant pair");
      prev = m;
    }
  }
}

int main() {
  std::cout << "=== Cube Model Verification ===" << std::endl;
  init_matrix();

  verify_move_matrix();
  verify_moves();
  verify_math();
  verify_coordinates();
  verify_state_checks();
  verify_parser();
  verify_random_alg();

  return verify_report("verify_cube_model");
}
