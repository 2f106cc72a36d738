/*
 * verify_solver.cpp - 两阶段求解器验证
 *
 * 随机打乱求解回放、最优模式、长度上限、确定性、并行批量、
 * 配置文件和任务文件解析。
 */

#include "phase1_search.h"
#include "phase2_search.h"
#include "solver_config.h"
#include "solver_executor.h"
#include "two_phase_solver.h"
#include "verify_common.h"

static State scramble(const std::string &text) {
  std::vector<int> alg;
  std::string err;
  if (!parse_alg(text, alg, err))
    throw std::invalid_argument(err);
  return State().apply_alg(alg);
}

static void verify_trivial(const TwoPhaseSolver &solver) {
  verify_section("Trivial states");
  SolveResult r = solver.solve(State());
  VERIFY(r.found && r.solution.empty(), "solved state gives empty solution");
  VERIFY(r.stats.totalProbes() == 0, "solved state searches nothing");

  SolveOptions optimal;
  optimal.target_length = 0;
  for (int m = 0; m < N_MOVES; ++m) {
    State s = State().apply_move(m);
    SolveResult one = solver.solve(s, optimal);
    VERIFY(one.found && one.solution.size() == 1 &&
               one.solution[0] == inverse_move(m),
           move_names[m] << " solved by " << alg_to_string(one.solution));
  }
}

static void verify_invalid(const TwoPhaseSolver &solver) {
  verify_section("Invalid input");
  State twisted;
  twisted.co[3] = 2;
  bool threw = false;
  try {
    solver.solve(twisted);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  VERIFY(threw, "twisted corner throws invalid_argument");

  threw = false;
  SolveOptions negative;
  negative.max_length = -1;
  try {
    solver.solve(scramble("R U"), negative);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  VERIFY(threw, "negative max_length throws invalid_argument");
}

static void verify_random(const TwoPhaseSolver &solver) {
  verify_section("Random scrambles");
  SolveOptions opt;
  opt.max_length = 22;
  std::mt19937 rng(181086);
  SolveStats total;
  int maxLen = 0;
  for (int t = 0; t < 30; ++t) {
    std::vector<int> alg = random_alg(rng, 20);
    State s = State().apply_alg(alg);
    SolveResult r = solver.solve(s, opt);
    VERIFY(r.found, "scramble " << t << " solved");
    if (!r.found)
      continue;
    VERIFY((int)r.solution.size() <= opt.max_length,
           "solution within max_length");
    VERIFY(s.apply_alg(r.solution).is_solved(),
           "solution replays to solved: " << alg_to_string(alg));
    int prev = MOVE_NONE;
    bool canonical = true;
    for (int m : r.solution) {
      if (!((valid_moves_mask[prev] >> m) & 1))
        canonical = false;
      prev = m;
    }
    VERIFY(canonical, "solution has no redundant pair");
    VERIFY(r.stats.phase1Solutions > 0, "phase 1 prefix counted");
    total += r.stats;
    maxLen = std::max(maxLen, (int)r.solution.size());
  }
  std::cout << "  max length " << maxLen << std::endl;
  print_solve_stats(total);
  VERIFY(total.phase1Cuts > 0, "phase 1 cuts counted");
  VERIFY(total.phase1Cuts <= total.phase1Probes * N_MOVES,
         "at most one phase 1 cut per pruned move");
}

static void verify_phases(const SolverTables &tables) {
  verify_section("Phase 1 prefixes");
  std::mt19937 rng(6174);
  for (int t = 0; t < 5; ++t) {
    State s = State().apply_alg(random_alg(rng, 25));
    SolveStats st;
    Phase1Search p1(tables, st);
    int h1 = tables.phase1_distance(s.c_ori(), s.e_ori(), s.slice_loc());
    int seen = 0, firstDepth = -1;
    bool allOk = true;
    // h1 只是下界，逐层加深直到出现第一个前缀，并检查该层全部前缀
    for (int d = h1; d <= MAX_PHASE1_DEPTH && seen == 0; ++d) {
      Phase1Search::Callback cb = [&](const std::vector<int> &prefix) {
        seen++;
        if ((int)prefix.size() != d || !s.apply_alg(prefix).in_subgroup())
          allOk = false;
        if (!prefix.empty() && is_phase2_move(prefix.back()))
          allOk = false;
        return false;
      };
      p1.run(s, d, cb);
      if (seen > 0)
        firstDepth = d;
    }
    VERIFY(firstDepth >= h1 && firstDepth <= MAX_PHASE1_DEPTH,
           "first prefix depth " << firstDepth << " within [" << h1 << ", "
                                 << MAX_PHASE1_DEPTH << "]");
    VERIFY(seen > 0, "prefixes found");
    VERIFY(allOk, "every prefix reaches the subgroup with a phase 1 move last");
    VERIFY(st.phase1Solutions == seen, "phase1Solutions counts prefixes");
    VERIFY(st.cornerProbes == 0, "no corner probes without a budget");
    VERIFY(firstDepth == h1 || st.phase1Cuts > 0,
           "coset bound cuts counted below the first prefix depth");
  }

  verify_section("Phase 2");
  std::uniform_int_distribution<int> pick(0, N_PHASE2_MOVES - 1);
  for (int t = 0; t < 50; ++t) {
    int len = 1 + t % 8;
    State s;
    for (int i = 0; i < len; ++i)
      s = s.apply_move(phase2_moves[pick(rng)]);
    SolveStats st;
    Phase2Search p2(tables, st);
    std::vector<int> out;
    bool ok = p2.solve(s, MOVE_NONE, len, out);
    VERIFY(ok, "subgroup state solved within its scramble length");
    if (!ok)
      continue;
    VERIFY((int)out.size() <= len, "phase 2 solution not longer than scramble");
    VERIFY(s.apply_alg(out).is_solved(), "phase 2 solution replays");
    for (int m : out)
      VERIFY(is_phase2_move(m), "phase 2 uses subgroup moves only");
  }
  SolveStats st;
  Phase2Search p2(tables, st);
  std::vector<int> out;
  VERIFY(!p2.solve(scramble("U R2 F2 D'"), MOVE_NONE, 0, out),
         "limit 0 fails on an unsolved state");
  VERIFY(st.phase2Probes == 1 && st.phase2Cuts == 1,
         "bound above limit counts one probe and one cut");
}

static void verify_optimal(const TwoPhaseSolver &solver) {
  verify_section("Optimal mode");
  SolveOptions opt;
  opt.target_length = 0;
  SolveResult r = solver.solve(scramble("R U"), opt);
  VERIFY(r.found && r.solution.size() == 2, "R U solved in 2");

  std::mt19937 rng(1729);
  for (int t = 0; t < 20; ++t) {
    int len = 1 + t % 6;
    State s = State().apply_alg(random_alg(rng, len));
    SolveResult o = solver.solve(s, opt);
    VERIFY(o.found && (int)o.solution.size() <= len,
           "optimal length " << o.solution.size() << " <= " << len);
    VERIFY(o.found && s.apply_alg(o.solution).is_solved(), "optimal replays");
  }
}

static void verify_limits(const TwoPhaseSolver &solver) {
  verify_section("Length limit");
  SolveOptions opt;
  opt.max_length = 2;
  SolveResult r = solver.solve(scramble("R U F"), opt);
  VERIFY(!r.found && r.solution.empty(), "R U F has no 2 move solution");
  VERIFY(r.length() == -1, "length -1 when not found");

  opt.max_length = 3;
  r = solver.solve(scramble("R U F"), opt);
  VERIFY(r.found && r.solution.size() == 3, "R U F solved in 3");
}

static void verify_corners_switch(const TwoPhaseSolver &solver) {
  verify_section("Corners table switch");
  State s = scramble("F R U' L2 B D' R F2 U L' B2 D R'");
  SolveOptions with;
  with.max_length = 22;
  SolveOptions without = with;
  without.use_corners_table = false;

  SolveResult a = solver.solve(s, with);
  SolveResult b = solver.solve(s, without);
  VERIFY(a.found && b.found, "both modes solve");
  VERIFY(a.stats.cornerProbes > 0, "corners table probed when enabled");
  VERIFY(b.stats.cornerProbes == 0 && b.stats.cornerCuts == 0,
         "corners table unused when disabled");
  VERIFY(b.found && s.apply_alg(b.solution).is_solved(),
         "solution without corners table replays");
}

static void verify_determinism(std::shared_ptr<const SolverTables> tables) {
  verify_section("Determinism and batches");
  std::mt19937 rng(99);
  std::vector<State> states;
  for (int t = 0; t < 16; ++t)
    states.push_back(State().apply_alg(random_alg(rng, 20)));
  State bad;
  bad.eo[0] = 1;
  states.push_back(bad);

  SolveOptions opt;
  opt.max_length = 22;
  std::vector<SolveResult> seq = solve_batch(tables, states, opt, false);
  std::vector<SolveResult> par = solve_batch(tables, states, opt, true);
  VERIFY(seq.size() == states.size() && par.size() == states.size(),
         "one result per state");

  TwoPhaseSolver solver(tables);
  for (size_t i = 0; i + 1 < states.size(); ++i) {
    VERIFY(seq[i].found && seq[i].error.empty(), "batch state solved");
    VERIFY(seq[i].solution == par[i].solution,
           "parallel batch gives the sequential solution");
    VERIFY(seq[i].stats.sameCounters(par[i].stats),
           "parallel batch gives the sequential counters");
    SolveResult again = solver.solve(states[i], opt);
    VERIFY(again.solution == seq[i].solution &&
               again.stats.sameCounters(seq[i].stats),
           "repeated solve is identical");
  }
  VERIFY(!seq.back().found && !seq.back().error.empty(),
         "invalid state reported in the batch: " << seq.back().error);
  VERIFY(!par.back().found && !par.back().error.empty(),
         "invalid state reported in the parallel batch");
}

static void verify_config() {
  verify_section("Config");
  SolverConfig cfg;
  std::string error;
  std::vector<std::string> warnings;
  std::istringstream good("# comment\n"
                          "tables_dir = /tmp/tables\n"
                          "max_length = 21   # inline comment\n"
                          "target_length=0\n"
                          "use_corners_table = false\n"
                          "threads = 4\n"
                          "\n"
                          "colour = blue\n"
                          "seed = 42\r\n");
  VERIFY(parse_config(good, cfg, error, warnings), "parse: " << error);
  VERIFY(cfg.tables_dir == "/tmp/tables", "tables_dir");
  VERIFY(cfg.solve.max_length == 21, "max_length");
  VERIFY(cfg.solve.target_length == 0, "target_length");
  VERIFY(!cfg.solve.use_corners_table, "use_corners_table");
  VERIFY(cfg.threads == 4, "threads");
  VERIFY(cfg.seed == 42u, "seed");
  VERIFY(warnings.size() == 1 &&
             warnings[0].find("colour") != std::string::npos,
         "unknown key warns");

  SolverConfig defaults;
  VERIFY(defaults.solve.max_length == 20 && defaults.solve.target_length == -1 &&
             defaults.solve.use_corners_table && defaults.save_tables,
         "defaults");

  std::istringstream badValue("max_length = twenty\n");
  VERIFY(!parse_config(badValue, defaults, error, warnings), "bad integer");
  VERIFY(error.find("line 1") != std::string::npos, "error names the line");

  std::istringstream badLine("max_length 20\n");
  VERIFY(!parse_config(badLine, defaults, error, warnings), "missing '='");

  std::istringstream badBool("quiet = maybe\n");
  VERIFY(!parse_config(badBool, defaults, error, warnings), "bad boolean");

  VERIFY(!apply_config_value(defaults, "max_length", "-3", error),
         "negative max_length rejected");
  VERIFY(!load_config("/nonexistent/config.txt", defaults, error, warnings),
         "missing config file");
}

static void verify_tasks(std::shared_ptr<const SolverTables> tables) {
  verify_section("Task files");
  SolveTask task;
  VERIFY(!parse_task_line("   ", 1, task), "blank line skipped");
  VERIFY(parse_task_line("7,R U R' U'\r", 1, task), "id,scramble line");
  VERIFY(task.id == "7" && task.alg.size() == 4 && task.parseError.empty(),
         "id and moves parsed");
  SolveTask plain;
  VERIFY(parse_task_line("F2 B", 3, plain), "scramble only line");
  VERIFY(plain.id == "3" && plain.alg.size() == 2, "index used as id");
  SolveTask broken;
  VERIFY(parse_task_line("9,R Q", 4, broken), "bad scramble kept");
  VERIFY(!broken.parseError.empty(), "parse error recorded");
  SolveTask empty;
  VERIFY(parse_task_line("5,", 5, empty), "empty scramble kept");
  VERIFY(empty.parseError == "empty scramble", "empty scramble error");

  VERIFY(output_filename_for("dir.v2/scrambles.txt") ==
             "dir.v2/scrambles_solved.csv",
         "output file name");
  VERIFY(output_filename_for("scrambles") == "scrambles_solved.csv",
         "output file name without extension");
  VERIFY(formatWithCommas(1234567) == "1,234,567", "thousands separators");

  std::vector<SolveTask> tasks = {task, plain, broken};
  SolveOptions opt;
  opt.target_length = 0;
  std::ostringstream csv;
  BatchSummary sum = run_solver_batch(tables, tasks, opt, csv, false);
  VERIFY(sum.total == 3 && sum.solved == 2 && sum.failed == 1, "summary");

  std::istringstream lines(csv.str());
  std::string line;
  std::vector<std::string> rows;
  while (std::getline(lines, line))
    rows.push_back(line);
  VERIFY(rows.size() == 4, "header plus one row per task");
  if (rows.size() == 4) {
    VERIFY(rows[0] == get_csv_header(), "csv header");
    VERIFY(rows[1].rfind("7,4,", 0) == 0, "rows in input order: " << rows[1]);
    VERIFY(rows[2].rfind("3,2,", 0) == 0, "F2 B solved in 2: " << rows[2]);
    VERIFY(rows[3].rfind("9,-1,", 0) == 0, "parse failure row: " << rows[3]);
  }
}

int main(int argc, char **argv) {
  std::cout << "=== Two-Phase Solver Verification ===" << std::endl;
  init_matrix();
  g_quietLog = true;

  auto tables = SolverTables::load_or_build(verify_table_dir(argc, argv));
  TwoPhaseSolver solver(tables);

  try {
    verify_trivial(solver);
    verify_invalid(solver);
    verify_random(solver);
    verify_phases(*tables);
    verify_optimal(solver);
    verify_limits(solver);
    verify_corners_switch(solver);
    verify_determinism(tables);
    verify_config();
    verify_tasks(tables);
  } catch (const std::exception &e) {
    VERIFY(false, "unexpected exception: " << e.what());
  }

  VERIFY(SolverTables::load_or_build(verify_table_dir(argc, argv)) == tables,
         "tables shared within the process");
  VERIFY(SolverTables::load_or_build(verify_table_dir(argc, argv), true,
                                     false) == tables,
         "request without corners table reuses the loaded tables");

  return verify_report("verify_solver");
}
