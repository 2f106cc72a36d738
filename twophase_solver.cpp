/*
 * twophase_solver.cpp - 两阶段求解器命令行程序
 */

#include "cube_common.h"
#include "solver_config.h"
#include "solver_executor.h"
#include "solver_tables.h"
#include "two_phase_solver.h"

static void print_usage() {
  std::cout
      << "Usage: twophase_solver [options] [FILE]\n"
      << "  --config FILE   read key = value settings (default: config.txt)\n"
      << "  --tables DIR    table cache directory\n"
      << "  --max N         maximum solution length\n"
      << "  --target N      stop at the first solution of at most N moves\n"
      << "  --optimal       search until the solution is proven optimal\n"
      << "  --threads N     OpenMP worker threads (0 = default)\n"
      << "  --no-corners    do not use the corners table\n"
      << "  --no-save       do not write generated tables to disk\n"
      << "  --quiet         hide table generation output\n"
      << "  --bench N       solve N random scrambles and verify them\n"
      << "  --length L      random scramble length for --bench\n"
      << "  --seed S        random seed for --bench\n"
      << "Without FILE or --bench the program asks for task files.\n";
}

static int run_benchmark(std::shared_ptr<const SolverTables> tables,
                         const SolverConfig &cfg) {
  std::mt19937 rng(cfg.seed);
  std::vector<SolveTask> tasks(cfg.bench_count);
  for (int i = 0; i < cfg.bench_count; ++i) {
    tasks[i].id = std::to_string(i + 1);
    tasks[i].alg = random_alg(rng, cfg.bench_length);
    tasks[i].text = alg_to_string(tasks[i].alg);
  }

  std::string outputFilename =
      "bench_" + std::to_string(cfg.seed) + "_solved.csv";
  std::ofstream outfile(outputFilename);
  if (!outfile) {
    std::cout << ANSI_RED << "[ERROR] Cannot create '" << outputFilename
              << "'" << ANSI_RESET << std::endl;
    return 1;
  }
  std::cout << "Benchmark: " << cfg.bench_count << " scrambles of "
            << cfg.bench_length << " moves, seed " << cfg.seed << std::endl;

  BatchSummary sum = run_solver_batch(tables, tasks, cfg.solve, outfile, true);
  outfile.close();

  if (sum.failed == 0) {
    std::cout << TAG_COLOR << "[SUCCESS]" << ANSI_RESET << " All "
              << sum.solved << " solutions verified." << std::endl;
  } else {
    std::cout << ANSI_RED << "[ERROR] " << sum.failed
              << " scramble(s) not solved, see " << outputFilename
              << ANSI_RESET << std::endl;
  }
  printSummaryTable(sum, outputFilename, g_loadedTableBytes.load());
  std::cout << "Search statistics (cuts/probes):" << std::endl;
  print_solve_stats(sum.stats);
  return sum.failed == 0 ? 0 : 1;
}

int main(int argc, char **argv) {
  printSolverLogo();

  std::vector<std::string> args(argv + 1, argv + argc);
  SolverConfig cfg;
  std::string error;
  std::vector<std::string> warnings;

  // 1. 配置文件（命令行参数优先）
  std::string configPath;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        std::cout << ANSI_RED << "[ERROR] --config needs a file" << ANSI_RESET
                  << std::endl;
        return 1;
      }
      configPath = args[i + 1];
    }
  }
  if (configPath.empty() && fileExists("config.txt"))
    configPath = "config.txt";
  if (!configPath.empty()) {
    if (!load_config(configPath, cfg, error, warnings)) {
      std::cout << ANSI_RED << "[ERROR] " << configPath << ": " << error
                << ANSI_RESET << std::endl;
      return 1;
    }
    for (const auto &w : warnings)
      std::cout << ANSI_YELLOW << "[WARN] " << configPath << ": " << w
                << ANSI_RESET << std::endl;
  }

  // 2. 命令行参数
  std::string inputFile;
  static const std::vector<std::pair<std::string, std::string>> valueFlags = {
      {"--tables", "tables_dir"}, {"--max", "max_length"},
      {"--target", "target_length"}, {"--threads", "threads"},
      {"--bench", "bench_count"}, {"--length", "bench_length"},
      {"--seed", "seed"}};
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "--help" || a == "-h") {
      print_usage();
      return 0;
    }
    if (a == "--config") {
      ++i;
      continue;
    }
    if (a == "--optimal") {
      cfg.solve.target_length = 0;
      continue;
    }
    if (a == "--no-corners") {
      cfg.solve.use_corners_table = false;
      continue;
    }
    if (a == "--no-save") {
      cfg.save_tables = false;
      continue;
    }
    if (a == "--quiet") {
      cfg.quiet = true;
      continue;
    }
    auto it = std::find_if(valueFlags.begin(), valueFlags.end(),
                           [&a](const auto &f) { return f.first == a; });
    if (it != valueFlags.end()) {
      if (i + 1 >= args.size()) {
        std::cout << ANSI_RED << "[ERROR] " << a << " needs a value"
                  << ANSI_RESET << std::endl;
        return 1;
      }
      if (!apply_config_value(cfg, it->second, args[++i], error)) {
        std::cout << ANSI_RED << "[ERROR] " << a << ": " << error << ANSI_RESET
                  << std::endl;
        return 1;
      }
      continue;
    }
    if (a.size() > 1 && a[0] == '-') {
      std::cout << ANSI_RED << "[ERROR] Unknown option " << a << ANSI_RESET
                << std::endl;
      print_usage();
      return 1;
    }
    if (!inputFile.empty()) {
      std::cout << ANSI_RED << "[ERROR] Only one task file is accepted"
                << ANSI_RESET << std::endl;
      return 1;
    }
    inputFile = a;
  }

  g_quietLog = cfg.quiet;
  if (cfg.threads > 0)
    omp_set_num_threads(cfg.threads);

  // 3. 加载表并求解
  try {
    auto tables = SolverTables::load_or_build(
        cfg.tables_dir, cfg.save_tables, cfg.solve.use_corners_table);

    if (cfg.bench_count > 0)
      return run_benchmark(tables, cfg);
    if (!inputFile.empty())
      return run_solver_file(tables, inputFile, cfg.solve) ? 0 : 1;
    run_solver_app(tables, cfg.solve);
  } catch (const std::exception &e) {
    setCursorVisibility(true);
    std::cout << ANSI_RED << "[ERROR] " << e.what() << ANSI_RESET << std::endl;
    return 1;
  }
  return 0;
}
