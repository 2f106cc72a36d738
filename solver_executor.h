/*
 * solver_executor.h - 批量求解执行框架
 *
 * NOTE: 本模块封装了求解程序的公共执行逻辑，包括：
 *       - 任务文件读取与打乱解析
 *       - OpenMP 并行求解（每线程一个求解器）
 *       - ANSI 彩色输出与进度条
 *       - CSV 输出（按输入顺序）
 *       - 数据预览与汇总表格
 */

#ifndef SOLVER_EXECUTOR_H
#define SOLVER_EXECUTOR_H

#include "cube_common.h"
#include "two_phase_solver.h"
#include <thread>

// --- 全局统计变量 ---
// NOTE: 使用原子变量保证多线程安全
namespace SolverStats {
inline std::atomic<long long> globalProbes{0};
inline std::atomic<int> completedTasks{0};
inline std::atomic<bool> isSolving{false};
} // namespace SolverStats

// --- 辅助函数：格式化数字（千位分隔符）---
inline std::string formatWithCommas(long long value) {
  std::string result = std::to_string(value);
  int insertPosition = (int)result.length() - 3;
  int limit = (value < 0) ? 1 : 0;
  while (insertPosition > limit) {
    result.insert(insertPosition, ",");
    insertPosition -= 3;
  }
  return result;
}

// --- 辅助函数：智能时间格式化 ---
inline std::string formatDuration(double seconds) {
  if (seconds < 60) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds << "s";
    return oss.str();
  }
  int totalSeconds = static_cast<int>(seconds);
  int hours = totalSeconds / 3600;
  int minutes = (totalSeconds % 3600) / 60;
  int secs = totalSeconds % 60;

  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h " << minutes << "m " << secs << "s";
  } else {
    oss << minutes << "m " << secs << "s";
  }
  return oss.str();
}

// --- 辅助函数：光标控制 ---
inline void setCursorVisibility(bool visible) {
  std::cout << (visible ? "\033[?25h" : "\033[?25l") << std::flush;
}

// --- 辅助函数：格式化内存大小 ---
inline std::string formatMemory(size_t bytes) {
  double gb = bytes / (1024.0 * 1024.0 * 1024.0);
  double mb = bytes / (1024.0 * 1024.0);
  std::ostringstream oss;
  if (gb >= 1.0) {
    oss << std::fixed << std::setprecision(2) << gb << " GB";
  } else {
    oss << std::fixed << std::setprecision(0) << mb << " MB";
  }
  return oss.str();
}

// --- 任务 ---
struct SolveTask {
  std::string id;
  std::string text;       // 原始打乱
  std::vector<int> alg;   // 解析结果
  std::string parseError; // 非空表示解析失败
};

// 解析一行: "id,scramble" 或 "scramble"，空行返回 false
inline bool parse_task_line(std::string line, int nextIndex, SolveTask &task) {
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  if (line.find_first_not_of(" \t") == std::string::npos)
    return false;

  size_t p = line.find(',');
  if (p != std::string::npos) {
    task.id = line.substr(0, p);
    task.text = line.substr(p + 1);
  } else {
    task.id = std::to_string(nextIndex);
    task.text = line;
  }
  std::string error;
  if (task.text.find_first_not_of(" \t") == std::string::npos) {
    task.parseError = "empty scramble";
  } else if (!parse_alg(task.text, task.alg, error)) {
    task.parseError = error;
  }
  return true;
}

inline bool read_task_file(const std::string &filename,
                           std::vector<SolveTask> &tasks) {
  std::ifstream infile(filename);
  if (!infile)
    return false;
  std::string line;
  while (std::getline(infile, line)) {
    SolveTask task;
    if (parse_task_line(line, (int)tasks.size() + 1, task))
      tasks.push_back(std::move(task));
  }
  return true;
}

// --- CSV ---
inline std::string get_csv_header() {
  return "id,length,solution,phase1_probes,phase1_cuts,phase2_probes,"
         "phase2_cuts,corner_probes,corner_cuts,no_twist_cuts,time_ms";
}

inline std::string csv_quote(const std::string &s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"')
      out += '"';
    out += c;
  }
  return out + "\"";
}

inline std::string format_csv_line(const std::string &id, int length,
                                   const std::string &solution,
                                   const SolveStats &s) {
  std::ostringstream oss;
  oss << id << "," << length << ","
      << (solution.find_first_of(",\"") != std::string::npos
              ? csv_quote(solution)
              : solution)
      << "," << s.phase1Probes << "," << s.phase1Cuts << "," << s.phase2Probes
      << "," << s.phase2Cuts << "," << s.cornerProbes << "," << s.cornerCuts
      << "," << s.noTwistCuts << "," << std::fixed << std::setprecision(3)
      << s.elapsedSeconds * 1000.0;
  return oss.str();
}

// --- 辅助函数：打印数据预览（前 N 行）---
inline void printDataPreview(const std::string &filename, int lines = 6) {
  std::ifstream file(filename);
  if (!file)
    return;

  std::cout << ANSI_BLUE << "[DATA] Preview:" << ANSI_RESET << std::endl;
  std::string line;
  int count = 0;
  while (count < lines && std::getline(file, line)) {
    // 截断过长的行
    if (line.length() > 80) {
      line = line.substr(0, 77) + "...";
    }
    std::cout << "  " << line << std::endl;
    count++;
  }
}

// --- 批量结果汇总 ---
struct BatchSummary {
  int total = 0;
  int solved = 0;
  int failed = 0; // 解析失败、无解或校验失败
  long long totalMoves = 0;
  int maxLength = 0;
  SolveStats stats;
  double duration = 0.0;
};

// --- 辅助函数：打印汇总表格 ---
inline void printSummaryTable(const BatchSummary &sum,
                              const std::string &outputFile,
                              size_t ramUsage) {
  double avgLen = sum.solved ? (double)sum.totalMoves / sum.solved : 0.0;
  double avgProbes = sum.duration > 0.001
                         ? sum.stats.totalProbes() / sum.duration / 1000000.0
                         : 0;
  double cubesPerSec = sum.duration > 0.001 ? sum.total / sum.duration : 0;

  std::ostringstream lenStr, npsStr, cpsStr;
  lenStr << std::fixed << std::setprecision(2) << avgLen << " (max "
         << sum.maxLength << ")";
  npsStr << std::fixed << std::setprecision(2) << avgProbes << " M/s";
  cpsStr << std::fixed << std::setprecision(1) << cubesPerSec << " cubes/s";

  std::cout << std::endl;
  std::cout << "+----------------------------------------------------------+"
            << std::endl;
  std::cout << "|                    SOLVER SUMMARY                        |"
            << std::endl;
  std::cout << "+----------------------------------------------------------+"
            << std::endl;
  std::cout << "| Total Tasks      : " << std::left << std::setw(37)
            << sum.total << "|" << std::endl;
  std::cout << "| Solved / Failed  : " << std::left << std::setw(37)
            << (std::to_string(sum.solved) + " / " + std::to_string(sum.failed))
            << "|" << std::endl;
  std::cout << "| Avg Length       : " << std::left << std::setw(37)
            << lenStr.str() << "|" << std::endl;
  std::cout << "| Output File      : " << std::left << std::setw(37)
            << outputFile << "|" << std::endl;
  std::cout << "| Phase1 Probes    : " << std::left << std::setw(37)
            << formatWithCommas(sum.stats.phase1Probes) << "|" << std::endl;
  std::cout << "| Phase2 Probes    : " << std::left << std::setw(37)
            << formatWithCommas(sum.stats.phase2Probes) << "|" << std::endl;
  std::cout << "| Corner Cuts      : " << std::left << std::setw(37)
            << formatWithCommas(sum.stats.cornerCuts) << "|" << std::endl;
  std::cout << "| Ram Usage        : " << std::left << std::setw(37)
            << formatMemory(ramUsage) << "|" << std::endl;
  std::cout << "| " << ANSI_MAGENTA << "Avg Performance  : " << std::left
            << std::setw(37) << npsStr.str() << ANSI_RESET << "|" << std::endl;
  std::cout << "| " << ANSI_MAGENTA << "Throughput       : " << std::left
            << std::setw(37) << cpsStr.str() << ANSI_RESET << "|" << std::endl;
  std::cout << "| " << ANSI_GREEN << "Total Duration   : " << std::left
            << std::setw(37) << formatDuration(sum.duration) << ANSI_RESET
            << "|" << std::endl;
  std::cout << "+----------------------------------------------------------+"
            << std::endl;
}

// 由输入文件名生成输出文件名: foo.txt -> foo_solved.csv
inline std::string output_filename_for(const std::string &inputFilename) {
  std::string basename = inputFilename;
  size_t dotPos = basename.rfind('.');
  size_t slashPos = basename.find_last_of("/\\");
  if (dotPos != std::string::npos &&
      (slashPos == std::string::npos || dotPos > slashPos)) {
    basename = basename.substr(0, dotPos);
  }
  return basename + "_solved.csv";
}

/*
 * run_solver_batch - 并行求解一批任务并按输入顺序写入 CSV
 *
 * 每个解都会在魔方模型上回放校验；解析失败、无解或校验失败的任务
 * 写入 length = -1 和错误信息，不中断批处理。
 * showProgress 为 true 时启动监视线程显示进度条。
 */
inline BatchSummary
run_solver_batch(std::shared_ptr<const SolverTables> tables,
                 const std::vector<SolveTask> &tasks, const SolveOptions &opt,
                 std::ostream &outfile, bool showProgress) {
  BatchSummary sum;
  const int total = static_cast<int>(tasks.size());
  sum.total = total;

  outfile << get_csv_header() << "\n";

  auto startTime = std::chrono::high_resolution_clock::now();
  std::vector<std::string> resultBuffer(total);
  std::vector<bool> resultReady(total, false);
  int nextWriteIdx = 0;

  SolverStats::globalProbes = 0;
  SolverStats::completedTasks = 0;
  SolverStats::isSolving = true;

  std::thread monitorThread;
  if (showProgress) {
    // 隐藏光标以获得更好的视觉体验
    setCursorVisibility(false);

    // 启动监视线程（进度条 + 性能）
    monitorThread = std::thread([&]() {
      auto t0 = std::chrono::high_resolution_clock::now();
      while (SolverStats::isSolving.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto t1 = std::chrono::high_resolution_clock::now();
        double dt = std::chrono::duration<double>(t1 - t0).count();
        long long probes =
            SolverStats::globalProbes.load(std::memory_order_relaxed);
        int completed =
            SolverStats::completedTasks.load(std::memory_order_relaxed);
        double nps = (dt > 0.001) ? probes / dt / 1000000.0 : 0;
        double progress = (total > 0) ? (double)completed * 100.0 / total : 0;

        // 构建进度条
        int barWidth = 30;
        int filled = static_cast<int>(progress / 100.0 * barWidth);
        std::string bar(filled, '#');
        bar += std::string(barWidth - filled, '-');

        // NOTE: 完全使用 C 风格字符数组，避免任何 std::string 内存分配问题
        char etaBuf[64];
        if (completed > 0 && completed < total) {
          double etaSec = dt * (total - completed) / completed;
          if (etaSec < 60) {
            snprintf(etaBuf, sizeof(etaBuf), "%.1fs", etaSec);
          } else {
            int totalSec = static_cast<int>(etaSec);
            int h = totalSec / 3600;
            int m = (totalSec % 3600) / 60;
            int s = totalSec % 60;
            if (h > 0) {
              snprintf(etaBuf, sizeof(etaBuf), "%dh %dm %ds", h, m, s);
            } else {
              snprintf(etaBuf, sizeof(etaBuf), "%dm %ds", m, s);
            }
          }
        } else {
          snprintf(etaBuf, sizeof(etaBuf), "...");
        }

        // NOTE: \033[2K 清除整行，避免旧内容残留
        std::cout << "\033[2K" << ANSI_YELLOW << "[PROG] [" << bar << "] "
                  << std::fixed << std::setprecision(1) << progress << "% ("
                  << completed << "/" << total << ")" << ANSI_RESET << "\n";
        std::cout << "\033[2K" << ANSI_MAGENTA
                  << "       Performance: " << std::fixed
                  << std::setprecision(2) << nps << " M/s | ETA: " << etaBuf
                  << ANSI_RESET << "\r\033[A" << std::flush;
      }
    });
  }

  // 并行求解
#pragma omp parallel
  {
    TwoPhaseSolver solver(tables); // 线程局部初始化

#pragma omp for schedule(dynamic, 1)
    for (int i = 0; i < total; ++i) {
      const SolveTask &task = tasks[i];
      SolveResult res;
      std::string line;
      if (!task.parseError.empty()) {
        line = format_csv_line(task.id, -1, task.parseError, res.stats);
      } else {
        State start = State().apply_alg(task.alg);
        try {
          res = solver.solve(start, opt);
        } catch (const std::exception &e) {
          res.found = false;
          res.error = e.what();
        }
        if (res.found && !start.apply_alg(res.solution).is_solved()) {
          res.found = false;
          res.error = "solution does not solve the cube";
        }
        if (res.found) {
          line = format_csv_line(task.id, (int)res.solution.size(),
                                 alg_to_string(res.solution), res.stats);
        } else {
          std::string msg = res.error.empty()
                                ? "no solution within " +
                                      std::to_string(opt.max_length) + " moves"
                                : res.error;
          line = format_csv_line(task.id, -1, msg, res.stats);
        }
      }
      SolverStats::globalProbes.fetch_add(res.stats.totalProbes(),
                                          std::memory_order_relaxed);
      SolverStats::completedTasks.fetch_add(1, std::memory_order_relaxed);

      // 顺序写入结果 - 所有对 resultBuffer/resultReady 的访问都在 critical
      // section 中
#pragma omp critical
      {
        if (res.found) {
          sum.solved++;
          sum.totalMoves += res.solution.size();
          sum.maxLength = std::max(sum.maxLength, (int)res.solution.size());
        } else {
          sum.failed++;
        }
        sum.stats += res.stats;
        resultBuffer[i] = line;
        resultReady[i] = true;
        while (nextWriteIdx < total && resultReady[nextWriteIdx]) {
          outfile << resultBuffer[nextWriteIdx] << "\n";
          nextWriteIdx++;
        }
      }
    }
  }

  // 停止监视线程
  SolverStats::isSolving = false;
  if (monitorThread.joinable()) {
    monitorThread.join();
    setCursorVisibility(true);
    // 清除进度条残留
    printf("\033[2K\033[A\033[2K");
    fflush(stdout);
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  sum.duration = std::chrono::duration<double>(endTime - startTime).count();
  outfile.flush();
  return sum;
}

/*
 * run_solver_file - 求解一个任务文件，输出 <basename>_solved.csv
 * 返回 false 表示输入文件无法读取或输出文件无法创建
 */
inline bool run_solver_file(std::shared_ptr<const SolverTables> tables,
                            const std::string &inputFilename,
                            const SolveOptions &opt) {
  std::vector<SolveTask> tasks;
  if (!read_task_file(inputFilename, tasks)) {
    std::cout << ANSI_RED << "[ERROR] File '" << inputFilename
              << "' not found!" << ANSI_RESET << std::endl;
    return false;
  }
  if (tasks.empty()) {
    std::cout << ANSI_YELLOW << "[WARN] No tasks found in file." << ANSI_RESET
              << std::endl;
    return true;
  }

  std::string outputFilename = output_filename_for(inputFilename);
  std::ofstream outfile(outputFilename);
  if (!outfile) {
    std::cout << ANSI_RED << "[ERROR] Cannot create '" << outputFilename
              << "'" << ANSI_RESET << std::endl;
    return false;
  }
  std::cout << "Output file: " << ANSI_YELLOW << outputFilename << ANSI_RESET
            << std::endl;
  std::cout << "Loaded " << tasks.size() << " tasks. Solving..." << std::endl;

  BatchSummary sum = run_solver_batch(tables, tasks, opt, outfile, true);
  outfile.close();

  std::cout << TAG_COLOR << "[SUCCESS]" << ANSI_RESET
            << " Processing complete!" << std::endl;
  if (sum.failed > 0)
    std::cout << ANSI_YELLOW << "[WARN] " << sum.failed
              << " task(s) failed, see length -1 rows" << ANSI_RESET
              << std::endl;

  printDataPreview(outputFilename, 6);
  printSummaryTable(sum, outputFilename, g_loadedTableBytes.load());
  return true;
}

/*
 * run_solver_app - 交互式主循环
 */
inline void run_solver_app(std::shared_ptr<const SolverTables> tables,
                           const SolveOptions &opt) {
  int numThreads = 1;
#pragma omp parallel
  {
#pragma omp single
    numThreads = omp_get_num_threads();
  }
  // NOTE: 显示已加载表的总大小，而不是系统内存
  std::cout << "       RAM: " << formatMemory(g_loadedTableBytes.load())
            << " | Threads: " << numThreads << " | Done." << std::endl;

  while (true) {
    std::string inputFilename;
    std::cout << std::endl << "Enter file (or exit): ";
    if (!(std::cin >> inputFilename) || inputFilename == "exit") {
      break;
    }
    run_solver_file(tables, inputFilename, opt);
  }
}

#endif // SOLVER_EXECUTOR_H
