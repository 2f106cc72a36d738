/*
 * solver_config.h - 运行时配置（config.txt, key = value）
 */

#ifndef SOLVER_CONFIG_H
#define SOLVER_CONFIG_H

#include "cube_common.h"
#include "two_phase_solver.h"

struct SolverConfig {
  std::string tables_dir = ".";
  SolveOptions solve;
  int threads = 0; // 0 = OpenMP 默认
  bool save_tables = true;
  bool quiet = false;
  int bench_count = 0; // > 0 时运行随机打乱基准测试
  int bench_length = 20;
  unsigned int seed = 181086;
};

// 解析配置文本，未知键写入 warnings
bool parse_config(std::istream &in, SolverConfig &cfg, std::string &error,
                  std::vector<std::string> &warnings);
bool load_config(const std::string &path, SolverConfig &cfg,
                 std::string &error, std::vector<std::string> &warnings);

// 设置单个键，键未知时返回 false 且 error 为空
bool apply_config_value(SolverConfig &cfg, const std::string &key,
                        const std::string &value, std::string &error);

#endif // SOLVER_CONFIG_H
