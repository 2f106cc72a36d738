/*
 * solver_config.cpp - 运行时配置实现
 */

#include "solver_config.h"

static std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static bool parse_int(const std::string &key, const std::string &value,
                      int lo, int hi, int &out, std::string &error) {
  try {
    size_t pos = 0;
    long v = std::stol(value, &pos);
    if (pos != value.size() || v < lo || v > hi)
      throw std::out_of_range(value);
    out = (int)v;
    return true;
  } catch (const std::logic_error &) {
    error = key + ": expected integer in [" + std::to_string(lo) + ", " +
            std::to_string(hi) + "], got '" + value + "'";
    return false;
  }
}

static bool parse_bool(const std::string &key, const std::string &value,
                       bool &out, std::string &error) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    out = false;
    return true;
  }
  error = key + ": expected boolean, got '" + value + "'";
  return false;
}

bool apply_config_value(SolverConfig &cfg, const std::string &key,
                        const std::string &value, std::string &error) {
  error.clear();
  if (key == "tables_dir") {
    if (value.empty()) {
      error = "tables_dir: empty path";
      return false;
    }
    cfg.tables_dir = value;
    return true;
  }
  if (key == "max_length")
    return parse_int(key, value, 0, 40, cfg.solve.max_length, error);
  if (key == "target_length")
    return parse_int(key, value, -1, 40, cfg.solve.target_length, error);
  if (key == "use_corners_table")
    return parse_bool(key, value, cfg.solve.use_corners_table, error);
  if (key == "threads")
    return parse_int(key, value, 0, 1024, cfg.threads, error);
  if (key == "save_tables")
    return parse_bool(key, value, cfg.save_tables, error);
  if (key == "quiet")
    return parse_bool(key, value, cfg.quiet, error);
  if (key == "bench_count")
    return parse_int(key, value, 0, 100000000, cfg.bench_count, error);
  if (key == "bench_length")
    return parse_int(key, value, 0, 1000, cfg.bench_length, error);
  if (key == "seed") {
    int seed = 0;
    if (!parse_int(key, value, 0, 2147483647, seed, error))
      return false;
    cfg.seed = (unsigned int)seed;
    return true;
  }
  return false;
}

bool parse_config(std::istream &in, SolverConfig &cfg, std::string &error,
                  std::vector<std::string> &warnings) {
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    lineno++;
    size_t hash = line.find('#');
    if (hash != std::string::npos)
      line = line.substr(0, hash);
    line = trim(line);
    if (line.empty())
      continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      error = "line " + std::to_string(lineno) + ": expected key = value";
      return false;
    }
    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (!apply_config_value(cfg, key, value, error)) {
      if (!error.empty()) {
        error = "line " + std::to_string(lineno) + ": " + error;
        return false;
      }
      warnings.push_back("line " + std::to_string(lineno) + ": unknown key '" +
                         key + "'");
    }
  }
  return true;
}

bool load_config(const std::string &path, SolverConfig &cfg,
                 std::string &error, std::vector<std::string> &warnings) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file '" + path + "'";
    return false;
  }
  return parse_config(in, cfg, error, warnings);
}
