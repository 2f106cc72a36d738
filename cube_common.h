/*
 * cube_common.h - 魔方公共定义和工具函数
 */

#ifndef CUBE_COMMON_H
#define CUBE_COMMON_H

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <omp.h>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// --- 配置 ---
#define ENABLE_CORNERS_TABLE 1 // Phase 1 使用角块距离表 (cornerProbes/cornerCuts)
#define ENABLE_DIRECTIONS 1    // Coset 表方向集合剪枝 (noTwistCuts)

// --- ANSI 颜色定义 ---
#define ANSI_RESET "\033[0m"
#define ANSI_CYAN "\033[36m"
#define ANSI_GREEN "\033[32m"
#define ANSI_YELLOW "\033[33m"
#define ANSI_MAGENTA "\033[35m"
#define ANSI_RED "\033[31m"
#define ANSI_BLUE "\033[34m"

// --- 日志标签统一颜色（蓝色）---
// NOTE: 所有 [MoveTable], [PruneTable], [CACHE], [LOAD] 等标签统一使用此颜色
#define TAG_COLOR "\033[34m"

// --- 日志开关 ---
// NOTE: 批量求解和验证程序中关闭建表输出，错误信息不受影响
inline std::atomic<bool> g_quietLog{false};
inline bool log_enabled() { return !g_quietLog.load(std::memory_order_relaxed); }

// --- Logo 和打印函数 ---
void printSolverLogo();
void printTableInfo(const std::string &category, const std::string &filename,
                    size_t sizeBytes);
bool fileExists(const std::string &filename);
std::string formatFileSize(size_t bytes);

// --- 尺寸常量 ---
constexpr int N_MOVES = 18;
constexpr int N_PHASE2_MOVES = 10;
constexpr int MOVE_NONE = 18; // "无上一步" 哨兵，对应 valid_moves_flat[18]

constexpr int N_C_ORI = 2187;          // 3^7
constexpr int N_C_PRM = 40320;         // 8!
constexpr int N_E_ORI = 2048;          // 2^11
constexpr int N_SLICE_LOC = 495;       // C(12,4)
constexpr int N_SLICE_PRM = 24;        // 4!
constexpr int N_NON_SLICE_PRM = 40320; // 8!

// Phase 1 到子群的最大距离（子群直径）
constexpr int MAX_PHASE1_DEPTH = 12;

// --- 全局变量 ---
extern int valid_moves_flat[19][18];
extern int valid_moves_count[19];
extern int phase2_moves_flat[19][10];
extern int phase2_moves_count[19];
extern uint32_t valid_moves_mask[19];
extern const int phase2_moves[N_PHASE2_MOVES];
extern const int phase2_move_index[N_MOVES];
extern const uint32_t phase2_moves_mask;
extern std::vector<std::string> move_names;

// 已加载表的总大小（字节）
// NOTE: 用于显示实际加载的移动表和剪枝表的内存占用
inline std::atomic<size_t> g_loadedTableBytes{0};

// --- 魔方状态定义 ---
// cp/ep: 位置 i 上是哪个块; co/eo: 该位置上的朝向
// 角块 0..3 为 U 层 (UBL UBR UFR UFL)，4..7 为 D 层 (DBL DBR DFR DFL)
// 棱块 0..3 为中层 (BL BR FR FL)，4..7 为 U 层，8..11 为 D 层
struct State {
  std::array<int, 8> cp, co;
  std::array<int, 12> ep, eo;

  State()
      : cp{0, 1, 2, 3, 4, 5, 6, 7}, co{0, 0, 0, 0, 0, 0, 0, 0},
        ep{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11},
        eo{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0} {}
  State(const std::array<int, 8> &c_p, const std::array<int, 8> &c_o,
        const std::array<int, 12> &e_p, const std::array<int, 12> &e_o)
      : cp(c_p), co(c_o), ep(e_p), eo(e_o) {}

  State apply_move(const State &m) const;
  State apply_move(int move) const;
  State apply_alg(const std::vector<int> &alg) const;

  bool is_solved() const;
  bool in_subgroup() const;

  // 坐标
  int c_ori() const;
  int c_prm() const;
  int e_ori() const;
  int slice_loc() const;
  int slice_prm() const;
  int non_slice_prm() const;

  bool operator==(const State &o) const {
    return cp == o.cp && co == o.co && ep == o.ep && eo == o.eo;
  }
  bool operator!=(const State &o) const { return !(*this == o); }
};

extern std::unordered_map<std::string, State> moves_map;
const State &move_state(int move);

// --- 坐标种类 ---
enum class CoordKind { CornerOri, CornerPrm, EdgeOri, SliceLoc, SlicePrm, NonSlicePrm };

int coordinate(const State &s, CoordKind kind);
int coordinate_size(CoordKind kind);
const char *coordinate_name(CoordKind kind);
// 构造一个代表状态：该坐标取 value，其余部分为还原态
// NOTE: SlicePrm/NonSlicePrm 的代表状态中层棱块在原位（Phase 2 子群内）
State state_from_coordinate(CoordKind kind, int value);

// 检查状态是否为合法（可达）魔方，不合法时写入原因
bool verify_state(const State &s, std::string &error);

// --- 工具函数声明 ---
void init_matrix();
inline int inverse_move(int m) { return m / 3 * 3 + 2 - m % 3; }
inline bool is_phase2_move(int m) { return (phase2_moves_mask >> m) & 1; }

bool parse_alg(const std::string &str, std::vector<int> &alg,
               std::string &error);
std::string alg_to_string(const std::vector<int> &alg);
std::vector<int> inverse_alg(const std::vector<int> &alg);
std::vector<int> random_alg(std::mt19937 &rng, int length);

// --- 排列组合索引 ---
long long factorial(int n);
int binomial(int n, int k);
int permutation_index(const int *perm, int n);
void nth_permutation(int index, int n, int *out);
int combination_index(int n, const int *comb, int k);
void nth_combination(int n, int k, int index, int *out);
bool is_even_permutation(const int *perm, int n);

#endif // CUBE_COMMON_H
