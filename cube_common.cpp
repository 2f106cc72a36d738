/*
 * cube_common.cpp - 魔方公共实现
 */

#include "cube_common.h"

#include <mutex>

// --- Logo 和打印函数实现 ---

// 检查文件是否存在
bool fileExists(const std::string &filename) {
  std::ifstream f(filename);
  return f.good();
}

// 格式化文件大小
std::string formatFileSize(size_t bytes) {
  std::ostringstream oss;
  if (bytes >= 1024 * 1024 * 1024) {
    oss << std::fixed << std::setprecision(2)
        << (bytes / (1024.0 * 1024.0 * 1024.0)) << " GB";
  } else if (bytes >= 1024 * 1024) {
    oss << std::fixed << std::setprecision(2) << (bytes / (1024.0 * 1024.0))
        << " MB";
  } else if (bytes >= 1024) {
    oss << std::fixed << std::setprecision(2) << (bytes / 1024.0) << " KB";
  } else {
    oss << bytes << " B";
  }
  return oss.str();
}

// 打印表信息（统一格式）
void printTableInfo(const std::string &category, const std::string &filename,
                    size_t sizeBytes) {
  if (!log_enabled())
    return;
  std::cout << ANSI_BLUE << "[" << category << "]" << ANSI_RESET
            << " Ready: " << filename << " (" << formatFileSize(sizeBytes)
            << ")" << std::endl;
}

// 打印 2PHASE Logo（像素艺术+渐变色）
void printSolverLogo() {
  const char *gradients[] = {
      "\033[38;5;105m", // 淡紫色
      "\033[38;5;141m", // 紫色
      "\033[38;5;177m", // 粉紫色
      "\033[38;5;213m", // 粉色
      "\033[38;5;219m", // 淡粉色
      "\033[38;5;225m"  // 浅粉色
  };

  const char *lines[] = {" @@@@   @@@@@   @    @    @@     @@@@@  @@@@@@",
                         "@    @  @    @  @    @   @  @   @       @     ",
                         "    @   @@@@@   @@@@@@  @    @   @@@@   @@@@@ ",
                         "   @    @       @    @  @@@@@@       @  @     ",
                         "  @     @       @    @  @    @       @  @     ",
                         "@@@@@@  @       @    @  @    @  @@@@@   @@@@@@"};

  std::cout << std::endl;
  for (int i = 0; i < 6; ++i) {
    std::cout << gradients[i] << lines[i] << ANSI_RESET << std::endl;
  }
  std::cout << std::endl;
}

// --- 全局变量定义 ---
int valid_moves_flat[19][18];
int valid_moves_count[19];
int phase2_moves_flat[19][10];
int phase2_moves_count[19];
uint32_t valid_moves_mask[19];
std::vector<std::string> move_names = {"U", "U2", "U'", "D", "D2", "D'",
                                       "L", "L2", "L'", "R", "R2", "R'",
                                       "F", "F2", "F'", "B", "B2", "B'"};

// Phase 2 生成元: U, U2, U', D, D2, D', L2, R2, F2, B2
const int phase2_moves[N_PHASE2_MOVES] = {0, 1, 2, 3, 4, 5, 7, 10, 13, 16};
const int phase2_move_index[N_MOVES] = {0,  1, 2,  3,  4, 5, -1, 6,  -1,
                                        -1, 7, -1, -1, 8, -1, -1, 9, -1};
const uint32_t phase2_moves_mask = (1u << 0) | (1u << 1) | (1u << 2) |
                                   (1u << 3) | (1u << 4) | (1u << 5) |
                                   (1u << 7) | (1u << 10) | (1u << 13) |
                                   (1u << 16);

// 魔方状态定义
std::unordered_map<std::string, State> moves_map = {
    {"U", State({3, 0, 1, 2, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0},
                {0, 1, 2, 3, 7, 4, 5, 6, 8, 9, 10, 11},
                {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"U2", State({2, 3, 0, 1, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 1, 2, 3, 6, 7, 4, 5, 8, 9, 10, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"U'", State({1, 2, 3, 0, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 1, 2, 3, 5, 6, 7, 4, 8, 9, 10, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"D", State({0, 1, 2, 3, 5, 6, 7, 4}, {0, 0, 0, 0, 0, 0, 0, 0},
                {0, 1, 2, 3, 4, 5, 6, 7, 9, 10, 11, 8},
                {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"D2", State({0, 1, 2, 3, 6, 7, 4, 5}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 1, 2, 3, 4, 5, 6, 7, 10, 11, 8, 9},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"D'", State({0, 1, 2, 3, 7, 4, 5, 6}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 1, 2, 3, 4, 5, 6, 7, 11, 8, 9, 10},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"L", State({4, 1, 2, 0, 7, 5, 6, 3}, {2, 0, 0, 1, 1, 0, 0, 2},
                {11, 1, 2, 7, 4, 5, 6, 0, 8, 9, 10, 3},
                {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"L2", State({7, 1, 2, 4, 3, 5, 6, 0}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {3, 1, 2, 0, 4, 5, 6, 11, 8, 9, 10, 7},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"L'", State({3, 1, 2, 7, 0, 5, 6, 4}, {2, 0, 0, 1, 1, 0, 0, 2},
                 {7, 1, 2, 11, 4, 5, 6, 3, 8, 9, 10, 0},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"R", State({0, 2, 6, 3, 4, 1, 5, 7}, {0, 1, 2, 0, 0, 2, 1, 0},
                {0, 5, 9, 3, 4, 2, 6, 7, 8, 1, 10, 11},
                {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"R2", State({0, 6, 5, 3, 4, 2, 1, 7}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 2, 1, 3, 4, 9, 6, 7, 8, 5, 10, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"R'", State({0, 5, 1, 3, 4, 6, 2, 7}, {0, 1, 2, 0, 0, 2, 1, 0},
                 {0, 9, 5, 3, 4, 1, 6, 7, 8, 2, 10, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"F", State({0, 1, 3, 7, 4, 5, 2, 6}, {0, 0, 1, 2, 0, 0, 2, 1},
                {0, 1, 6, 10, 4, 5, 3, 7, 8, 9, 2, 11},
                {0, 0, 1, 1, 0, 0, 1, 0, 0, 0, 1, 0})},
    {"F2", State({0, 1, 7, 6, 4, 5, 3, 2}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {0, 1, 3, 2, 4, 5, 10, 7, 8, 9, 6, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"F'", State({0, 1, 6, 2, 4, 5, 7, 3}, {0, 0, 1, 2, 0, 0, 2, 1},
                 {0, 1, 10, 6, 4, 5, 2, 7, 8, 9, 3, 11},
                 {0, 0, 1, 1, 0, 0, 1, 0, 0, 0, 1, 0})},
    {"B", State({1, 5, 2, 3, 0, 4, 6, 7}, {1, 2, 0, 0, 2, 1, 0, 0},
                {4, 8, 2, 3, 1, 5, 6, 7, 0, 9, 10, 11},
                {1, 1, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0})},
    {"B2", State({5, 4, 2, 3, 1, 0, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0},
                 {1, 0, 2, 3, 8, 5, 6, 7, 4, 9, 10, 11},
                 {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0})},
    {"B'", State({4, 0, 2, 3, 5, 1, 6, 7}, {1, 2, 0, 0, 2, 1, 0, 0},
                 {8, 4, 2, 3, 0, 5, 6, 7, 1, 9, 10, 11},
                 {1, 1, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0})}};

// 按移动编号查表（首次调用时由 moves_map 展开）
const State &move_state(int move) {
  static const std::vector<State> table = []() {
    std::vector<State> t;
    t.reserve(N_MOVES);
    for (int m = 0; m < N_MOVES; ++m)
      t.push_back(moves_map.at(move_names[m]));
    return t;
  }();
  return table[move];
}

// --- State 方法实现 ---
State State::apply_move(const State &m) const {
  State n;
  for (int i = 0; i < 8; ++i) {
    n.cp[i] = cp[m.cp[i]];
    n.co[i] = (co[m.cp[i]] + m.co[i]) % 3;
  }
  for (int i = 0; i < 12; ++i) {
    n.ep[i] = ep[m.ep[i]];
    n.eo[i] = (eo[m.ep[i]] + m.eo[i]) % 2;
  }
  return n;
}

State State::apply_move(int move) const { return apply_move(move_state(move)); }

State State::apply_alg(const std::vector<int> &alg) const {
  State s = *this;
  for (int m : alg)
    s = s.apply_move(m);
  return s;
}

bool State::is_solved() const { return *this == State(); }

bool State::in_subgroup() const {
  static const int solved_loc = State().slice_loc();
  return c_ori() == 0 && e_ori() == 0 && slice_loc() == solved_loc;
}

int State::c_ori() const {
  int idx = 0;
  for (int i = 6; i >= 0; --i)
    idx = idx * 3 + co[i];
  return idx;
}

int State::c_prm() const { return permutation_index(cp.data(), 8); }

int State::e_ori() const {
  int idx = 0;
  for (int i = 0; i < 11; ++i)
    idx |= eo[i] << i;
  return idx;
}

// 中层棱块 (编号 0..3) 所在的 4 个位置
int State::slice_loc() const {
  int loc[4], j = 0;
  for (int i = 0; i < 12; ++i)
    if (ep[i] < 4)
      loc[j++] = i;
  return combination_index(12, loc, 4);
}

int State::slice_prm() const {
  int p[4], j = 0;
  for (int i = 0; i < 12; ++i)
    if (ep[i] < 4)
      p[j++] = ep[i];
  return permutation_index(p, 4);
}

int State::non_slice_prm() const {
  int p[8], j = 0;
  for (int i = 0; i < 12; ++i)
    if (ep[i] >= 4)
      p[j++] = ep[i] - 4;
  return permutation_index(p, 8);
}

// --- 坐标 ---
int coordinate(const State &s, CoordKind kind) {
  switch (kind) {
  case CoordKind::CornerOri:
    return s.c_ori();
  case CoordKind::CornerPrm:
    return s.c_prm();
  case CoordKind::EdgeOri:
    return s.e_ori();
  case CoordKind::SliceLoc:
    return s.slice_loc();
  case CoordKind::SlicePrm:
    return s.slice_prm();
  case CoordKind::NonSlicePrm:
    return s.non_slice_prm();
  }
  return -1;
}

int coordinate_size(CoordKind kind) {
  switch (kind) {
  case CoordKind::CornerOri:
    return N_C_ORI;
  case CoordKind::CornerPrm:
    return N_C_PRM;
  case CoordKind::EdgeOri:
    return N_E_ORI;
  case CoordKind::SliceLoc:
    return N_SLICE_LOC;
  case CoordKind::SlicePrm:
    return N_SLICE_PRM;
  case CoordKind::NonSlicePrm:
    return N_NON_SLICE_PRM;
  }
  return 0;
}

const char *coordinate_name(CoordKind kind) {
  switch (kind) {
  case CoordKind::CornerOri:
    return "c_ori";
  case CoordKind::CornerPrm:
    return "c_prm";
  case CoordKind::EdgeOri:
    return "e_ori";
  case CoordKind::SliceLoc:
    return "slice_loc";
  case CoordKind::SlicePrm:
    return "slice_prm";
  case CoordKind::NonSlicePrm:
    return "non_slice_prm";
  }
  return "?";
}

State state_from_coordinate(CoordKind kind, int value) {
  State s;
  switch (kind) {
  case CoordKind::CornerOri: {
    int sum = 0;
    for (int i = 0; i < 7; ++i) {
      s.co[i] = value % 3;
      sum += s.co[i];
      value /= 3;
    }
    s.co[7] = (3 - sum % 3) % 3;
    break;
  }
  case CoordKind::CornerPrm:
    nth_permutation(value, 8, s.cp.data());
    break;
  case CoordKind::EdgeOri: {
    int sum = 0;
    for (int i = 0; i < 11; ++i) {
      s.eo[i] = (value >> i) & 1;
      sum += s.eo[i];
    }
    s.eo[11] = sum & 1;
    break;
  }
  case CoordKind::SliceLoc: {
    int loc[4];
    nth_combination(12, 4, value, loc);
    int next_slice = 0, next_other = 4, j = 0;
    for (int i = 0; i < 12; ++i) {
      if (j < 4 && loc[j] == i) {
        s.ep[i] = next_slice++;
        ++j;
      } else {
        s.ep[i] = next_other++;
      }
    }
    break;
  }
  case CoordKind::SlicePrm:
    nth_permutation(value, 4, s.ep.data());
    break;
  case CoordKind::NonSlicePrm: {
    int p[8];
    nth_permutation(value, 8, p);
    for (int i = 0; i < 8; ++i)
      s.ep[4 + i] = 4 + p[i];
    break;
  }
  }
  return s;
}

bool verify_state(const State &s, std::string &error) {
  int seen_c = 0, seen_e = 0, twist = 0, flip = 0;
  for (int i = 0; i < 8; ++i) {
    if (s.cp[i] < 0 || s.cp[i] > 7 || (seen_c >> s.cp[i]) & 1) {
      error = "corner permutation is not a permutation of 0..7";
      return false;
    }
    seen_c |= 1 << s.cp[i];
    if (s.co[i] < 0 || s.co[i] > 2) {
      error = "corner orientation out of range at position " +
              std::to_string(i);
      return false;
    }
    twist += s.co[i];
  }
  for (int i = 0; i < 12; ++i) {
    if (s.ep[i] < 0 || s.ep[i] > 11 || (seen_e >> s.ep[i]) & 1) {
      error = "edge permutation is not a permutation of 0..11";
      return false;
    }
    seen_e |= 1 << s.ep[i];
    if (s.eo[i] < 0 || s.eo[i] > 1) {
      error = "edge orientation out of range at position " + std::to_string(i);
      return false;
    }
    flip += s.eo[i];
  }
  if (twist % 3 != 0) {
    error = "corner twist sum is not a multiple of 3";
    return false;
  }
  if (flip % 2 != 0) {
    error = "edge flip sum is odd";
    return false;
  }
  if (is_even_permutation(s.cp.data(), 8) !=
      is_even_permutation(s.ep.data(), 12)) {
    error = "corner and edge permutation parities differ";
    return false;
  }
  return true;
}

// --- 初始化矩阵 ---
void init_matrix() {
  static std::once_flag once;
  std::call_once(once, []() {
    for (int prev = 0; prev <= 18; ++prev) {
      int cnt = 0, cnt2 = 0;
      valid_moves_mask[prev] = 0;
      for (int i = 0; i < 18; ++i) {
        // 同面连续、或对面逆序 (D 后接 U 等) 均为冗余
        bool bad = (prev < 18) &&
                   (i / 3 == prev / 3 || ((i / 3) / 2 == (prev / 3) / 2 &&
                                          (prev / 3) % 2 > (i / 3) % 2));
        if (bad)
          continue;
        valid_moves_flat[prev][cnt++] = i;
        valid_moves_mask[prev] |= 1u << i;
        if (is_phase2_move(i))
          phase2_moves_flat[prev][cnt2++] = i;
      }
      valid_moves_count[prev] = cnt;
      phase2_moves_count[prev] = cnt2;
    }
  });
}

// --- 实用函数 ---
bool parse_alg(const std::string &str, std::vector<int> &alg,
               std::string &error) {
  static const std::string faces = "UDLRFB";
  alg.clear();
  std::istringstream iss(str);
  std::string name;
  while (iss >> name) {
    size_t f = faces.find(name[0]);
    if (f == std::string::npos) {
      error = "unknown move '" + name + "'";
      return false;
    }
    std::string suffix = name.substr(1);
    int pow = -1;
    if (suffix.empty() || suffix == "1")
      pow = 0;
    else if (suffix == "2" || suffix == "2'")
      pow = 1;
    else if (suffix == "'" || suffix == "3")
      pow = 2;
    if (pow < 0) {
      error = "unknown move '" + name + "'";
      return false;
    }
    alg.push_back(static_cast<int>(f) * 3 + pow);
  }
  return true;
}

std::string alg_to_string(const std::vector<int> &alg) {
  std::string out;
  for (size_t i = 0; i < alg.size(); ++i) {
    if (i)
      out += ' ';
    out += move_names[alg[i]];
  }
  return out;
}

std::vector<int> inverse_alg(const std::vector<int> &alg) {
  std::vector<int> inv(alg.rbegin(), alg.rend());
  for (int &m : inv)
    m = inverse_move(m);
  return inv;
}

// 随机打乱，不产生同面连续或对面逆序的冗余步
std::vector<int> random_alg(std::mt19937 &rng, int length) {
  init_matrix();
  std::vector<int> alg;
  alg.reserve(length);
  int prev = MOVE_NONE;
  for (int i = 0; i < length; ++i) {
    std::uniform_int_distribution<int> dist(0, valid_moves_count[prev] - 1);
    int m = valid_moves_flat[prev][dist(rng)];
    alg.push_back(m);
    prev = m;
  }
  return alg;
}

// --- 排列组合索引 ---
long long factorial(int n) {
  static const long long table[13] = {1,       1,        2,         6,
                                      24,      120,      720,       5040,
                                      40320,   362880,   3628800,   39916800,
                                      479001600};
  return table[n];
}

int binomial(int n, int k) {
  if (k < 0 || k > n)
    return 0;
  static const std::array<std::array<int, 13>, 13> pascal = []() {
    std::array<std::array<int, 13>, 13> b{};
    for (int i = 0; i <= 12; ++i) {
      b[i][0] = 1;
      for (int j = 1; j <= i; ++j)
        b[i][j] = b[i - 1][j - 1] + (j < i ? b[i - 1][j] : 0);
    }
    return b;
  }();
  return pascal[n][k];
}

// 字典序排名
int permutation_index(const int *perm, int n) {
  int idx = 0;
  for (int i = 0; i < n; ++i) {
    int smaller = 0;
    for (int j = i + 1; j < n; ++j)
      if (perm[j] < perm[i])
        smaller++;
    idx += smaller * static_cast<int>(factorial(n - 1 - i));
  }
  return idx;
}

void nth_permutation(int index, int n, int *out) {
  int unused[12];
  for (int i = 0; i < n; ++i)
    unused[i] = i;
  int remain = n;
  for (int i = 0; i < n; ++i) {
    int f = static_cast<int>(factorial(n - 1 - i));
    int pos = index / f;
    index %= f;
    out[i] = unused[pos];
    for (int j = pos; j < remain - 1; ++j)
      unused[j] = unused[j + 1];
    remain--;
  }
}

// comb 为升序的 k 个位置，返回在 C(n,k) 字典序中的排名
int combination_index(int n, const int *comb, int k) {
  int idx = 0, j = 0;
  for (int i = 0; i < k; ++i) {
    j++;
    while (j < comb[i] + 1) {
      idx += binomial(n - j, k - i - 1);
      j++;
    }
  }
  return idx;
}

void nth_combination(int n, int k, int index, int *out) {
  int size = 0;
  for (int i = 0; i < n && size < k; ++i) {
    int count = binomial(n - 1 - i, k - size - 1);
    if (count > index) {
      out[size++] = i;
    } else {
      index -= count;
    }
  }
}

bool is_even_permutation(const int *perm, int n) {
  int inversions = 0;
  for (int i = 0; i < n; ++i)
    for (int j = i + 1; j < n; ++j)
      if (perm[i] > perm[j])
        inversions++;
  return inversions % 2 == 0;
}
