/*
 * move_tables.cpp - 移动表实现
 */

#include "move_tables.h"

void MoveTableManager::initialize() {
  if (log_enabled())
    std::cout << TAG_COLOR << "[MoveTable]" << ANSI_RESET
              << " Initializing move tables..." << std::endl;

  const CoordKind kinds[N_KINDS] = {
      CoordKind::CornerOri, CoordKind::CornerPrm, CoordKind::EdgeOri,
      CoordKind::SliceLoc,  CoordKind::SlicePrm,  CoordKind::NonSlicePrm};
  for (CoordKind kind : kinds) {
    uint64_t count = (uint64_t)coordinate_size(kind) * move_table_width(kind);
    tables_[static_cast<int>(kind)] = cache_.load_or_build<int>(
        fileKind(kind), count, [kind]() { return create_move_table(kind); },
        [kind](const std::vector<int> &mt, std::string &reason) {
          return check_move_table(kind, mt, reason);
        });
  }

  if (log_enabled())
    std::cout << TAG_COLOR << "[MoveTable]" << ANSI_RESET
              << " All move tables initialized." << std::endl;
}

// --- 移动表生成 ---
std::vector<int> create_move_table(CoordKind kind) {
  init_matrix();
  const int size = coordinate_size(kind);
  const int width = move_table_width(kind);
  std::vector<int> mt((size_t)size * width, -1);

  if (log_enabled())
    std::cout << TAG_COLOR << "[MoveTable]" << ANSI_RESET << " Generating "
              << coordinate_name(kind) << " (" << size << " x " << width
              << ")..." << std::endl;

#pragma omp parallel for schedule(static)
  for (int i = 0; i < size; ++i) {
    State s = state_from_coordinate(kind, i);
    for (int k = 0; k < width; ++k) {
      int m = (width == N_MOVES) ? k : phase2_moves[k];
      mt[(size_t)i * width + k] = coordinate(s.apply_move(m), kind);
    }
  }
  return mt;
}

bool check_move_table(CoordKind kind, const std::vector<int> &mt,
                      std::string &reason) {
  const int size = coordinate_size(kind);
  for (size_t i = 0; i < mt.size(); ++i) {
    if (mt[i] < 0 || mt[i] >= size) {
      reason = std::string(coordinate_name(kind)) + " entry " +
               std::to_string(i) + " out of range";
      return false;
    }
  }
  return true;
}
