/*
 * table_generator.cpp - 移动表和剪枝表生成工具
 */

#include "cube_common.h"
#include "solver_tables.h"
#include <iostream>

int main(int argc, char **argv) {
  // 打印 2PHASE Logo
  printSolverLogo();

  std::string dir = ".";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--tables" && i + 1 < argc) {
      dir = argv[++i];
    } else {
      std::cout << "Usage: table_generator [--tables DIR]" << std::endl;
      return a == "--help" || a == "-h" ? 0 : 1;
    }
  }

  std::cout << "Checking and generating tables if necessary..." << std::endl;

  try {
    auto tables = SolverTables::load_or_build(dir, true, true);

    const auto &cache = tables->cache();
    for (CoordKind kind :
         {CoordKind::CornerOri, CoordKind::CornerPrm, CoordKind::EdgeOri,
          CoordKind::SliceLoc, CoordKind::SlicePrm, CoordKind::NonSlicePrm}) {
      printTableInfo("MoveTable",
                     cache.path_for(MoveTableManager::fileKind(kind)),
                     tables->moves().getTable(kind).size() * sizeof(int));
    }
    const auto &ptm = tables->prunes();
    printTableInfo("PruneTable", cache.path_for("prune_table_corners"),
                   ptm.getCornersPrune().size());
    printTableInfo("PruneTable", cache.path_for("prune_table_coset_flip"),
                   ptm.getFlipDirections().size() * sizeof(uint64_t));
    printTableInfo("PruneTable", cache.path_for("prune_table_coset_twist"),
                   ptm.getTwistDirections().size() * sizeof(uint64_t));
    printTableInfo("PruneTable", cache.path_for("prune_table_subset_corner"),
                   ptm.getSubsetCornerPrune().size());
    printTableInfo("PruneTable", cache.path_for("prune_table_subset_edge"),
                   ptm.getSubsetEdgePrune().size());
  } catch (const std::exception &e) {
    std::cout << ANSI_RED << "[ERROR] " << e.what() << ANSI_RESET << std::endl;
    return 1;
  }

  std::cout << "\nAll tables are ready. Total: "
            << formatFileSize(g_loadedTableBytes.load()) << std::endl;

  return 0;
}
