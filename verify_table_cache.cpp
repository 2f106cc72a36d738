/*
 * verify_table_cache.cpp - 表文件缓存验证
 *
 * 在 argv[1]/cache_test 下读写小表，检查各种损坏文件都被拒绝并重新生成。
 */

#include "table_cache.h"
#include "verify_common.h"
#include <filesystem>

namespace fs = std::filesystem;

// 文件头固定 64 字节: magic 8 | version 4 | kind 32 | elem_size 4 | count 8 | checksum 8
constexpr std::streamoff HEADER_BYTES = 64;
constexpr std::streamoff VERSION_OFFSET = 8;

static std::vector<int> sample_table() {
  std::vector<int> v(1000);
  for (int i = 0; i < (int)v.size(); ++i)
    v[i] = (i * 7919) % 1013;
  return v;
}

static void patch_byte(const std::string &path, std::streamoff offset,
                       char value) {
  std::fstream f(path, std::ios::binary | std::ios::in | std::ios::out);
  f.seekp(offset);
  f.write(&value, 1);
}

static void append_byte(const std::string &path) {
  std::ofstream f(path, std::ios::binary | std::ios::app);
  f.put('x');
}

int main(int argc, char **argv) {
  std::cout << "=== Table Cache Verification ===" << std::endl;
  init_matrix();
  g_quietLog = true;

  fs::path dir = fs::path(verify_table_dir(argc, argv)) / "cache_test";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  VERIFY(!ec, "create " << dir.string());

  TableCache cache(dir.string());
  const std::vector<int> table = sample_table();
  const std::string kind = "sample_table";
  const std::string path = cache.path_for(kind);
  std::string reason;
  std::vector<int> loaded;

  verify_section("Round trip");
  VERIFY(path == (dir / "sample_table.bin").string(), "file name: " << path);
  VERIFY(cache.save(kind, table, reason), "save: " << reason);
  VERIFY(fileExists(path), "file written");
  VERIFY((std::streamoff)fs::file_size(path) ==
             HEADER_BYTES + (std::streamoff)(table.size() * sizeof(int)),
         "file size is header + payload");
  VERIFY(cache.load(kind, table.size(), loaded, reason), "load: " << reason);
  VERIFY(loaded == table, "loaded table equals saved table");
  bool leftover = false;
  for (const auto &e : fs::directory_iterator(dir))
    if (e.path().string().find(".tmp.") != std::string::npos)
      leftover = true;
  VERIFY(!leftover, "no temporary file left behind");

  verify_section("Rejected files");
  VERIFY(!cache.load("missing_table", 10, loaded, reason), "missing file");
  VERIFY(reason == "not found", "missing reason: " << reason);

  VERIFY(!cache.load("other_table", table.size(), loaded, reason),
         "missing kind file");
  fs::copy_file(path, cache.path_for("other_table"),
                fs::copy_options::overwrite_existing, ec);
  VERIFY(!cache.load("other_table", table.size(), loaded, reason),
         "wrong kind rejected");
  VERIFY(reason.find("kind") != std::string::npos, "kind reason: " << reason);

  VERIFY(!cache.load(kind, table.size() + 1, loaded, reason),
         "wrong count rejected");
  VERIFY(reason.find("count") != std::string::npos, "count reason: " << reason);

  std::vector<long long> wide;
  VERIFY(!cache.load(kind, table.size(), wide, reason),
         "wrong element size rejected");

  patch_byte(path, VERSION_OFFSET, 99);
  VERIFY(!cache.load(kind, table.size(), loaded, reason),
         "wrong version rejected");
  VERIFY(reason.find("version") != std::string::npos,
         "version reason: " << reason);
  VERIFY(cache.save(kind, table, reason), "rewrite");

  patch_byte(path, 0, 'X');
  VERIFY(!cache.load(kind, table.size(), loaded, reason), "bad magic rejected");
  VERIFY(cache.save(kind, table, reason), "rewrite");

  patch_byte(path, HEADER_BYTES + 123, 0x5A);
  VERIFY(!cache.load(kind, table.size(), loaded, reason),
         "corrupted payload rejected");
  VERIFY(reason == "checksum mismatch", "checksum reason: " << reason);
  VERIFY(cache.save(kind, table, reason), "rewrite");

  append_byte(path);
  VERIFY(!cache.load(kind, table.size(), loaded, reason),
         "trailing bytes rejected");
  VERIFY(cache.save(kind, table, reason), "rewrite");

  fs::resize_file(path, HEADER_BYTES + 100, ec);
  VERIFY(!ec, "truncate file");
  VERIFY(!cache.load(kind, table.size(), loaded, reason),
         "truncated payload rejected");

  fs::resize_file(path, 20, ec);
  VERIFY(!cache.load(kind, table.size(), loaded, reason),
         "truncated header rejected");

  verify_section("load_or_build");
  int builds = 0;
  auto build = [&]() {
    builds++;
    return sample_table();
  };
  auto always_ok = [](const std::vector<int> &, std::string &) { return true; };

  std::vector<int> v = cache.load_or_build<int>(kind, table.size(), build,
                                                always_ok);
  VERIFY(builds == 1 && v == table, "truncated file rebuilt");
  v = cache.load_or_build<int>(kind, table.size(), build, always_ok);
  VERIFY(builds == 1 && v == table, "rebuilt file loaded without building");

  patch_byte(path, HEADER_BYTES + 5, 0x11);
  v = cache.load_or_build<int>(kind, table.size(), build, always_ok);
  VERIFY(builds == 2 && v == table, "corrupted file rebuilt");

  // 首次加载校验失败（内容被篡改但校验和一致）时重新生成
  std::vector<int> bogus(table.size(), 0);
  VERIFY(cache.save(kind, bogus, reason), "save bogus table");
  auto not_all_zero = [](const std::vector<int> &t, std::string &why) {
    for (int x : t)
      if (x != 0)
        return true;
    why = "all zero";
    return false;
  };
  v = cache.load_or_build<int>(kind, table.size(), build, not_all_zero);
  VERIFY(builds == 3 && v == table, "validation failure rebuilt");
  VERIFY(cache.load(kind, table.size(), loaded, reason) && loaded == table,
         "rebuilt table persisted");

  bool threw = false;
  try {
    cache.load_or_build<int>("bad_build", 5, build, always_ok);
  } catch (const std::logic_error &) {
    threw = true;
  }
  VERIFY(threw, "built table with wrong size throws");

  verify_section("In-memory cache");
  TableCache memory(dir.string(), false);
  v = memory.load_or_build<int>("memory_table", table.size(), build, always_ok);
  VERIFY(v == table, "in-memory build returns the table");
  VERIFY(!fileExists(memory.path_for("memory_table")),
         "persist=false writes no file");

  verify_section("Unwritable directory");
  TableCache nowhere((dir / "does" / "not" / "exist").string());
  int before = builds;
  v = nowhere.load_or_build<int>(kind, table.size(), build, always_ok);
  VERIFY(builds == before + 1 && v == table,
         "save failure still returns the built table");

  fs::remove_all(dir, ec);
  return verify_report("verify_table_cache");
}
