/*
 * table_cache.h - 表文件缓存（加载 / 生成 / 持久化）
 *
 * 文件格式:
 *   magic[8] "2PHTBL\0\0" | version u32 | kind[32] | elem_size u32 |
 *   count u64 | checksum u64 (FNV-1a, 仅负载) | payload
 */

#ifndef TABLE_CACHE_H
#define TABLE_CACHE_H

#include "cube_common.h"

constexpr uint32_t TABLE_FORMAT_VERSION = 1;
constexpr size_t TABLE_KIND_LEN = 32;
constexpr size_t TABLE_CHUNK_BYTES = (size_t)64 * 1024 * 1024; // 64MB

// NOTE: 超过此阈值的表加载时显示进度条
constexpr size_t LARGE_TABLE_THRESHOLD = (size_t)32 * 1024 * 1024;

struct TableFileHeader {
  char magic[8];
  uint32_t version;
  char kind[TABLE_KIND_LEN];
  uint32_t elem_size;
  uint64_t count;
  uint64_t checksum;
};

// --- 底层辅助 ---
uint64_t fnv1a_update(uint64_t h, const void *data, size_t len);
inline uint64_t fnv1a(const void *data, size_t len) {
  return fnv1a_update(0xcbf29ce484222325ULL, data, len);
}

TableFileHeader make_table_header(const std::string &kind, uint32_t elem_size,
                                  uint64_t count, uint64_t checksum);
// 读取并检查文件头，失败时写入原因
bool read_table_header(std::istream &in, const std::string &kind,
                       uint32_t elem_size, uint64_t count,
                       TableFileHeader &header, std::string &reason);
void write_table_header(std::ostream &out, const TableFileHeader &header);

// 分块读写负载，超过阈值时显示进度条
bool read_payload_chunked(std::istream &in, char *ptr, size_t bytes,
                          const std::string &label);
bool write_payload_chunked(std::ostream &out, const char *ptr, size_t bytes);

// 写入临时文件后原子重命名
bool commit_temp_file(const std::string &tmp, const std::string &path,
                      std::string &reason);
std::string make_temp_path(const std::string &path);

// --- 表缓存 ---
class TableCache {
public:
  explicit TableCache(std::string dir, bool persist = true)
      : dir_(std::move(dir)), persist_(persist) {}

  const std::string &dir() const { return dir_; }
  bool persist() const { return persist_; }
  std::string path_for(const std::string &kind) const;

  // 从文件加载，失败时返回 false 并写入原因
  template <typename T>
  bool load(const std::string &kind, uint64_t count, std::vector<T> &vec,
            std::string &reason) const {
    std::string path = path_for(kind);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      reason = "not found";
      return false;
    }
    TableFileHeader header;
    if (!read_table_header(in, kind, sizeof(T), count, header, reason))
      return false;
    try {
      vec.resize(count);
    } catch (const std::bad_alloc &) {
      reason = "out of memory";
      return false;
    }
    size_t bytes = count * sizeof(T);
    if (!read_payload_chunked(in, reinterpret_cast<char *>(vec.data()), bytes,
                              kind)) {
      reason = "truncated payload";
      return false;
    }
    if (in.peek() != std::char_traits<char>::eof()) {
      reason = "trailing bytes after payload";
      return false;
    }
    if (fnv1a(vec.data(), bytes) != header.checksum) {
      reason = "checksum mismatch";
      return false;
    }
    return true;
  }

  template <typename T>
  bool save(const std::string &kind, const std::vector<T> &vec,
            std::string &reason) const {
    std::string path = path_for(kind);
    std::string tmp = make_temp_path(path);
    size_t bytes = vec.size() * sizeof(T);
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) {
        reason = "cannot create " + tmp;
        return false;
      }
      write_table_header(out, make_table_header(kind, sizeof(T), vec.size(),
                                                fnv1a(vec.data(), bytes)));
      if (!write_payload_chunked(out,
                                 reinterpret_cast<const char *>(vec.data()),
                                 bytes)) {
        reason = "write failed";
        out.close();
        std::remove(tmp.c_str());
        return false;
      }
    }
    return commit_temp_file(tmp, path, reason);
  }

  // 加载缓存，缺失或损坏时生成并持久化
  // BuildFn: () -> std::vector<T>
  // ValidateFn: (const std::vector<T>&, std::string&) -> bool
  template <typename T, typename BuildFn, typename ValidateFn>
  std::vector<T> load_or_build(const std::string &kind, uint64_t count,
                               BuildFn build, ValidateFn validate) const {
    std::vector<T> vec;
    std::string reason;
    if (load(kind, count, vec, reason)) {
      if (validate(vec, reason)) {
        g_loadedTableBytes += vec.size() * sizeof(T);
        if (log_enabled())
          std::cout << TAG_COLOR << "[LOAD]" << ANSI_RESET << " ("
                    << formatFileSize(vec.size() * sizeof(T)) << ") "
                    << kind << ".bin" << std::endl;
        return vec;
      }
      reason = "validation failed: " + reason;
    }
    if (reason != "not found" || log_enabled()) {
      std::cout << TAG_COLOR << "[CACHE]" << ANSI_RESET << " " << kind << ": "
                << reason << ", rebuilding..." << std::endl;
    }

    auto t0 = std::chrono::high_resolution_clock::now();
    vec = build();
    auto t1 = std::chrono::high_resolution_clock::now();
    if (vec.size() != count)
      throw std::logic_error("table " + kind + " built with " +
                             std::to_string(vec.size()) + " entries, expected " +
                             std::to_string(count));
    if (!validate(vec, reason))
      throw std::logic_error("table " + kind +
                             " failed validation after build: " + reason);
    g_loadedTableBytes += vec.size() * sizeof(T);
    if (log_enabled()) {
      std::cout << TAG_COLOR << "[CACHE]" << ANSI_RESET << " Built " << kind
                << " (" << formatFileSize(vec.size() * sizeof(T)) << ") in "
                << std::fixed << std::setprecision(2)
                << std::chrono::duration<double>(t1 - t0).count() << "s"
                << std::endl;
    }

    if (persist_) {
      if (save(kind, vec, reason)) {
        if (log_enabled())
          std::cout << TAG_COLOR << "[CACHE]" << ANSI_RESET << " Saved "
                    << path_for(kind) << std::endl;
      } else {
        std::cout << ANSI_YELLOW << "[WARN] Could not persist " << kind << ": "
                  << reason << " (continuing in memory)" << ANSI_RESET
                  << std::endl;
      }
    }
    return vec;
  }

private:
  std::string dir_;
  bool persist_;
};

#endif // TABLE_CACHE_H
