/*
 * table_cache.cpp - 表文件缓存实现
 */

#include "table_cache.h"

#include <filesystem>

static const char TABLE_MAGIC[8] = {'2', 'P', 'H', 'T', 'B', 'L', 0, 0};

uint64_t fnv1a_update(uint64_t h, const void *data, size_t len) {
  const unsigned char *p = static_cast<const unsigned char *>(data);
  for (size_t i = 0; i < len; ++i) {
    h ^= p[i];
    h *= 0x100000001b3ULL;
  }
  return h;
}

TableFileHeader make_table_header(const std::string &kind, uint32_t elem_size,
                                  uint64_t count, uint64_t checksum) {
  TableFileHeader h;
  std::memcpy(h.magic, TABLE_MAGIC, sizeof(h.magic));
  h.version = TABLE_FORMAT_VERSION;
  std::memset(h.kind, 0, sizeof(h.kind));
  std::strncpy(h.kind, kind.c_str(), TABLE_KIND_LEN - 1);
  h.elem_size = elem_size;
  h.count = count;
  h.checksum = checksum;
  return h;
}

// NOTE: 逐字段读写，避免结构体填充字节进入文件
void write_table_header(std::ostream &out, const TableFileHeader &h) {
  out.write(h.magic, sizeof(h.magic));
  out.write(reinterpret_cast<const char *>(&h.version), sizeof(h.version));
  out.write(h.kind, sizeof(h.kind));
  out.write(reinterpret_cast<const char *>(&h.elem_size), sizeof(h.elem_size));
  out.write(reinterpret_cast<const char *>(&h.count), sizeof(h.count));
  out.write(reinterpret_cast<const char *>(&h.checksum), sizeof(h.checksum));
}

bool read_table_header(std::istream &in, const std::string &kind,
                       uint32_t elem_size, uint64_t count, TableFileHeader &h,
                       std::string &reason) {
  in.read(h.magic, sizeof(h.magic));
  in.read(reinterpret_cast<char *>(&h.version), sizeof(h.version));
  in.read(h.kind, sizeof(h.kind));
  in.read(reinterpret_cast<char *>(&h.elem_size), sizeof(h.elem_size));
  in.read(reinterpret_cast<char *>(&h.count), sizeof(h.count));
  in.read(reinterpret_cast<char *>(&h.checksum), sizeof(h.checksum));
  if (!in) {
    reason = "truncated header";
    return false;
  }
  if (std::memcmp(h.magic, TABLE_MAGIC, sizeof(h.magic)) != 0) {
    reason = "bad magic";
    return false;
  }
  if (h.version != TABLE_FORMAT_VERSION) {
    reason = "format version " + std::to_string(h.version) + ", expected " +
             std::to_string(TABLE_FORMAT_VERSION);
    return false;
  }
  h.kind[TABLE_KIND_LEN - 1] = '\0';
  if (kind != h.kind) {
    reason = "kind '" + std::string(h.kind) + "', expected '" + kind + "'";
    return false;
  }
  if (h.elem_size != elem_size) {
    reason = "element size mismatch";
    return false;
  }
  if (h.count != count) {
    reason = "entry count " + std::to_string(h.count) + ", expected " +
             std::to_string(count);
    return false;
  }
  return true;
}

bool read_payload_chunked(std::istream &in, char *ptr, size_t bytes,
                          const std::string &label) {
  size_t remain = bytes;
  bool show_progress = log_enabled() && bytes > LARGE_TABLE_THRESHOLD;
  while (remain > 0) {
    size_t to_read = std::min(remain, TABLE_CHUNK_BYTES);
    in.read(ptr, to_read);
    if (!in)
      return false;
    ptr += to_read;
    remain -= to_read;

    if (show_progress) {
      double progress = (double)(bytes - remain) / bytes * 100.0;
      int bar_width = 30;
      int filled = (int)(progress / 100.0 * bar_width);
      std::string bar(filled, '#');
      bar += std::string(bar_width - filled, '-');
      printf("\033[34m[LOAD]\033[0m (%s) %s: [%s] %.1f%%\r",
             formatFileSize(bytes).c_str(), label.c_str(), bar.c_str(),
             progress);
      fflush(stdout);
    }
  }
  if (show_progress) {
    printf("\r\033[K");
    fflush(stdout);
  }
  return true;
}

bool write_payload_chunked(std::ostream &out, const char *ptr, size_t bytes) {
  size_t remain = bytes;
  while (remain > 0) {
    size_t to_write = std::min(remain, TABLE_CHUNK_BYTES);
    out.write(ptr, to_write);
    if (!out)
      return false;
    ptr += to_write;
    remain -= to_write;
  }
  out.flush();
  return out.good();
}

std::string make_temp_path(const std::string &path) {
  std::random_device rd;
  std::ostringstream oss;
  oss << path << ".tmp." << std::hex << rd() << rd();
  return oss.str();
}

bool commit_temp_file(const std::string &tmp, const std::string &path,
                      std::string &reason) {
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    reason = "rename failed: " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}

std::string TableCache::path_for(const std::string &kind) const {
  if (dir_.empty())
    return kind + ".bin";
  std::filesystem::path p(dir_);
  return (p / (kind + ".bin")).string();
}
