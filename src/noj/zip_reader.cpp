#include "zip_reader.h"

#include <zlib.h>
#include <spdlog/spdlog.h>

namespace {

constexpr uint32_t kEndOfDirSignature = 0x06054b50;
constexpr uint32_t kDirEntrySignature = 0x02014b50;
constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr size_t kEndOfDirSize = 22;
constexpr size_t kDirEntrySize = 46;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kMaxCommentSize = 65535;

constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;

inline uint16_t Read16(std::string_view data, size_t pos) {
  return static_cast<uint8_t>(data[pos]) | static_cast<uint8_t>(data[pos+1]) << 8;
}

inline uint32_t Read32(std::string_view data, size_t pos) {
  return Read16(data, pos) | static_cast<uint32_t>(Read16(data, pos + 2)) << 16;
}

std::optional<size_t> FindEndOfDir(std::string_view data) {
  if (data.size() < kEndOfDirSize) return std::nullopt;
  size_t lowest = data.size() > kEndOfDirSize + kMaxCommentSize ?
      data.size() - kEndOfDirSize - kMaxCommentSize : 0;
  for (size_t pos = data.size() - kEndOfDirSize + 1; pos-- > lowest;) {
    if (Read32(data, pos) != kEndOfDirSignature) continue;
    // the comment must extend exactly to the end of the archive
    if (pos + kEndOfDirSize + Read16(data, pos + 20) == data.size()) return pos;
  }
  return std::nullopt;
}

} // namespace

std::optional<std::vector<ZipEntry>> ReadZipDirectory(std::string_view data) {
  auto eocd = FindEndOfDir(data);
  if (!eocd) return std::nullopt;
  size_t count = Read16(data, *eocd + 10);
  size_t dir_size = Read32(data, *eocd + 12);
  size_t dir_offset = Read32(data, *eocd + 16);
  if (dir_offset + dir_size > *eocd) return std::nullopt;

  std::vector<ZipEntry> entries;
  size_t pos = dir_offset;
  for (size_t i = 0; i < count; i++) {
    if (pos + kDirEntrySize > *eocd || Read32(data, pos) != kDirEntrySignature) {
      return std::nullopt;
    }
    size_t name_len = Read16(data, pos + 28);
    size_t extra_len = Read16(data, pos + 30);
    size_t comment_len = Read16(data, pos + 32);
    if (pos + kDirEntrySize + name_len + extra_len + comment_len > *eocd) return std::nullopt;
    ZipEntry entry{
      .name = std::string(data.substr(pos + kDirEntrySize, name_len)),
      .method = Read16(data, pos + 10),
      .compressed_size = Read32(data, pos + 20),
      .uncompressed_size = Read32(data, pos + 24),
      .local_header_offset = Read32(data, pos + 42),
    };
    if (entry.local_header_offset + kLocalHeaderSize > dir_offset) return std::nullopt;
    entries.push_back(std::move(entry));
    pos += kDirEntrySize + name_len + extra_len + comment_len;
  }
  return entries;
}

std::optional<std::string> ReadZipEntryPrefix(std::string_view data, const ZipEntry& entry,
                                              size_t max_len) {
  size_t pos = entry.local_header_offset;
  if (pos + kLocalHeaderSize > data.size() || Read32(data, pos) != kLocalHeaderSignature) {
    return std::nullopt;
  }
  size_t start = pos + kLocalHeaderSize + Read16(data, pos + 26) + Read16(data, pos + 28);
  if (start > data.size() || entry.compressed_size > data.size() - start) return std::nullopt;
  std::string_view body = data.substr(start, entry.compressed_size);

  if (entry.method == kMethodStored) {
    return std::string(body.substr(0, max_len));
  }
  if (entry.method != kMethodDeflated) {
    spdlog::debug("Unsupported zip compression method {}", entry.method);
    return std::nullopt;
  }
  std::string ret(max_len, '\0');
  z_stream strm{};
  // negative window bits: raw deflate stream without zlib header
  if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) return std::nullopt;
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(body.data()));
  strm.avail_in = body.size();
  strm.next_out = reinterpret_cast<Bytef*>(ret.data());
  strm.avail_out = ret.size();
  int res = Z_OK;
  while (strm.avail_out > 0 && res == Z_OK) res = inflate(&strm, Z_NO_FLUSH);
  size_t produced = ret.size() - strm.avail_out;
  inflateEnd(&strm);
  if (res != Z_OK && res != Z_STREAM_END) return std::nullopt;
  ret.resize(produced);
  return ret;
}
