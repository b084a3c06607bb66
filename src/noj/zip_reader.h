#ifndef NOJ_ZIP_READER_H_
#define NOJ_ZIP_READER_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <string_view>

/// Minimal reader of the zip central directory

struct ZipEntry {
  std::string name;
  uint16_t method;
  uint64_t compressed_size;
  uint64_t uncompressed_size;
  uint64_t local_header_offset;
};

// std::nullopt if the data is not a well-formed zip archive
std::optional<std::vector<ZipEntry>> ReadZipDirectory(std::string_view data);

// At most max_len leading bytes of an entry; supports stored and deflated entries.
std::optional<std::string> ReadZipEntryPrefix(std::string_view data, const ZipEntry&, size_t max_len);

#endif  // NOJ_ZIP_READER_H_
