#ifndef NOJ_UTILS_H_
#define NOJ_UTILS_H_

#include <string>
#include <string_view>
#include <filesystem>

#include "noj/utils.h"

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool RemoveFile(const fs::path&);
// allow cross-device move
bool Move(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);

bool ReadFile(const fs::path&, std::string& out);
bool WriteFile(const fs::path&, std::string_view data);

// URL-safe base64 without padding
std::string Base64UrlEncode(std::string_view);
// compare without early exit so that the time taken does not leak the prefix length
bool ConstantTimeEquals(std::string_view, std::string_view);
std::string Md5Hex(std::string_view);
// hex string of a fresh random UUID
std::string RandomId();
// 32 random bytes from the system entropy source
std::string RandomBytes();

#endif  // NOJ_UTILS_H_
