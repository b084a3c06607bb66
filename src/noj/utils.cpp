#include "utils.h"

#include <chrono>
#include <fstream>
#include <iterator>
#include <algorithm>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

int64_t UnixTimestamp() {
  auto dur = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(dur).count();
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG4(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, Status, ENUM_STATUS_)
#undef X

#define X(...) X_RETURN_ARG3(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToAbr, Status, ENUM_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageExtension, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(SubmissionKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmissionKindFlag, SubmissionKind, ENUM_SUBMISSION_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

Status AbrToStatus(const std::string& str) {
  if (str.empty()) return Status::UNRECOGNIZED;
#define X(name, code, abr, desc) if (str == abr) return Status::name;
  ENUM_STATUS_
#undef X
  return Status::UNRECOGNIZED;
}

bool ValidLanguage(int lang) {
  return lang >= (int)Language::C && lang <= (int)Language::HANDWRITTEN;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveFile(const fs::path& path) {
  spdlog::debug("Delete file {}", path.c_str());
  std::error_code ec;
  if (!fs::remove(path, ec)) {
    if (!ec) spdlog::warn("Failed deleting {}: no such file", path.c_str());
    else spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool Move(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Move file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    if (ec.value() != EXDEV) goto err;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) goto err;
    fs::remove(from, ec);
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed moving {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool ReadFile(const fs::path& path, std::string& out) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  out.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return !fin.bad();
}

bool WriteFile(const fs::path& path, std::string_view data) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) {
    spdlog::warn("Failed opening {} for writing", path.c_str());
    return false;
  }
  fout.write(data.data(), data.size());
  fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

namespace {

const char kBase64UrlTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

} // namespace

std::string Base64UrlEncode(std::string_view str) {
  std::string ret;
  ret.reserve((str.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= str.size(); i += 3) {
    unsigned char v[3] = {
      static_cast<unsigned char>(str[i]),
      static_cast<unsigned char>(str[i+1]),
      static_cast<unsigned char>(str[i+2])
    };
    ret += kBase64UrlTable[v[0] >> 2];
    ret += kBase64UrlTable[(v[0] & 0x03) << 4 | v[1] >> 4];
    ret += kBase64UrlTable[(v[1] & 0x0f) << 2 | v[2] >> 6];
    ret += kBase64UrlTable[v[2] & 0x3f];
  }
  if (i == str.size()) return ret;
  unsigned char v[2] = {static_cast<unsigned char>(str[i]), 0};
  if (i + 1 < str.size()) v[1] = str[i+1];
  ret += kBase64UrlTable[v[0] >> 2];
  ret += kBase64UrlTable[(v[0] & 0x03) << 4 | v[1] >> 4];
  if (i + 1 < str.size()) ret += kBase64UrlTable[(v[1] & 0x0f) << 2];
  return ret;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < a.size(); i++) diff |= a[i] ^ b[i];
  return diff == 0;
}

std::string Md5Hex(std::string_view data) {
  using boost::uuids::detail::md5;
  md5 hash;
  md5::digest_type digest;
  hash.process_bytes(data.data(), data.size());
  hash.get_digest(digest);
  std::string ret;
  for (auto word : digest) ret += fmt::format("{:08x}", word);
  return ret;
}

std::string RandomId() {
  static thread_local boost::uuids::random_generator gen;
  std::string ret = boost::uuids::to_string(gen());
  ret.erase(std::remove(ret.begin(), ret.end(), '-'), ret.end());
  return ret;
}

std::string RandomBytes() {
  static thread_local boost::uuids::random_generator gen;
  std::string ret;
  for (int i = 0; i < 2; i++) {
    boost::uuids::uuid id = gen();
    ret.append(reinterpret_cast<const char*>(id.data), id.size());
  }
  return ret;
}
