#include "noj/artifact_store.h"

#include <vector>

#include <zstd.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "noj/errors.h"
#include "utils.h"

fs::path ArtifactStore::Resolve_(const std::string& name) const {
  if (name.empty()) return {};
  fs::path rel = fs::path(name).lexically_normal();
  if (rel.is_absolute() || rel.empty()) return {};
  if (auto first = rel.begin(); first != rel.end() && *first == "..") return {};
  return root_ / rel;
}

bool ArtifactStore::Put(const std::string& name, std::string_view data) {
  fs::path path = Resolve_(name);
  if (path.empty()) {
    spdlog::warn("Refused to store object with invalid name {}", name);
    return false;
  }
  if (!CreateDirs(path.parent_path())) return false;
  fs::path tmp_path = path;
  tmp_path += ".tmp." + RandomId();
  if (!WriteFile(tmp_path, data)) {
    IGNORE_RETURN(RemoveAll(tmp_path));
    return false;
  }
  if (!Move(tmp_path, path)) {
    IGNORE_RETURN(RemoveAll(tmp_path));
    return false;
  }
  spdlog::debug("Stored object {} ({} bytes)", name, data.size());
  return true;
}

std::optional<std::string> ArtifactStore::Get(const std::string& name) const {
  fs::path path = Resolve_(name);
  if (path.empty()) return std::nullopt;
  std::string data;
  if (!ReadFile(path, data)) return std::nullopt;
  return data;
}

bool ArtifactStore::Exists(const std::string& name) const {
  fs::path path = Resolve_(name);
  std::error_code ec;
  return !path.empty() && fs::is_regular_file(path, ec);
}

bool ArtifactStore::Remove(const std::string& name) {
  fs::path path = Resolve_(name);
  if (path.empty()) {
    spdlog::warn("Refused to remove object with invalid name {}", name);
    return false;
  }
  return RemoveFile(path);
}

std::string ZstdCompress(std::string_view data) {
  std::string ret(ZSTD_compressBound(data.size()), '\0');
  size_t size = ZSTD_compress(ret.data(), ret.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(size)) throw std::runtime_error(ZSTD_getErrorName(size));
  ret.resize(size);
  return ret;
}

std::optional<std::string> ZstdDecompress(std::string_view data) {
  if (data.empty()) return std::nullopt;
  std::vector<char> buf_out(ZSTD_DStreamOutSize());
  ZSTD_DCtx* const dctx = ZSTD_createDCtx();
  if (!dctx) return std::nullopt;
  std::string ret;
  ZSTD_inBuffer input = {data.data(), data.size(), 0};
  size_t last = 0;
  while (input.pos < input.size) {
    ZSTD_outBuffer output = {buf_out.data(), buf_out.size(), 0};
    last = ZSTD_decompressStream(dctx, &output, &input);
    if (ZSTD_isError(last)) break;
    ret.append(buf_out.data(), output.pos);
  }
  // flush whatever is still buffered inside the context
  while (!ZSTD_isError(last) && last != 0) {
    ZSTD_outBuffer output = {buf_out.data(), buf_out.size(), 0};
    last = ZSTD_decompressStream(dctx, &output, &input);
    if (ZSTD_isError(last) || output.pos == 0) break;
    ret.append(buf_out.data(), output.pos);
  }
  ZSTD_freeDCtx(dctx);
  // a nonzero hint means the frame is truncated
  if (ZSTD_isError(last) || last != 0) return std::nullopt;
  return ret;
}

std::string PackCaseOutput(const CaseOutput& output) {
  nlohmann::json doc{{"stdout", output.stdout_text}, {"stderr", output.stderr_text}};
  return ZstdCompress(doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

CaseOutput UnpackCaseOutput(std::string_view data) {
  auto raw = ZstdDecompress(data);
  if (!raw) throw ArtifactCorruptError("output archive is not a valid zstd frame");
  try {
    auto doc = nlohmann::json::parse(*raw);
    return CaseOutput{
      .stdout_text = doc.at("stdout").get<std::string>(),
      .stderr_text = doc.at("stderr").get<std::string>(),
    };
  } catch (nlohmann::json::exception& err) {
    throw ArtifactCorruptError(fmt::format("invalid output archive: {}", err.what()));
  }
}

CaseOutput ReadCaseOutput(const ArtifactStore& store, const Submission& sub,
                          size_t task, size_t test_case) {
  if (task >= sub.tasks.size()) throw NotFoundError("task not found");
  auto& cases = sub.tasks[task].cases;
  if (test_case >= cases.size()) throw NotFoundError("case not found");
  auto& path = cases[test_case].output_path;
  auto data = store.Get(path);
  if (!data) throw NotFoundError("output not found");
  return UnpackCaseOutput(*data);
}

namespace {

// one fold step of the bundle; nullopt for an unreadable case
std::optional<CaseOutput> TryReadCase(const ArtifactStore& store, const Submission& sub,
                                      size_t task, size_t test_case) {
  try {
    return ReadCaseOutput(store, sub, task, test_case);
  } catch (NotFoundError& err) {
    spdlog::warn("Skip case {}/{} of submission {}: {}", task, test_case, sub.id, err.what());
  } catch (ArtifactCorruptError& err) {
    spdlog::warn("Skip case {}/{} of submission {}: {}", task, test_case, sub.id, err.what());
  }
  return std::nullopt;
}

} // namespace

std::string BuildTaskArtifactBundle(const ArtifactStore& store, const Submission& sub, size_t task) {
  if (task >= sub.tasks.size()) throw NotFoundError("task not found");
  nlohmann::json bundle = nlohmann::json::object();
  size_t written = 0;
  for (size_t i = 0; i < sub.tasks[task].cases.size(); i++) {
    auto output = TryReadCase(store, sub, task, i);
    if (!output) continue;
    std::string prefix = fmt::format("task_{:02d}/case_{:02d}/", task, i);
    bundle[prefix + "stdout"] = std::move(output->stdout_text);
    bundle[prefix + "stderr"] = std::move(output->stderr_text);
    written++;
  }
  if (!written) throw NotFoundError("artifact not available");
  return ZstdCompress(bundle.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

nlohmann::json ReadTaskArtifactBundle(std::string_view data) {
  auto raw = ZstdDecompress(data);
  if (!raw) throw ArtifactCorruptError("bundle is not a valid zstd frame");
  try {
    return nlohmann::json::parse(*raw);
  } catch (nlohmann::json::exception& err) {
    throw ArtifactCorruptError(fmt::format("invalid bundle: {}", err.what()));
  }
}
